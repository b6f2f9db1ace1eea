#include "error/Error.hpp"

#include <fmt/format.h>

namespace aax::error {

Error::Error(const Code code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

Error Error::insufficientStorage(const double requiredMB, const double availableMB) {
    Error e(Code::InsufficientStorage,
            fmt::format("Insufficient storage space. Required: {:.1f}MB, Available: {:.1f}MB", requiredMB, availableMB));
    e.requiredMB_ = requiredMB;
    e.availableMB_ = availableMB;
    return e;
}

Error Error::fileMoveFailed(const std::string& reason) {
    return {Code::FileMoveFailed, "Failed to move downloaded file: " + reason};
}

Error Error::alreadyInProgress(const std::string& what) {
    return {Code::AlreadyInProgress, what + " is already in progress"};
}

Error Error::cancelled(const std::string& what) {
    return {Code::Cancelled, what + " was cancelled"};
}

Error Error::unknown(const std::string& message) {
    return {Code::UnknownError, message};
}

Error Error::uploadFailed(const std::string& message) {
    return {Code::UploadFailed, "Upload failed: " + message};
}

Error Error::invalidEncryptionMaterial(const std::string& message) {
    return {Code::InvalidEncryptionMaterial, "Invalid AAX decryption information: " + message};
}

Error Error::conversionFailed(const std::string& message) {
    return {Code::ConversionFailed, "Conversion failed: " + message};
}

Error Error::corruptedAfterReconversion() {
    return {Code::CorruptedOutputAfterReconversion, "Reconversion also produced corrupted file"};
}

Error Error::noUserSignedIn() {
    return {Code::NoUserSignedIn, "No user signed in"};
}

Error Error::triggerFailed(const std::string& message) {
    return {Code::TriggerFailed, "Remote call failed: " + message};
}

Category Error::category() const noexcept {
    switch (code_) {
        case Code::InsufficientStorage:
        case Code::FileMoveFailed:
            return Category::Storage;
        case Code::AlreadyInProgress:
        case Code::Cancelled:
        case Code::UnknownError:
        case Code::UploadFailed:
            return Category::Transfer;
        case Code::InvalidEncryptionMaterial:
        case Code::ConversionFailed:
        case Code::CorruptedOutputAfterReconversion:
            return Category::Codec;
        case Code::NoUserSignedIn:
            return Category::Auth;
        case Code::TriggerFailed:
            return Category::Trigger;
    }
    return Category::Transfer;
}

bool Error::retryable() const noexcept {
    if (category() == Category::Storage) return false;
    switch (code_) {
        case Code::InvalidEncryptionMaterial:
        case Code::CorruptedOutputAfterReconversion:
        case Code::NoUserSignedIn:
        case Code::Cancelled:
            return false;
        default:
            return true;
    }
}

std::string to_string(const Code code) {
    switch (code) {
        case Code::InsufficientStorage: return "InsufficientStorage";
        case Code::FileMoveFailed: return "FileMoveFailed";
        case Code::AlreadyInProgress: return "AlreadyInProgress";
        case Code::Cancelled: return "Cancelled";
        case Code::UnknownError: return "UnknownError";
        case Code::UploadFailed: return "UploadFailed";
        case Code::InvalidEncryptionMaterial: return "InvalidEncryptionMaterial";
        case Code::ConversionFailed: return "ConversionFailed";
        case Code::CorruptedOutputAfterReconversion: return "CorruptedOutputAfterReconversion";
        case Code::NoUserSignedIn: return "NoUserSignedIn";
        case Code::TriggerFailed: return "TriggerFailed";
    }
    return "UnknownError";
}

std::string to_string(const Category category) {
    switch (category) {
        case Category::Storage: return "storage";
        case Category::Transfer: return "transfer";
        case Category::Codec: return "codec";
        case Category::Auth: return "auth";
        case Category::Trigger: return "trigger";
    }
    return "transfer";
}

}
