#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace aax::error {

enum class Category : uint8_t { Storage, Transfer, Codec, Auth, Trigger };

enum class Code : uint8_t {
    // Storage
    InsufficientStorage,
    FileMoveFailed,
    // Transfer
    AlreadyInProgress,
    Cancelled,
    UnknownError,
    UploadFailed,
    // Codec
    InvalidEncryptionMaterial,
    ConversionFailed,
    CorruptedOutputAfterReconversion,
    // Auth
    NoUserSignedIn,
    // Trigger
    TriggerFailed
};

// Every failure the pipeline reports crosses component boundaries as one of these.
class Error : public std::runtime_error {
public:
    Error(Code code, const std::string& message);

    static Error insufficientStorage(double requiredMB, double availableMB);
    static Error fileMoveFailed(const std::string& reason);
    static Error alreadyInProgress(const std::string& what);
    static Error cancelled(const std::string& what);
    static Error unknown(const std::string& message);
    static Error uploadFailed(const std::string& message);
    static Error invalidEncryptionMaterial(const std::string& message);
    static Error conversionFailed(const std::string& message);
    static Error corruptedAfterReconversion();
    static Error noUserSignedIn();
    static Error triggerFailed(const std::string& message);

    [[nodiscard]] Code code() const noexcept { return code_; }
    [[nodiscard]] Category category() const noexcept;

    // Storage, key material, auth and corruption problems cannot be fixed by
    // running the same stage again; cancellation must never be retried.
    [[nodiscard]] bool retryable() const noexcept;

    [[nodiscard]] bool isCancelled() const noexcept { return code_ == Code::Cancelled; }

    // Only meaningful for InsufficientStorage.
    [[nodiscard]] double requiredMB() const noexcept { return requiredMB_; }
    [[nodiscard]] double availableMB() const noexcept { return availableMB_; }

private:
    Code code_;
    double requiredMB_ = 0.0;
    double availableMB_ = 0.0;
};

std::string to_string(Code code);
std::string to_string(Category category);

// Outcome of an asynchronous operation: a value, or the error that ended it.
template <typename T>
using Expected = std::variant<T, Error>;

template <typename T>
bool failed(const Expected<T>& e) { return std::holds_alternative<Error>(e); }

}
