#pragma once

#include "codec/EncryptionMaterial.hpp"

#include <filesystem>
#include <nlohmann/json_fwd.hpp>

namespace aax::codec {

// Decrypts and remuxes an AAX payload. Blocking; runs on a pool worker, one
// conversion at a time.
class Converter {
public:
    virtual ~Converter() = default;

    // Returns outputPath once it holds the complete result. Throws
    // error::Error{ConversionFailed} for a bad key/iv or corrupt input.
    virtual std::filesystem::path convert(const EncryptionMaterial& material,
                                          const std::filesystem::path& inputPath,
                                          const std::filesystem::path& outputPath) = 0;

    // Best effort; an in-flight convert() returns early with ConversionFailed.
    virtual void cancel() = 0;

    // Container tags, duration and chapters of the encrypted input.
    virtual nlohmann::json probeMetadata(const EncryptionMaterial& material,
                                         const std::filesystem::path& inputPath) = 0;
};

}
