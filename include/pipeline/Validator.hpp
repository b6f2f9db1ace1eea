#pragma once

#include "config/Config.hpp"

#include <filesystem>

namespace aax::pipeline {

// Remuxing keeps the audio stream as is, so a healthy conversion lands close
// to the size of the encrypted original.
class Validator {
public:
    explicit Validator(config::ValidationConfig cfg = {});

    // True when converted is within the tolerance of original. Otherwise the
    // converted file is deleted and false is returned. Missing files throw
    // error::Error{UploadFailed}.
    bool validateConvertedArtifact(const std::filesystem::path& original,
                                   const std::filesystem::path& converted) const;

private:
    config::ValidationConfig cfg_;
};

}
