#pragma once

#include <optional>
#include <string>

namespace aax::pipeline {

struct Item {
    std::string id;
    std::string title;
    bool isProtected = true;
    std::optional<double> remoteProgress;   // backend processing progress, if known

    [[nodiscard]] bool hasRemoteProgress() const { return remoteProgress.value_or(0.0) > 0.0; }
};

// Untyped payload handed out by a LicenseSource; validated before use.
struct DownloadLicense {
    std::string url;
    std::string keyHex;
    std::string ivHex;
};

}
