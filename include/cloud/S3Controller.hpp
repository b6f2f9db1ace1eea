#pragma once

#include "cloud/ObjectStore.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <map>

namespace aax::cloud {

class S3Controller final : public ObjectStore {
public:
    explicit S3Controller(config::ObjectStorageConfig cfg);

    std::string put(const std::string& key,
                    const std::filesystem::path& file,
                    const ProgressFn& onProgress,
                    const std::atomic<bool>& cancel) override;

    // HEAD on the key; 404 is false, other failures throw.
    [[nodiscard]] bool exists(const std::string& key) override;

private:
    config::ObjectStorageConfig cfg_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const std::filesystem::path& p) const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash) const;
};

}
