#pragma once

#include "codec/Converter.hpp"
#include "config/Config.hpp"

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace aax::codec {

class FfmpegConverter final : public Converter {
public:
    explicit FfmpegConverter(config::CodecConfig cfg);

    std::filesystem::path convert(const EncryptionMaterial& material,
                                  const std::filesystem::path& inputPath,
                                  const std::filesystem::path& outputPath) override;

    // Terminates every codec process started before the call and fails the
    // conversions waiting on them. Later conversions are unaffected.
    void cancel() override;

    nlohmann::json probeMetadata(const EncryptionMaterial& material,
                                 const std::filesystem::path& inputPath) override;

private:
    struct ProcessResult {
        int status = -1;
        bool cancelled = false;
        std::string out;
        std::string err;
    };

    // One per child process; cancel() only ever touches live entries.
    struct Invocation {
        pid_t pid = 0;
        bool cancelled = false;
    };

    config::CodecConfig cfg_;
    std::mutex mutex_;
    std::list<std::shared_ptr<Invocation>> running_;

    ProcessResult run(const std::vector<std::string>& args);
};

}
