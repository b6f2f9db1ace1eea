#include "codec/FfmpegConverter.hpp"
#include "error/Error.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace aax::codec;
using namespace aax::error;
using namespace aax::log;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

// ffmpeg picks the muxer from the extension, so the partial keeps it.
fs::path partialPathFor(const fs::path& out) {
    return out.parent_path() / (out.stem().string() + ".partial" + out.extension().string());
}

std::string tail(const std::string& s, const size_t n = 512) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

}

FfmpegConverter::FfmpegConverter(config::CodecConfig cfg) : cfg_(std::move(cfg)) {}

FfmpegConverter::ProcessResult FfmpegConverter::run(const std::vector<std::string>& args) {
    int outPipe[2], errPipe[2];
    if (pipe(outPipe) == -1) throw std::runtime_error("Failed to create stdout pipe for " + args.front());
    if (pipe(errPipe) == -1) {
        close(outPipe[0]);
        close(outPipe[1]);
        throw std::runtime_error("Failed to create stderr pipe for " + args.front());
    }

    const auto self = std::make_shared<Invocation>();
    const auto unregister = [this, &self] {
        std::scoped_lock lock(mutex_);
        running_.remove(self);
    };
    {
        std::scoped_lock lock(mutex_);
        running_.push_back(self);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        for (const int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) close(fd);
        unregister();
        throw std::runtime_error("Failed to fork " + args.front());
    }

    if (pid == 0) {
        const int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        for (const int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) close(fd);

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());
        _exit(127); // exec failed
    }

    {
        std::scoped_lock lock(mutex_);
        self->pid = pid;
        // cancel() ran between registration and fork
        if (self->cancelled) kill(pid, SIGTERM);
    }
    close(outPipe[1]);
    close(errPipe[1]);

    ProcessResult result;
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    int remaining = 2;
    char buf[4096];

    while (remaining > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) sinks[i]->append(buf, static_cast<size_t>(n));
            else {
                close(fds[i].fd);
                fds[i].fd = -1;
                --remaining;
            }
        }
    }

    for (const auto& f : fds) if (f.fd >= 0) close(f.fd);

    // Unregister while the exited child is still a zombie so cancel() can
    // never signal a recycled pid.
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) < 0 && errno == EINTR) {}
    {
        std::scoped_lock lock(mutex_);
        result.cancelled = self->cancelled;
        running_.remove(self);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    result.status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

fs::path FfmpegConverter::convert(const EncryptionMaterial& material,
                                  const fs::path& inputPath,
                                  const fs::path& outputPath) {
    if (!fs::is_regular_file(inputPath)) throw Error::conversionFailed("input " + inputPath.string() + " does not exist");

    fs::create_directories(outputPath.parent_path());
    const auto partial = partialPathFor(outputPath);

    Registry::codec()->info("[FfmpegConverter] Converting {} -> {}", inputPath.string(), outputPath.string());

    const auto res = run({
        cfg_.ffmpeg_path, "-nostdin", "-hide_banner", "-loglevel", "error", "-y",
        "-audible_key", material.keyHex(),
        "-audible_iv", material.ivHex(),
        "-i", inputPath.string(),
        "-map_metadata", "0",
        "-c", "copy",
        partial.string()
    });

    std::error_code ec;
    if (res.status != 0 || res.cancelled) {
        fs::remove(partial, ec);
        if (res.cancelled) throw Error::conversionFailed("conversion was cancelled");
        if (res.status == 127) throw Error::conversionFailed("cannot execute " + cfg_.ffmpeg_path);
        throw Error::conversionFailed(fmt::format("ffmpeg exited with {}: {}", res.status, tail(res.err)));
    }

    fs::rename(partial, outputPath, ec);
    if (ec) {
        fs::remove(partial, ec);
        throw Error::conversionFailed("could not finalize " + outputPath.string());
    }

    Registry::codec()->info("[FfmpegConverter] Finished {}", outputPath.string());
    return outputPath;
}

void FfmpegConverter::cancel() {
    std::scoped_lock lock(mutex_);
    for (const auto& inv : running_) {
        inv->cancelled = true;
        if (inv->pid <= 0) continue;
        Registry::codec()->info("[FfmpegConverter] Terminating codec process {}", inv->pid);
        kill(inv->pid, SIGTERM);
    }
}

json FfmpegConverter::probeMetadata(const EncryptionMaterial& material, const fs::path& inputPath) {
    const auto res = run({
        cfg_.ffprobe_path, "-v", "error",
        "-audible_key", material.keyHex(),
        "-audible_iv", material.ivHex(),
        "-print_format", "json",
        "-show_format", "-show_chapters",
        inputPath.string()
    });

    if (res.status != 0)
        throw Error::conversionFailed(fmt::format("ffprobe exited with {}: {}", res.status, tail(res.err)));

    const auto probe = json::parse(res.out);

    json meta = json::object();
    if (probe.contains("format")) {
        const auto& format = probe["format"];
        if (format.contains("duration")) meta["duration"] = std::stod(format["duration"].get<std::string>());
        meta["tags"] = format.value("tags", json::object());
    }

    json chapters = json::array();
    for (const auto& ch : probe.value("chapters", json::array())) {
        chapters.push_back({
            {"startTime", std::stod(ch.value("start_time", std::string("0")))},
            {"endTime", std::stod(ch.value("end_time", std::string("0")))},
            {"title", ch.contains("tags") ? ch["tags"].value("title", std::string()) : std::string()}
        });
    }
    meta["chapters"] = std::move(chapters);

    return meta;
}
