// Pipeline
#include "pipeline/Orchestrator.hpp"
#include "pipeline/ManifestSource.hpp"

// Transfers and storage
#include "transfer/Downloader.hpp"
#include "transfer/Uploader.hpp"
#include "transfer/CurlTransport.hpp"
#include "storage/DeviceProbe.hpp"
#include "storage/Layout.hpp"
#include "cloud/S3Controller.hpp"

// Codec and backend
#include "codec/FfmpegConverter.hpp"
#include "codec/MaterialStore.hpp"
#include "remote/FunctionsClient.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"
#include "util/s3Helpers.hpp"

// Libraries
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <sodium.h>
#include <unordered_map>

using namespace aax;
using namespace aax::config;
using namespace aax::pipeline;

namespace {

void printUsage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-c config.yaml] <manifest.json>\n"
              << "  -c, --config PATH   configuration file (default " << ConfigRegistry::DEFAULT_CONFIG_PATH << ")\n"
              << "  -h, --help          show this help\n";
}

}

int main(const int argc, char** argv) {
    std::string configPath = ConfigRegistry::DEFAULT_CONFIG_PATH;
    bool explicitConfig = false;
    std::string manifestPath;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            configPath = argv[++i];
            explicitConfig = true;
        } else if (manifestPath.empty()) manifestPath = arg;
        else {
            printUsage(argv[0]);
            return 2;
        }
    }

    if (manifestPath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        if (explicitConfig && !std::filesystem::exists(configPath))
            throw std::runtime_error("Config file not found: " + configPath);

        ConfigRegistry::init(std::filesystem::path(configPath));
        const auto& cfg = ConfigRegistry::get();
        log::Registry::init(cfg.logging);

        if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed");
        util::ensureCurlGlobalInit();

        log::Registry::aaxpipe()->info("[*] Initializing aaxpipe...");

        boost::asio::io_context ioc;
        concurrency::ThreadPool pool(cfg.transfer.workers);

        storage::Layout layout(cfg.storage);
        layout.ensureDirectories();

        transfer::Downloader downloader(ioc, pool,
                                        std::make_shared<transfer::CurlTransport>(cfg.transfer),
                                        std::make_shared<storage::DeviceProbe>(cfg.transfer),
                                        layout, cfg.storage, cfg.transfer);

        const auto objectStore = std::make_shared<cloud::S3Controller>(cfg.object_storage);
        transfer::Uploader uploader(ioc, pool, objectStore, cfg.transfer);

        const auto manifest = ManifestSource::load(manifestPath);

        Dependencies deps;
        deps.licenses = manifest;
        deps.resolver = manifest;
        deps.converter = std::make_shared<codec::FfmpegConverter>(cfg.codec);
        deps.materials = std::make_shared<codec::MaterialStore>(cfg.storage.data_dir / "materials.json");
        deps.objectStore = objectStore;
        deps.backend = std::make_shared<remote::FunctionsClient>(cfg.backend, cfg.auth);

        Orchestrator orchestrator(ioc, pool, downloader, uploader, std::move(deps), cfg);

        unsigned int failures = 0;
        bool interrupted = false;
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);

        orchestrator.onTaskFailed([&failures](const std::string& itemId, const error::Error& e) {
            ++failures;
            log::Registry::aaxpipe()->error("[!] {} failed: {}", itemId, e.what());
        });

        orchestrator.onActiveStateChanged([&](const bool active) {
            log::Registry::aaxpipe()->debug("[*] Pipeline {}", active ? "busy" : "idle");
            if (!active && orchestrator.idle()) signals.cancel();
        });

        std::unordered_map<std::string, int> lastLogged;
        orchestrator.subscribe([&lastLogged](const TaskSnapshot& snap) {
            const int decile = static_cast<int>(snap.overallProgress * 10);
            auto& last = lastLogged[snap.taskId];
            if (decile <= last && snap.stage != Stage::Completed) return;
            last = decile;
            log::Registry::aaxpipe()->info("[*] {} {} {:.0f}%", snap.itemId, to_string(snap.stage), snap.overallProgress * 100);
        });

        signals.async_wait([&](const boost::system::error_code& ec, const int signum) {
            if (ec) return;
            log::Registry::aaxpipe()->info("[!] Signal {} received. Shutting down gracefully...", signum);
            interrupted = true;
            orchestrator.cancelAllTasks();
            for (const auto& t : orchestrator.tasks()) orchestrator.cancelProcessing(t.taskId);
        });

        for (const auto& item : manifest->items()) orchestrator.startProcessing(item);

        if (orchestrator.idle()) signals.cancel();

        ioc.run();
        pool.stop();

        log::Registry::aaxpipe()->info("[✓] aaxpipe finished: {} item(s), {} failure(s){}",
                                       manifest->items().size(), failures, interrupted ? ", interrupted" : "");

        return failures > 0 || interrupted ? 1 : 0;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::aaxpipe()->error("[main] Fatal: {}", e.what());
        else std::cerr << "aaxpipe: " << e.what() << "\n";
        return 1;
    }
}
