#include "pipeline/Orchestrator.hpp"
#include "transfer/Downloader.hpp"
#include "transfer/Uploader.hpp"
#include "codec/Converter.hpp"
#include "codec/MaterialStore.hpp"
#include "cloud/ObjectStore.hpp"
#include "remote/Backend.hpp"
#include "storage/Layout.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <variant>

using namespace aax::pipeline;
using namespace aax::error;
using namespace aax::log;
using namespace aax::concurrency;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string newTaskId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string replaceAll(std::string s, const std::string& from, const std::string& to) {
    for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size()))
        s.replace(pos, from.size(), to);
    return s;
}

}

Orchestrator::Orchestrator(boost::asio::io_context& ioc,
                           ThreadPool& pool,
                           transfer::Downloader& downloader,
                           transfer::Uploader& uploader,
                           Dependencies deps,
                           const config::Config& cfg)
    : ioc_(ioc), pool_(pool), downloader_(downloader), uploader_(uploader), deps_(std::move(deps)),
      retryCfg_(cfg.retry), storeCfg_(cfg.object_storage), backendCfg_(cfg.backend),
      userId_(cfg.auth.user_id), validator_(cfg.validation) {
    if (!deps_.licenses || !deps_.converter || !deps_.materials || !deps_.objectStore || !deps_.backend)
        throw std::invalid_argument("Orchestrator is missing a dependency");
}

Orchestrator::~Orchestrator() {
    if (active_ && active_->retrier) active_->retrier->cancel();
}

const aax::storage::Layout& Orchestrator::layout() const {
    return downloader_.layout();
}

std::string Orchestrator::uploadPathFor(const std::string& itemId) const {
    if (userId_.empty()) throw Error::noUserSignedIn();
    return replaceAll(storeCfg_.upload_prefix, "{user}", userId_) + "/" + itemId + storeCfg_.upload_extension;
}

// ---- public surface ----

void Orchestrator::startProcessing(const Item& item) {
    if (!item.isProtected) {
        Registry::pipeline()->debug("[Orchestrator] Ignoring unprotected item {}", item.id);
        return;
    }

    if ((active_ && active_->item.id == item.id) || std::ranges::find(pending_, item.id) != pending_.end()) {
        Registry::pipeline()->debug("[Orchestrator] {} is already queued or running", item.id);
        return;
    }

    if (active_) {
        pending_.push_back(item.id);
        Registry::pipeline()->info("[Orchestrator] Queued {} ({} pending)", item.id, pending_.size());
        return;
    }

    begin(item);
}

void Orchestrator::cancelProcessing(const std::string& taskId) {
    if (!active_ || active_->task->id() != taskId) {
        Registry::pipeline()->debug("[Orchestrator] No running task {}", taskId);
        return;
    }

    const auto run = active_;
    active_.reset();

    if (run->retrier) run->retrier->cancel();
    downloader_.cancelDownload(run->item.id);
    uploader_.cancelUpload(run->item.id);
    if (run->converting) deps_.converter->cancel();

    Registry::pipeline()->info("[Orchestrator] Cancelled task {} for {}", taskId, run->item.id);

    advance();
    updateActiveState();
}

void Orchestrator::cancelProcessingForItem(const std::string& itemId) {
    if (active_ && active_->item.id == itemId) {
        cancelProcessing(active_->task->id());
        return;
    }

    if (std::erase(pending_, itemId) > 0)
        Registry::pipeline()->info("[Orchestrator] Removed {} from the pending queue", itemId);
}

void Orchestrator::cancelAllTasks() {
    Registry::pipeline()->info("[Orchestrator] Cancelling {} pending item(s)", pending_.size());
    pending_.clear();
    downloader_.cancelAllDownloads();
    uploader_.cancelAllUploads();
}

std::vector<TaskSnapshot> Orchestrator::tasks() const {
    if (!active_) return {};
    return {active_->task->snapshot()};
}

std::vector<std::string> Orchestrator::pendingItems() const {
    return {pending_.begin(), pending_.end()};
}

std::optional<TaskSnapshot> Orchestrator::findTask(const std::string& itemId) const {
    if (active_ && active_->item.id == itemId) return active_->task->snapshot();
    return std::nullopt;
}

void Orchestrator::subscribe(TaskListener listener) {
    listeners_.push_back(std::move(listener));
}

// ---- slot and queue ----

void Orchestrator::begin(const Item& item) {
    auto run = std::make_shared<Run>();
    run->item = item;
    run->task = std::make_shared<TaskState>(newTaskId(), item.id);
    active_ = run;

    Registry::pipeline()->info("[Orchestrator] Starting task {} for {} ({})", run->task->id(), item.id, item.title);

    updateActiveState();
    publish(run);

    boost::asio::post(ioc_, [this, run, guard = boost::asio::make_work_guard(ioc_)] {
        if (isCurrent(run)) decideNeedsUpload(run);
    });
}

void Orchestrator::advance() {
    while (!active_ && !pending_.empty()) {
        const auto itemId = pending_.front();
        pending_.pop_front();

        const auto item = deps_.resolver ? deps_.resolver->resolve(itemId) : std::nullopt;
        if (!item) {
            Registry::pipeline()->warn("[Orchestrator] Pending item {} no longer resolves, skipping", itemId);
            continue;
        }
        if (!item->isProtected) continue;

        begin(*item);
    }
}

void Orchestrator::complete(const RunPtr& run) {
    if (!isCurrent(run)) return;

    run->task->setCompleted();
    publish(run);

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        *run->task->completedAt() - run->task->startedAt());
    Registry::pipeline()->info("[Orchestrator] Completed {} in {}s", run->item.id, elapsed.count());

    active_.reset();
    advance();
    updateActiveState();
}

void Orchestrator::fail(const RunPtr& run, const Error& err) {
    if (!isCurrent(run)) return;

    active_.reset();
    if (run->retrier) run->retrier->cancel();

    if (err.isCancelled()) Registry::pipeline()->info("[Orchestrator] {} stopped: {}", run->item.id, err.what());
    else {
        Registry::pipeline()->error("[Orchestrator] Processing failed for {} [{}]: {}",
                                    run->item.id, to_string(err.code()), err.what());
        if (taskFailedCb_) taskFailedCb_(run->item.id, err);
    }

    advance();
    updateActiveState();
}

void Orchestrator::publish(const RunPtr& run) {
    const auto snap = run->task->snapshot();
    for (const auto& l : listeners_) l(snap);
}

void Orchestrator::updateActiveState() {
    const bool occupied = active_ != nullptr;
    if (occupied == lastActiveState_) return;
    lastActiveState_ = occupied;
    if (activeStateCb_) activeStateCb_(occupied);
}

// ---- plumbing ----

void Orchestrator::runStage(const RunPtr& run, const std::string& label, Retrier::Attempt attempt,
                            std::function<void()> next) {
    run->retrier = Retrier::create(ioc_, retryCfg_, label + ":" + run->item.id);
    run->retrier->run(std::move(attempt), [this, run, next = std::move(next)](Retrier::Outcome outcome) {
        if (!isCurrent(run)) return;
        if (outcome) fail(run, *outcome);
        else next();
    });
}

template <typename T>
void Orchestrator::offload(const RunPtr& run, const std::string& label, std::function<T()> work,
                           std::function<void(Expected<T>)> then, MapError mapError) {
    auto task = [this, run, work = std::move(work), then = std::move(then), mapError = std::move(mapError),
                 guard = boost::asio::make_work_guard(ioc_)]() mutable {
        auto result = [&]() -> Expected<T> {
            try {
                return work();
            } catch (const Error& e) {
                return e;
            } catch (const std::exception& e) {
                return mapError ? mapError(e) : Error::unknown(e.what());
            }
        }();

        boost::asio::post(ioc_, [this, run, then = std::move(then), result = std::move(result),
                                 guard = std::move(guard)]() mutable {
            if (!isCurrent(run)) return;
            then(std::move(result));
        });
    };

    pool_.submit(std::make_shared<FunctionTask>(label, std::move(task)));
}

// ---- stages ----

void Orchestrator::decideNeedsUpload(const RunPtr& run) {
    const auto& item = run->item;

    const auto decide = [this, run](const bool needsUpload) {
        run->task->setNeedsUpload(needsUpload);
        Registry::pipeline()->debug("[Orchestrator] {} needsUpload={}", run->item.id, needsUpload);
        stageDownload(run);
    };

    if (item.hasRemoteProgress()) {
        decide(false);
        return;
    }

    // Without a user the upload stage reports NoUserSignedIn itself
    if (userId_.empty()) {
        decide(true);
        return;
    }

    offload<bool>(run, "exists:" + item.id,
        [store = deps_.objectStore, path = uploadPathFor(item.id)] { return store->exists(path); },
        [run, decide](Expected<bool> r) {
            if (const auto* err = std::get_if<Error>(&r)) {
                Registry::pipeline()->warn("[Orchestrator] Could not check remote copy of {}: {}", run->item.id, err->what());
                decide(true);
                return;
            }
            decide(!std::get<bool>(r));
        });
}

void Orchestrator::stageDownload(const RunPtr& run) {
    const auto& id = run->item.id;

    if (layout().hasRaw(id)) {
        if (auto material = deps_.materials->get(id)) {
            Registry::pipeline()->info("[Orchestrator] {} already downloaded, skipping download", id);
            run->material = std::move(material);
            run->task->setDownloadCompleted();
            publish(run);
            stageConvert(run);
            return;
        }
        Registry::pipeline()->info("[Orchestrator] {} is on disk but its key material is missing, downloading again", id);
    }

    runStage(run, "download",
             [this, run](unsigned int, Retrier::Done done) { attemptDownload(run, std::move(done)); },
             [this, run] { stageMetadata(run); });
}

void Orchestrator::attemptDownload(const RunPtr& run, Retrier::Done done) {
    const auto& item = run->item;

    offload<DownloadLicense>(run, "license:" + item.id,
        [licenses = deps_.licenses, item] { return licenses->fetchLicense(item); },
        [this, run, done](Expected<DownloadLicense> r) {
            if (const auto* err = std::get_if<Error>(&r)) {
                done(*err);
                return;
            }

            const auto& license = std::get<DownloadLicense>(r);
            const auto& id = run->item.id;

            try {
                run->material = codec::EncryptionMaterial::parse(license.keyHex, license.ivHex);
            } catch (const codec::ParseError& e) {
                done(Error::invalidEncryptionMaterial(e.what()));
                return;
            }

            try {
                deps_.materials->put(id, *run->material);
            } catch (const std::exception& e) {
                done(Error::unknown(std::string("Could not persist key material: ") + e.what()));
                return;
            }

            run->task->setDownloadId(id);
            run->task->setDownloadProgress(0.0);
            publish(run);

            downloader_.downloadFile(id, license.url, id,
                [this, run, done](Expected<fs::path> result) {
                    if (!isCurrent(run)) return;
                    if (const auto* err = std::get_if<Error>(&result)) {
                        done(*err);
                        return;
                    }
                    run->task->setDownloadCompleted();
                    publish(run);
                    done(std::nullopt);
                },
                [this, run](const double p) {
                    if (!isCurrent(run)) return;
                    run->task->setDownloadProgress(p);
                    publish(run);
                });
        });
}

void Orchestrator::stageMetadata(const RunPtr& run) {
    runStage(run, "metadata",
        [this, run](unsigned int, Retrier::Done done) {
            if (!run->material) {
                done(Error::invalidEncryptionMaterial("no key material for " + run->item.id));
                return;
            }

            offload<std::monostate>(run, "metadata:" + run->item.id,
                [converter = deps_.converter, backend = deps_.backend, fn = backendCfg_.metadata_function,
                 material = *run->material, raw = layout().rawFile(run->item.id), id = run->item.id] {
                    auto metadata = converter->probeMetadata(material, raw);
                    backend->call(fn, {{"sku", id}, {"metadata", std::move(metadata)}});
                    return std::monostate{};
                },
                [done](Expected<std::monostate> r) {
                    if (const auto* err = std::get_if<Error>(&r)) done(*err);
                    else done(std::nullopt);
                });
        },
        [this, run] { stageConvert(run); });
}

void Orchestrator::stageConvert(const RunPtr& run) {
    if (layout().hasConverted(run->item.id)) {
        Registry::pipeline()->info("[Orchestrator] {} already converted, skipping conversion", run->item.id);
        stageUpload(run);
        return;
    }

    runStage(run, "convert",
             [this, run](unsigned int, Retrier::Done done) { convertOnce(run, std::move(done)); },
             [this, run] { stageUpload(run); });
}

void Orchestrator::convertOnce(const RunPtr& run, Retrier::Done done) {
    const auto& id = run->item.id;

    if (!run->material) run->material = deps_.materials->get(id);
    if (!run->material) {
        done(Error::invalidEncryptionMaterial("no stored key material for " + id));
        return;
    }

    run->task->setConverting();
    publish(run);
    run->converting = true;

    offload<fs::path>(run, "convert:" + id,
        [converter = deps_.converter, material = *run->material,
         raw = layout().rawFile(id), out = layout().convertedFile(id)] {
            return converter->convert(material, raw, out);
        },
        [run, done](Expected<fs::path> r) {
            run->converting = false;
            if (const auto* err = std::get_if<Error>(&r)) {
                done(*err);
                return;
            }
            Registry::pipeline()->info("[Orchestrator] Converted {} -> {}", run->item.id, std::get<fs::path>(r).string());
            done(std::nullopt);
        },
        [](const std::exception& e) { return Error::conversionFailed(e.what()); });
}

void Orchestrator::stageUpload(const RunPtr& run) {
    if (!run->task->needsUpload()) {
        Registry::pipeline()->info("[Orchestrator] {} does not need an upload, skipping", run->item.id);
        stageTrigger(run);
        return;
    }

    if (userId_.empty()) {
        fail(run, Error::noUserSignedIn());
        return;
    }

    const auto valid = std::make_shared<bool>(false);
    runStage(run, "validate",
        [this, run, valid](unsigned int, Retrier::Done done) {
            try {
                *valid = validator_.validateConvertedArtifact(layout().rawFile(run->item.id),
                                                              layout().convertedFile(run->item.id));
            } catch (const Error& e) {
                done(e);
                return;
            }
            done(std::nullopt);
        },
        [this, run, valid] {
            if (*valid) {
                runStage(run, "upload",
                         [this, run](unsigned int, Retrier::Done done) { upload(run, std::move(done)); },
                         [this, run] { stageTrigger(run); });
                return;
            }

            if (run->reconverted) {
                fail(run, Error::corruptedAfterReconversion());
                return;
            }

            // The validator already removed the bad output; the reconversion
            // retries on its own and comes back here for a second check.
            Registry::pipeline()->warn("[Orchestrator] Converted file for {} was corrupted, reconverting", run->item.id);
            run->reconverted = true;
            runStage(run, "reconvert",
                     [this, run](unsigned int, Retrier::Done done) { convertOnce(run, std::move(done)); },
                     [this, run] { stageUpload(run); });
        });
}

void Orchestrator::upload(const RunPtr& run, Retrier::Done done) {
    const auto& id = run->item.id;

    std::string destPath;
    try {
        destPath = uploadPathFor(id);
    } catch (const Error& e) {
        done(e);
        return;
    }

    Registry::pipeline()->info("[Orchestrator] Uploading {} to {}", id, destPath);

    run->task->setUploadProgress(0.0);
    publish(run);

    uploader_.uploadFile(id, layout().convertedFile(id), destPath,
        [this, run, done](Expected<std::string> result) {
            if (!isCurrent(run)) return;
            if (const auto* err = std::get_if<Error>(&result)) {
                done(*err);
                return;
            }
            run->task->setUploadCompleted();
            publish(run);
            done(std::nullopt);
        },
        [this, run](const double p) {
            if (!isCurrent(run)) return;
            run->task->setUploadProgress(p);
            publish(run);
        });
}

void Orchestrator::stageTrigger(const RunPtr& run) {
    if (run->item.hasRemoteProgress()) {
        Registry::pipeline()->info("[Orchestrator] {} already has remote progress, not requesting processing", run->item.id);
        complete(run);
        return;
    }

    runStage(run, "trigger",
        [this, run](unsigned int, Retrier::Done done) {
            offload<std::monostate>(run, "trigger:" + run->item.id,
                [backend = deps_.backend, fn = backendCfg_.process_function, id = run->item.id] {
                    backend->call(fn, {{"sku", id}});
                    return std::monostate{};
                },
                [id = run->item.id, done](Expected<std::monostate> r) {
                    if (const auto* err = std::get_if<Error>(&r)) {
                        done(*err);
                        return;
                    }
                    Registry::pipeline()->info("[Orchestrator] Requested processing for {}", id);
                    done(std::nullopt);
                },
                [](const std::exception& e) { return Error::triggerFailed(e.what()); });
        },
        [this, run] { complete(run); });
}
