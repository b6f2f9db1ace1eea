#pragma once

#include "pipeline/Item.hpp"
#include "pipeline/LicenseSource.hpp"
#include "pipeline/Retrier.hpp"
#include "pipeline/TaskState.hpp"
#include "pipeline/Validator.hpp"
#include "codec/EncryptionMaterial.hpp"
#include "config/Config.hpp"
#include "error/Error.hpp"

#include <boost/asio/io_context.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aax::concurrency { class ThreadPool; }
namespace aax::transfer { class Downloader; class Uploader; }
namespace aax::codec { class Converter; class MaterialStore; }
namespace aax::cloud { class ObjectStore; }
namespace aax::remote { class Backend; }
namespace aax::storage { class Layout; }

namespace aax::pipeline {

using TaskListener = std::function<void(const TaskSnapshot&)>;
using ActiveStateCallback = std::function<void(bool)>;
using TaskFailedCallback = std::function<void(const std::string& itemId, const error::Error&)>;

struct Dependencies {
    std::shared_ptr<LicenseSource> licenses;
    std::shared_ptr<ItemResolver> resolver;
    std::shared_ptr<codec::Converter> converter;
    std::shared_ptr<codec::MaterialStore> materials;
    std::shared_ptr<cloud::ObjectStore> objectStore;
    std::shared_ptr<remote::Backend> backend;
};

// Runs protected items through download, metadata, convert, validate+upload
// and the remote processing trigger, one item at a time, in arrival order.
//
// Each stage is retried on its own and skipped when its result is already on
// disk or on the backend, so an interrupted item resumes where it stopped.
// Everything here lives on the io_context thread; blocking work is handed to
// the pool and its results are posted back.
class Orchestrator {
public:
    Orchestrator(boost::asio::io_context& ioc,
                 concurrency::ThreadPool& pool,
                 transfer::Downloader& downloader,
                 transfer::Uploader& uploader,
                 Dependencies deps,
                 const config::Config& cfg);

    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void startProcessing(const Item& item);

    void cancelProcessing(const std::string& taskId);
    void cancelProcessingForItem(const std::string& itemId);

    // Sign-out teardown: drops the pending queue and cancels every transfer.
    void cancelAllTasks();

    [[nodiscard]] std::vector<TaskSnapshot> tasks() const;
    [[nodiscard]] std::vector<std::string> pendingItems() const;
    [[nodiscard]] std::optional<TaskSnapshot> findTask(const std::string& itemId) const;
    [[nodiscard]] bool idle() const { return !active_ && pending_.empty(); }

    void subscribe(TaskListener listener);
    void onActiveStateChanged(ActiveStateCallback cb) { activeStateCb_ = std::move(cb); }
    void onTaskFailed(TaskFailedCallback cb) { taskFailedCb_ = std::move(cb); }

    // UserData/{userId}/Uploads/Raw/{itemId}.m4b; throws NoUserSignedIn without a user.
    [[nodiscard]] std::string uploadPathFor(const std::string& itemId) const;

private:
    struct Run {
        Item item;
        std::shared_ptr<TaskState> task;
        std::shared_ptr<Retrier> retrier;
        std::optional<codec::EncryptionMaterial> material;
        bool reconverted = false;
        bool converting = false;
    };

    using RunPtr = std::shared_ptr<Run>;
    using MapError = std::function<error::Error(const std::exception&)>;

    boost::asio::io_context& ioc_;
    concurrency::ThreadPool& pool_;
    transfer::Downloader& downloader_;
    transfer::Uploader& uploader_;
    Dependencies deps_;

    config::RetryConfig retryCfg_;
    config::ObjectStorageConfig storeCfg_;
    config::BackendConfig backendCfg_;
    std::string userId_;
    Validator validator_;

    RunPtr active_;
    std::deque<std::string> pending_;
    bool lastActiveState_ = false;

    std::vector<TaskListener> listeners_;
    ActiveStateCallback activeStateCb_;
    TaskFailedCallback taskFailedCb_;

    [[nodiscard]] const storage::Layout& layout() const;
    [[nodiscard]] bool isCurrent(const RunPtr& run) const { return run && active_ == run; }

    void begin(const Item& item);
    void advance();
    void complete(const RunPtr& run);
    void fail(const RunPtr& run, const error::Error& err);
    void publish(const RunPtr& run);
    void updateActiveState();

    void runStage(const RunPtr& run, const std::string& label, Retrier::Attempt attempt, std::function<void()> next);

    template <typename T>
    void offload(const RunPtr& run, const std::string& label, std::function<T()> work,
                 std::function<void(error::Expected<T>)> then, MapError mapError = {});

    void decideNeedsUpload(const RunPtr& run);
    void stageDownload(const RunPtr& run);
    void stageMetadata(const RunPtr& run);
    void stageConvert(const RunPtr& run);
    void stageUpload(const RunPtr& run);
    void stageTrigger(const RunPtr& run);

    void attemptDownload(const RunPtr& run, Retrier::Done done);
    void convertOnce(const RunPtr& run, Retrier::Done done);
    void upload(const RunPtr& run, Retrier::Done done);
};

}
