#include "config/Config.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace aax::config;
using namespace aax::test;

class ConfigTest : public ::testing::Test {
protected:
    TempDir tmp;

    std::string write(const std::string& yaml) const {
        const auto path = tmp.path() / "config.yaml";
        std::ofstream(path) << yaml;
        return path.string();
    }
};

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    const auto cfg = loadConfig(write("{}\n"));

    EXPECT_EQ(cfg.retry.max_attempts, 3u);
    EXPECT_EQ(cfg.retry.delay, std::chrono::milliseconds(3000));
    EXPECT_EQ(cfg.retry.strategy, BackoffStrategy::Fixed);
    EXPECT_EQ(cfg.storage.download_margin_mb, 100u);
    EXPECT_EQ(cfg.storage.fallback_required_mb, 300u);
    EXPECT_EQ(cfg.storage.move_reserve_mb, 50u);
    EXPECT_DOUBLE_EQ(cfg.validation.size_tolerance, 0.05);
    EXPECT_EQ(cfg.object_storage.upload_prefix, "UserData/{user}/Uploads/Raw");
    EXPECT_EQ(cfg.object_storage.upload_extension, ".m4b");
    EXPECT_EQ(cfg.backend.process_function, "v1processPrivateM4B");
    EXPECT_EQ(cfg.backend.metadata_function, "v1updateAAXMetadata");
}

TEST_F(ConfigTest, ReadsSections) {
    const auto cfg = loadConfig(write(R"(
storage:
  data_dir: /srv/books
  transient_dir: /tmp/books
retry:
  max_attempts: 5
  delay_ms: 250
  strategy: exponential
  max_delay_ms: 4000
  jitter: true
transfer:
  workers: 6
object_storage:
  bucket: library
  secret_access_key: hunter2
auth:
  user_id: user-9
  id_token: abc.def.ghi
logging:
  file_sink: false
  log_levels:
    subsystem_levels:
      pipeline: debug
)"));

    EXPECT_EQ(cfg.storage.data_dir, "/srv/books");
    EXPECT_EQ(cfg.storage.transient_dir, "/tmp/books");
    EXPECT_EQ(cfg.retry.max_attempts, 5u);
    EXPECT_EQ(cfg.retry.delay, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.retry.strategy, BackoffStrategy::Exponential);
    EXPECT_EQ(cfg.retry.max_delay, std::chrono::milliseconds(4000));
    EXPECT_TRUE(cfg.retry.jitter);
    EXPECT_EQ(cfg.transfer.workers, 6u);
    EXPECT_EQ(cfg.object_storage.bucket, "library");
    EXPECT_EQ(cfg.object_storage.secret_access_key, "hunter2");
    EXPECT_EQ(cfg.auth.user_id, "user-9");
    EXPECT_FALSE(cfg.logging.file_sink);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.pipeline, spdlog::level::debug);
}

TEST_F(ConfigTest, RejectsUnknownStrategy) {
    EXPECT_THROW(loadConfig(write("retry:\n  strategy: linear\n")), std::runtime_error);
}

TEST_F(ConfigTest, RejectsToleranceOutOfRange) {
    EXPECT_THROW(loadConfig(write("validation:\n  size_tolerance: 1.5\n")), std::runtime_error);
}

TEST_F(ConfigTest, JsonDumpOmitsSecrets) {
    Config cfg;
    cfg.object_storage.secret_access_key = "hunter2";
    cfg.auth.id_token = "abc.def.ghi";
    cfg.auth.user_id = "user-9";

    const nlohmann::json j = cfg;
    const auto dumped = j.dump();

    EXPECT_EQ(dumped.find("hunter2"), std::string::npos);
    EXPECT_EQ(dumped.find("abc.def.ghi"), std::string::npos);
    EXPECT_EQ(j["auth"]["user_id"].get<std::string>(), "user-9");
    EXPECT_TRUE(j["auth"]["signed_in"].get<bool>());
    EXPECT_EQ(j["retry"]["strategy"].get<std::string>(), "fixed");
}
