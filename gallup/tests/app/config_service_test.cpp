#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "app/config_service.hpp"

namespace gallup {
class ConfigServiceTests : public ::testing::Test {
 protected:
  std::filesystem::path config_path_;

  void                  SetUp() override {
    config_path_ = std::filesystem::temp_directory_path() /
                   ("gallup_config_" +
                    std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                    ".json");
    std::filesystem::remove(config_path_);
  }

  void TearDown() override { std::filesystem::remove(config_path_); }

  void WriteFile(const std::string& content) { std::ofstream(config_path_) << content; }
};

TEST_F(ConfigServiceTests, DefaultsAreValid) {
  AppConfig config;
  EXPECT_NO_THROW(ValidateConfig(config));
  EXPECT_EQ(config.global_concurrency_limit_, 3u);
  EXPECT_EQ(config.per_host_concurrency_limit_, 2u);
  EXPECT_EQ(config.disk_warning_mb_, 2048u);
  EXPECT_EQ(config.disk_critical_mb_, 512u);
  EXPECT_EQ(config.disk_emergency_mb_, 100u);

  auto thresholds = config.ToThresholds();
  EXPECT_EQ(thresholds.warning_bytes_, 2048u * kMegabyte);
  EXPECT_EQ(thresholds.emergency_bytes_, 100u * kMegabyte);

  auto upload = config.ToUploadConfig();
  EXPECT_EQ(upload.max_retries_, config.max_retries_);
  EXPECT_EQ(upload.parallel_batch_size_, config.parallel_batch_size_);
}

TEST_F(ConfigServiceTests, ValidationRejectsUnusableValues) {
  AppConfig config;
  config.disk_critical_mb_ = config.disk_warning_mb_;
  EXPECT_THROW(ValidateConfig(config), std::invalid_argument);

  config                           = AppConfig{};
  config.global_concurrency_limit_ = 0;
  EXPECT_THROW(ValidateConfig(config), std::invalid_argument);

  config                             = AppConfig{};
  config.per_host_concurrency_limit_ = 0;
  EXPECT_THROW(ValidateConfig(config), std::invalid_argument);

  config               = AppConfig{};
  config.worker_count_ = 0;
  EXPECT_THROW(ValidateConfig(config), std::invalid_argument);

  config               = AppConfig{};
  config.default_host_ = "";
  EXPECT_THROW(ValidateConfig(config), std::invalid_argument);

  config            = AppConfig{};
  config.log_level_ = "chatty";
  EXPECT_THROW(ValidateConfig(config), std::invalid_argument);
}

TEST_F(ConfigServiceTests, SaveThenLoadRestoresConfig) {
  AppConfig config;
  config.global_concurrency_limit_ = 5;
  config.default_host_             = "pixhost";
  config.disk_warning_mb_          = 4096;
  config.log_level_                = "debug";

  ConfigService writer(config);
  writer.Save(config_path_);

  ConfigService reader;
  reader.Load(config_path_);
  EXPECT_EQ(reader.Snapshot(), config);
}

TEST_F(ConfigServiceTests, MissingKeysKeepDefaults) {
  WriteFile(R"({"worker_count": 4})");
  ConfigService service;
  service.Load(config_path_);

  auto config = service.Snapshot();
  EXPECT_EQ(config.worker_count_, 4u);
  EXPECT_EQ(config.global_concurrency_limit_, 3u);
  EXPECT_EQ(config.default_host_, "imx");
}

TEST_F(ConfigServiceTests, WrongTypeIsRejected) {
  nlohmann::json json = {{"global_concurrency_limit", "three"}};
  EXPECT_THROW(ConfigFromJson(json), std::invalid_argument);
  EXPECT_THROW(ConfigFromJson(nlohmann::json::array()), std::invalid_argument);
}

TEST_F(ConfigServiceTests, LoadReportsUnreadableFiles) {
  ConfigService service;
  EXPECT_THROW(service.Load(config_path_), std::runtime_error);

  WriteFile("{ not json");
  EXPECT_THROW(service.Load(config_path_), std::invalid_argument);
  EXPECT_EQ(service.Snapshot(), AppConfig{});
}

TEST_F(ConfigServiceTests, UpdateNotifiesSubscribersWithOldAndNew) {
  ConfigService service;
  int           calls = 0;
  AppConfig     seen_old;
  AppConfig     seen_new;
  service.Subscribe([&](const AppConfig& old_config, const AppConfig& new_config) {
    ++calls;
    seen_old = old_config;
    seen_new = new_config;
  });

  AppConfig next                  = service.Snapshot();
  next.per_host_concurrency_limit_ = 1;
  service.Update(next);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(seen_old.per_host_concurrency_limit_, 2u);
  EXPECT_EQ(seen_new.per_host_concurrency_limit_, 1u);

  // Same values again: nothing changed, nobody is told
  service.Update(next);
  EXPECT_EQ(calls, 1);
}

TEST_F(ConfigServiceTests, InvalidUpdateKeepsCurrentConfig) {
  ConfigService service;
  int           calls = 0;
  service.Subscribe([&calls](const AppConfig&, const AppConfig&) { ++calls; });

  AppConfig broken          = service.Snapshot();
  broken.disk_emergency_mb_ = 9000;
  EXPECT_THROW(service.Update(broken), std::invalid_argument);
  EXPECT_EQ(service.Snapshot(), AppConfig{});
  EXPECT_EQ(calls, 0);
}

TEST_F(ConfigServiceTests, ThrowingSubscriberDoesNotBlockOthers) {
  ConfigService service;
  int           calls = 0;
  service.Subscribe([](const AppConfig&, const AppConfig&) { throw std::runtime_error("boom"); });
  auto id = service.Subscribe([&calls](const AppConfig&, const AppConfig&) { ++calls; });

  AppConfig next    = service.Snapshot();
  next.max_retries_ = 9;
  EXPECT_NO_THROW(service.Update(next));
  EXPECT_EQ(calls, 1);

  service.Unsubscribe(id);
  next.max_retries_ = 10;
  service.Update(next);
  EXPECT_EQ(calls, 1);
}
}  // namespace gallup
