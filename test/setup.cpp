#include <unistd.h>
#include <filesystem>

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <safeexec/logger.h>
#include "utils.h"

spdlog::level::level_enum log_level;
fs::path kTestRoot;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%P] %+");
    spdlog::set_level(log_level);
    InitLogger();
    fs::create_directories(kTestRoot);
  }
  void TearDown() override {
    fs::remove_all(kTestRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  kTestRoot = fs::temp_directory_path() / ("safeexec-test." + std::to_string(getpid()));
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
