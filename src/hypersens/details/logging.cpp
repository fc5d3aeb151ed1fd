#include "hypersens/details/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hypersens {
  static std::shared_ptr<spdlog::logger> makeDefaultLogger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("hypersens", sink);
    logger->set_level(spdlog::level::info);
    return logger;
  }

  std::shared_ptr<spdlog::logger> __logger__ = makeDefaultLogger();

  static void installLogger(spdlog::sink_ptr sink, int log_level) {
    auto logger = std::make_shared<spdlog::logger>("hypersens", sink);
    logger->set_level(static_cast<spdlog::level::level_enum>(log_level));
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    __logger__ = logger;
  }

  void initLogger(int log_level) {
    installLogger(
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>(), log_level);
  }

  void initLogger(std::string path, int log_level) {
    installLogger(
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, true),
      log_level);
  }
}  // namespace hypersens
