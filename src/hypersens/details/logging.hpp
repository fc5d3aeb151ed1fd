#pragma once

#include <string>
#include <memory>

namespace spdlog {
  class logger;
}

namespace hypersens {
  void initLogger(int log_level = 1);
  void initLogger(std::string path, int log_level = 1);

  extern std::shared_ptr<spdlog::logger> __logger__;
}  // namespace hypersens
