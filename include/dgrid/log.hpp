#pragma once
#include <cstdio>
#include <string_view>

namespace dgrid::log {

inline void info(std::string_view msg) {
  std::fprintf(stdout, "[INFO] %.*s\n", static_cast<int>(msg.size()), msg.data());
  std::fflush(stdout);
}

inline void warn(std::string_view msg) {
  std::fprintf(stderr, "[WARN] %.*s\n", static_cast<int>(msg.size()), msg.data());
}

inline void error(std::string_view msg) {
  std::fprintf(stderr, "[ERROR] %.*s\n", static_cast<int>(msg.size()), msg.data());
}

} // namespace dgrid::log
