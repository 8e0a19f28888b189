#pragma once
#include <stdint.h>
#include <stdlib.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace Stowage {

constexpr std::string_view VERSION = "0.1.0";
constexpr std::string_view DEFAULT_SECTION = "database";
constexpr size_t MiB = 1024 * 1024;

template<class... Ts> struct overload : Ts... { using Ts::operator()...; };
template<class... Ts> overload(Ts...) -> overload<Ts...>;

template <typename T> using OptRef = std::optional<std::reference_wrapper<const T>>;

template<typename T> static inline auto to_ascii_lowercase(T in) -> std::string {
  std::string out;
  out.reserve(in.size());
  std::transform(in.begin(), in.end(), std::back_inserter(out), [](unsigned char c){ return (char)std::tolower(c); });
  return out;
}

static inline auto join(const std::vector<std::string>& parts, std::string_view sep = ", ") -> std::string {
  std::string out;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

// Accepts dotted or ::-separated identifiers, e.g. shop.model.User or shop::model::User
static inline auto is_qualified_name(std::string_view name) noexcept -> bool {
  if (name.empty()) return false;
  bool segment_start = true;
  for (size_t i = 0; i < name.size(); i++) {
    const char c = name[i];
    if (c == '.' || c == ':') {
      if (segment_start) return false;
      if (c == ':') {
        if (i + 1 >= name.size() || name[i + 1] != ':') return false;
        i++;
      }
      segment_start = true;
    } else if (c == '_' || c == '$' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
      segment_start = false;
    } else if (c >= '0' && c <= '9') {
      if (segment_start) return false;
    } else {
      return false;
    }
  }
  return !segment_start;
}

struct Cancelable {
  virtual void cancel() noexcept {};
  virtual ~Cancelable() {}
};

}
