#pragma once

#include "devpulse/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace devpulse::common {

/// Flat view of a TOML file: every value is stored under its dotted "section.key" path.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  /// Accepts integers (milliseconds) or strings with an ms/s/m/h suffix such as "15s".
  [[nodiscard]] std::chrono::milliseconds get_duration(const std::string &key,
                                                       std::chrono::milliseconds fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);
[[nodiscard]] std::string toml_string_array(const std::vector<std::string> &values);

/// Parses "250ms", "15s", "2m", "1h" or a bare millisecond count.
[[nodiscard]] Result<std::chrono::milliseconds> parse_duration(const std::string &text);

} // namespace devpulse::common
