#include "devpulse/common/toml.hpp"

#include "devpulse/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace devpulse::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_basic = false;
  bool in_literal = false;
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '"' && !in_literal && (i == 0 || line[i - 1] != '\\')) {
      in_basic = !in_basic;
    } else if (ch == '\'' && !in_basic) {
      in_literal = !in_literal;
    }
    if (!in_basic && !in_literal && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::vector<std::string> split_array_elements(const std::string &body) {
  std::vector<std::string> result;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < body.size(); ++i) {
    const char ch = body[i];
    if (ch == '"' && (i == 0 || body[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }
  return result;
}

std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

bool parse_u64(const std::string &text, std::uint64_t &out) {
  std::string digits;
  digits.reserve(text.size());
  for (const char ch : text) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  if (digits.empty()) {
    return false;
  }
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  std::uint64_t parsed = 0;
  if (!parse_u64(trim(it->second), parsed)) {
    return fallback;
  }
  return parsed;
}

std::chrono::milliseconds TomlDocument::get_duration(const std::string &key,
                                                     std::chrono::milliseconds fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  auto parsed = parse_duration(unquote(it->second));
  if (!parsed.ok()) {
    return fallback;
  }
  return parsed.value();
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    // A bare string is accepted as a one-element array.
    const std::string single = unquote(raw);
    return single.empty() ? fallback : std::vector<std::string>{single};
  }

  std::vector<std::string> out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                                 std::to_string(line_number),
                                             ErrorKind::Validation);
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                               std::to_string(line_number),
                                           ErrorKind::Validation);
    }

    const std::string key = unquote(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number),
                                           ErrorKind::Validation);
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                               std::to_string(line_number),
                                           ErrorKind::Validation);
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

Result<std::chrono::milliseconds> parse_duration(const std::string &text) {
  const std::string value = to_lower(trim(text));
  std::size_t split = 0;
  while (split < value.size() &&
         (std::isdigit(static_cast<unsigned char>(value[split])) != 0 || value[split] == '_')) {
    ++split;
  }

  std::uint64_t amount = 0;
  if (!parse_u64(value.substr(0, split), amount)) {
    return Result<std::chrono::milliseconds>::failure("invalid duration: " + text,
                                                      ErrorKind::Validation);
  }

  const std::string unit = value.substr(split);
  std::uint64_t scale = 0;
  if (unit.empty() || unit == "ms") {
    scale = 1;
  } else if (unit == "s") {
    scale = 1000;
  } else if (unit == "m") {
    scale = 60ULL * 1000;
  } else if (unit == "h") {
    scale = 60ULL * 60 * 1000;
  } else {
    return Result<std::chrono::milliseconds>::failure("invalid duration unit: " + text,
                                                      ErrorKind::Validation);
  }
  return Result<std::chrono::milliseconds>::success(
      std::chrono::milliseconds(static_cast<std::int64_t>(amount * scale)));
}

} // namespace devpulse::common
