#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace usbtrail::util {

// Minimal TOML subset: [section] and [dotted.section] headers, key = value
// pairs with strings, integers, booleans and (possibly multi-line) arrays of
// strings. Values are kept as raw text; typed getters convert on demand.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']' && sv.find('=') == std::string_view::npos) {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      // Arrays may span lines until the closing bracket
      if (!val.empty() && val.front() == '[') {
        while (!array_closed(val) && std::getline(in, line)) {
          auto more = trim(strip_comment(line));
          if (!more.empty()) { val += ' '; val += more; }
        }
      } else if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
        val = unescape(std::string_view(val).substr(1, val.size() - 2));
      }
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  bool save(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;
    bool first = true;
    for (const auto& [name, sec] : sections_) {
      if (!first) out << '\n';
      first = false;
      if (!name.empty()) out << '[' << name << "]\n";
      for (const auto& [k, v] : sec.entries) {
        if (needs_quoting(v))
          out << k << " = \"" << escape(v) << "\"\n";
        else
          out << k << " = " << v << '\n';
      }
    }
    return out.good();
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    try {
      size_t used = 0;
      int v = std::stoi(val, &used);
      return used == val.size() ? v : def;
    } catch (const std::logic_error&) { return def; }
  }

  // Non-negative 64-bit integer; underscores as digit separators are accepted.
  [[nodiscard]] std::optional<uint64_t> get_uint64(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    if (!s) return std::nullopt;
    auto val = s->get(key, "");
    std::string digits;
    for (char c : val) if (c != '_') digits.push_back(c);
    if (digits.empty()) return std::nullopt;
    for (char c : digits) if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    try { return static_cast<uint64_t>(std::stoull(digits)); } catch (const std::logic_error&) { return std::nullopt; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    // Case-insensitive true/false
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // Array of strings. A scalar string is returned as a one-element list.
  // Returns std::nullopt if the key is missing or the array is malformed.
  [[nodiscard]] std::optional<std::vector<std::string>> get_string_list(std::string_view section,
                                                                         std::string_view key) const {
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return std::nullopt;
    auto raw = s->get(key, "");
    if (raw.empty() || raw.front() != '[') return std::vector<std::string>{raw};
    return parse_string_array(raw);
  }

  void set(const std::string& section, const std::string& key, const std::string& value) {
    ensure_section(section).set(key, value);
  }

  void set(const std::string& section, const std::string& key, const char* value) {
    ensure_section(section).set(key, std::string(value));
  }

  void set(const std::string& section, const std::string& key, int value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set(const std::string& section, const std::string& key, uint64_t value) {
    ensure_section(section).set(key, std::to_string(value));
  }

  void set(const std::string& section, const std::string& key, bool value) {
    ensure_section(section).set(key, value ? "true" : "false");
  }

  void set(const std::string& section, const std::string& key, const std::vector<std::string>& values) {
    std::string raw = "[";
    for (size_t i = 0; i < values.size(); ++i) {
      if (i) raw += ", ";
      raw += '"';
      raw += escape(values[i]);
      raw += '"';
    }
    raw += ']';
    ensure_section(section).set(key, raw);
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  [[nodiscard]] bool has_section(std::string_view section) const { return find_section(section) != nullptr; }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Drop a trailing '# comment' that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool in_str = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      char c = sv[i];
      if (in_str && c == '\\') { ++i; continue; }
      if (c == '"') in_str = !in_str;
      else if (c == '#' && !in_str) return sv.substr(0, i);
    }
    return sv;
  }

  static bool array_closed(const std::string& raw) {
    bool in_str = false;
    int depth = 0;
    for (size_t i = 0; i < raw.size(); ++i) {
      char c = raw[i];
      if (in_str && c == '\\') { ++i; continue; }
      if (c == '"') in_str = !in_str;
      else if (!in_str && c == '[') ++depth;
      else if (!in_str && c == ']') { if (--depth == 0) return true; }
    }
    return false;
  }

  static std::optional<std::vector<std::string>> parse_string_array(std::string_view raw) {
    std::vector<std::string> out;
    raw = trim(raw);
    if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') return std::nullopt;
    raw = raw.substr(1, raw.size() - 2);
    size_t i = 0;
    while (i < raw.size()) {
      char c = raw[i];
      if (std::isspace(static_cast<unsigned char>(c)) || c == ',') { ++i; continue; }
      if (c != '"') return std::nullopt; // only string elements are supported
      size_t j = i + 1;
      while (j < raw.size() && raw[j] != '"') { if (raw[j] == '\\') ++j; ++j; }
      if (j >= raw.size()) return std::nullopt;
      out.push_back(unescape(raw.substr(i + 1, j - i - 1)));
      i = j + 1;
    }
    return out;
  }

  static std::string unescape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size());
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '\\' && i + 1 < sv.size()) {
        char n = sv[++i];
        switch (n) {
          case 'n': out.push_back('\n'); break;
          case 't': out.push_back('\t'); break;
          default:  out.push_back(n); break;
        }
        continue;
      }
      out.push_back(sv[i]);
    }
    return out;
  }

  static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
      if (c == '"' || c == '\\') out.push_back('\\');
      out.push_back(c);
    }
    return out;
  }

  static bool needs_quoting(const std::string& val) {
    if (val.empty()) return true;
    if (val == "true" || val == "false") return false;
    if (val.front() == '[') return false; // arrays are stored pre-rendered
    // Check if it's a pure integer
    size_t start = (val[0] == '-') ? 1 : 0;
    bool all_digits = (start < val.size());
    for (size_t i = start; i < val.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(val[i]))) { all_digits = false; break; }
    }
    if (all_digits) return false;
    // Everything else is a string that needs quoting
    return true;
  }
};

} // namespace usbtrail::util
