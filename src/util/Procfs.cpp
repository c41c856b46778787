#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>
#include <pwd.h>
#include <unistd.h>

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace usbtrail::util {

static std::string proc_root() {
  const char* env = std::getenv("USBTRAIL_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string sys_root() {
  const char* env = std::getenv("USBTRAIL_SYS_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string map_under(const std::string& abs, const char* prefix, const std::string& root) {
  if (abs.rfind(prefix, 0) != 0) return abs;
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return map_under(abs, "/proc", proc_root());
}

auto map_sys_path(const std::string& abs) -> std::string {
  return map_under(abs, "/sys", sys_root());
}

static std::string map_any(const std::string& abs) {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return abs;
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_any(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return std::nullopt; // disappeared or became unreadable mid-read
  return s;
}

auto read_attr(const std::string& abs) -> std::optional<std::string> {
  auto raw = read_file_string(abs);
  if (!raw) return std::nullopt;
  size_t b = 0, e = raw->size();
  while (b < e && std::isspace(static_cast<unsigned char>((*raw)[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>((*raw)[e - 1]))) --e;
  if (b == e) return std::nullopt;
  return raw->substr(b, e - b);
}

auto list_dir(const std::string& abs) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto path = map_any(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  return out;
}

auto unescape_mount_field(const std::string& s) -> std::string {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        s[i+1] >= '0' && s[i+1] <= '3' && s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
      out.push_back(static_cast<char>((s[i+1] - '0') * 64 + (s[i+2] - '0') * 8 + (s[i+3] - '0')));
      i += 3;
      continue;
    }
    out.push_back(s[i]);
  }
  return out;
}

auto current_username() -> std::string {
  uid_t uid = ::geteuid();
  struct passwd pw{};
  struct passwd* result = nullptr;
  char buf[4096];
  if (::getpwuid_r(uid, &pw, buf, sizeof(buf), &result) == 0 && result && result->pw_name) {
    return result->pw_name;
  }
  return std::to_string(uid);
}

} // namespace usbtrail::util
