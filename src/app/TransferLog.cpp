#include "app/TransferLog.hpp"
#include "util/Clock.hpp"
#include "util/Digest.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <fstream>
#include <optional>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace usbtrail::app {

using usbtrail::util::LogLevel;

namespace {

// "<prefix>_YYYY-MM-DD.<ext>[.<n>]" -> local midnight of that date
std::optional<std::chrono::system_clock::time_point> parse_file_date(const std::string& name) {
  auto us = name.find('_');
  if (us == std::string::npos) return std::nullopt;
  auto rest = name.substr(us + 1);
  auto dot = rest.find('.');
  auto date = rest.substr(0, dot);
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') return std::nullopt;
  int y = 0, m = 0, d = 0;
  char tail = 0;
  if (std::sscanf(date.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3) return std::nullopt;
  if (m < 1 || m > 12 || d < 1 || d > 31) return std::nullopt;
  std::tm tm{};
  tm.tm_year = y - 1900;
  tm.tm_mon = m - 1;
  tm.tm_mday = d;
  tm.tm_isdst = -1;
  std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;
  return std::chrono::system_clock::from_time_t(t);
}

fs::path backup_path(const fs::path& active, int n) {
  return fs::path(active.string() + "." + std::to_string(n));
}

} // namespace

std::string csv_escape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string format_record(const usbtrail::model::TransferRecord& rec) {
  std::string line = usbtrail::util::format_local(rec.timestamp, "%Y-%m-%d %H:%M:%S");
  line += ',';
  line += usbtrail::model::to_string(rec.operation);
  line += ',';
  line += csv_escape(rec.device_name);
  line += ',';
  line += csv_escape(rec.relative_path);
  line += ',';
  line += std::to_string(rec.file_size_bytes);
  line += ',';
  line += csv_escape(rec.file_extension);
  line += ',';
  line += csv_escape(rec.username);
  return line;
}

fs::path digest_path(const fs::path& file) {
  return fs::path(file.string() + ".hash");
}

const char* to_string(IntegrityStatus s) {
  switch (s) {
    case IntegrityStatus::Verified:      return "verified";
    case IntegrityStatus::Mismatch:      return "mismatch";
    case IntegrityStatus::MissingDigest: return "missing_digest";
    case IntegrityStatus::Unreadable:    return "unreadable";
  }
  return "unreadable";
}

IntegrityResult verify_log_integrity(const fs::path& file, const std::string& algorithm) {
  auto hp = digest_path(file);
  std::error_code ec;
  if (!fs::exists(hp, ec)) return {IntegrityStatus::MissingDigest, "Hash file missing"};

  std::ifstream in(hp);
  std::string stored;
  if (!in.is_open() || !(in >> stored)) {
    return {IntegrityStatus::Unreadable, "Hash file unreadable: " + hp.string()};
  }
  auto actual = usbtrail::util::file_digest(file, algorithm);
  if (!actual) return {IntegrityStatus::Unreadable, "Log file unreadable: " + file.string()};
  if (*actual != stored) {
    return {IntegrityStatus::Mismatch, "Hash mismatch - log file may have been tampered with"};
  }
  return {IntegrityStatus::Verified, "Log file integrity verified"};
}

TransferLog::TransferLog(TransferLogOptions opts, usbtrail::util::Logger& log)
    : opts_(std::move(opts)), log_(log) {
  if (!usbtrail::util::digest_supported(opts_.hash_algorithm)) {
    log_.logf(LogLevel::Warn, "transfer log: unknown hash algorithm '%s'; using sha256", opts_.hash_algorithm.c_str());
    opts_.hash_algorithm = "sha256";
  }
  if (opts_.backup_count < 1) opts_.backup_count = 1;
  if (opts_.retention_days < 1) opts_.retention_days = 1;
}

bool TransferLog::open() {
  std::error_code ec;
  fs::create_directories(opts_.directory, ec);
  if (ec || !fs::is_directory(opts_.directory, ec)) {
    log_.logf(LogLevel::Error, "transfer log: cannot create %s: %s", opts_.directory.c_str(), ec.message().c_str());
    return false;
  }
  size_t n = cleanup_expired();
  if (n > 0) log_.logf(LogLevel::Info, "transfer log: removed %zu expired file(s)", n);
  return true;
}

fs::path TransferLog::path_for(std::chrono::system_clock::time_point tp) const {
  return opts_.directory / ("transfers_" + usbtrail::util::format_local(tp, "%Y-%m-%d") + ".csv");
}

bool TransferLog::write_all(const fs::path& file, const std::string& data) {
  int fd = ::open(file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    log_.logf(LogLevel::Error, "transfer log: open %s failed: %s", file.c_str(), std::strerror(errno));
    return false;
  }
  const char* p = data.data();
  size_t left = data.size();
  bool ok = true;
  while (left > 0) {
    ssize_t w = ::write(fd, p, left);
    if (w < 0) {
      if (errno == EINTR) continue;
      log_.logf(LogLevel::Error, "transfer log: write %s failed: %s", file.c_str(), std::strerror(errno));
      ok = false;
      break;
    }
    p += w;
    left -= static_cast<size_t>(w);
  }
  if (::close(fd) != 0 && ok) {
    log_.logf(LogLevel::Error, "transfer log: close %s failed: %s", file.c_str(), std::strerror(errno));
    ok = false;
  }
  return ok;
}

bool TransferLog::append(const usbtrail::model::TransferRecord& rec) {
  std::string line = format_record(rec);
  line.push_back('\n');

  std::lock_guard<std::mutex> lk(mu_);
  const fs::path active = path_for(std::chrono::system_clock::now());
  std::error_code ec;
  uint64_t size = fs::exists(active, ec) ? fs::file_size(active, ec) : 0;
  if (ec) size = 0;

  const uint64_t header_len = std::strlen(kTransferHeader) + 1;
  if (size > header_len && size + line.size() > opts_.max_bytes) {
    if (!rotate(active)) return false;
    size = 0;
  }

  std::string data;
  if (size == 0) {
    data = kTransferHeader;
    data.push_back('\n');
  }
  data += line;
  if (!write_all(active, data)) return false;
  return persist_digest(active);
}

bool TransferLog::rotate(const fs::path& active) {
  std::error_code ec;
  const int n = opts_.backup_count;
  fs::remove(backup_path(active, n), ec);
  fs::remove(digest_path(backup_path(active, n)), ec);
  for (int i = n - 1; i >= 1; --i) {
    auto from = backup_path(active, i);
    if (!fs::exists(from, ec)) continue;
    fs::rename(from, backup_path(active, i + 1), ec);
    if (ec) {
      log_.logf(LogLevel::Error, "transfer log: rotate %s failed: %s", from.c_str(), ec.message().c_str());
      return false;
    }
    fs::rename(digest_path(from), digest_path(backup_path(active, i + 1)), ec);
  }
  auto first = backup_path(active, 1);
  fs::rename(active, first, ec);
  if (ec) {
    log_.logf(LogLevel::Error, "transfer log: rotate %s failed: %s", active.c_str(), ec.message().c_str());
    return false;
  }
  fs::remove(digest_path(active), ec);
  log_.logf(LogLevel::Info, "transfer log: rotated %s", active.filename().c_str());
  return persist_digest(first);
}

bool TransferLog::persist_digest(const fs::path& file) {
  auto hex = usbtrail::util::file_digest(file, opts_.hash_algorithm);
  if (!hex) {
    log_.logf(LogLevel::Error, "transfer log: cannot digest %s", file.c_str());
    return false;
  }
  auto target = digest_path(file);
  auto tmp = fs::path(target.string() + ".tmp");
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << *hex;
    if (!out.good()) {
      log_.logf(LogLevel::Error, "transfer log: cannot write %s", tmp.c_str());
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    log_.logf(LogLevel::Error, "transfer log: cannot replace %s: %s", target.c_str(), ec.message().c_str());
    return false;
  }
  return true;
}

size_t TransferLog::cleanup_expired(std::chrono::system_clock::time_point now) {
  const auto cutoff = now - std::chrono::hours(24) * opts_.retention_days;
  std::vector<fs::path> expired;
  std::error_code ec;
  for (auto it = fs::directory_iterator(opts_.directory, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    auto date = parse_file_date(it->path().filename().string());
    if (date && *date < cutoff) expired.push_back(it->path());
  }
  size_t removed = 0;
  for (const auto& p : expired) {
    std::error_code rm;
    if (fs::remove(p, rm)) {
      ++removed;
      log_.logf(LogLevel::Debug, "transfer log: deleted expired %s", p.filename().c_str());
    } else if (rm) {
      log_.logf(LogLevel::Warn, "transfer log: cannot delete %s: %s", p.filename().c_str(), rm.message().c_str());
    }
  }
  return removed;
}

} // namespace usbtrail::app
