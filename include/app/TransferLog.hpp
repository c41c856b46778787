#pragma once
#include "model/Transfer.hpp"
#include "util/Logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace usbtrail::app {

inline constexpr const char* kTransferHeader = "timestamp,operation,device,file_path,file_size,file_type,user";

// Destination for finalized records. Must be safe to call from several
// reconcilers at once.
class TransferSink {
public:
  virtual ~TransferSink() = default;
  // false when the record could not be persisted
  virtual bool append(const usbtrail::model::TransferRecord& rec) = 0;
};

struct TransferLogOptions {
  std::filesystem::path directory{"logs"};
  std::string hash_algorithm{"sha256"};
  uint64_t max_bytes{50ull * 1024 * 1024};
  int backup_count{20};
  int retention_days{90};
};

// Daily CSV transfer log (transfers_YYYY-MM-DD.csv) with a digest file
// beside it that is refreshed after every append and rotation.
class TransferLog : public TransferSink {
public:
  TransferLog(TransferLogOptions opts, usbtrail::util::Logger& log);
  TransferLog(const TransferLog&) = delete;
  TransferLog& operator=(const TransferLog&) = delete;

  // Create the directory and apply retention. false if the directory is unusable.
  bool open();

  bool append(const usbtrail::model::TransferRecord& rec) override;

  // Delete dated files older than retention_days; returns how many went.
  size_t cleanup_expired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  [[nodiscard]] std::filesystem::path path_for(std::chrono::system_clock::time_point tp) const;
  [[nodiscard]] const std::string& hash_algorithm() const { return opts_.hash_algorithm; }
  [[nodiscard]] const std::filesystem::path& directory() const { return opts_.directory; }

private:
  bool rotate(const std::filesystem::path& active);
  bool persist_digest(const std::filesystem::path& file);
  bool write_all(const std::filesystem::path& file, const std::string& data);

  TransferLogOptions opts_;
  usbtrail::util::Logger& log_;
  std::mutex mu_;
};

// RFC 4180 field quoting: fields with a comma, quote or line break are
// wrapped in quotes with embedded quotes doubled.
[[nodiscard]] std::string csv_escape(const std::string& field);

// One CSV line (no trailing newline) in header column order.
[[nodiscard]] std::string format_record(const usbtrail::model::TransferRecord& rec);

// "<file>.hash"
[[nodiscard]] std::filesystem::path digest_path(const std::filesystem::path& file);

enum class IntegrityStatus { Verified, Mismatch, MissingDigest, Unreadable };

struct IntegrityResult {
  IntegrityStatus status{IntegrityStatus::Unreadable};
  std::string message;
};

[[nodiscard]] const char* to_string(IntegrityStatus s);

// Recompute the digest of file and compare it to the stored one.
[[nodiscard]] IntegrityResult verify_log_integrity(const std::filesystem::path& file,
                                                   const std::string& algorithm = "sha256");

} // namespace usbtrail::app
