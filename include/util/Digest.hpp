#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace usbtrail::util {

// True if OpenSSL knows a message digest by this name ("sha256", "sha512", ...).
[[nodiscard]] bool digest_supported(const std::string& algorithm);

// Lowercase hex digest of a file's contents. std::nullopt if the file cannot
// be read or the algorithm is unknown.
[[nodiscard]] std::optional<std::string> file_digest(const std::filesystem::path& path,
                                                     const std::string& algorithm = "sha256");

} // namespace usbtrail::util
