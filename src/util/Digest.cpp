#include "util/Digest.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>

namespace usbtrail::util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

bool digest_supported(const std::string& algorithm) {
  return EVP_get_digestbyname(algorithm.c_str()) != nullptr;
}

std::optional<std::string> file_digest(const std::filesystem::path& path, const std::string& algorithm) {
  const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
  if (!md) return std::nullopt;

  std::ifstream file(path, std::ios::binary);
  if (!file) return std::nullopt;

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) return std::nullopt;

  char buffer[8192];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) return std::nullopt;
  }
  if (file.bad()) return std::nullopt;

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) return std::nullopt;

  static const char* hex = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(hex[hash[i] >> 4]);
    out.push_back(hex[hash[i] & 0x0f]);
  }
  return out;
}

} // namespace usbtrail::util
