#include "content_hash.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <memory>
#include <vector>

#include "internal/util/errors.hpp"

namespace sandbox::production {

namespace fs = std::filesystem;

namespace {

struct DigestCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter>;

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw util::StorageError("sha256 update failed");
  }
}

void HashFile(EVP_MD_CTX* ctx, const fs::path& file) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw util::StorageError("cannot read " + file.string());
  }

  std::array<char, 64 * 1024> buffer{};
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto n = in.gcount();
    if (n > 0) Update(ctx, buffer.data(), static_cast<std::size_t>(n));
  }
  if (in.bad()) {
    throw util::StorageError("read failed: " + file.string());
  }
}

} // namespace

std::string ContentHash(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw util::NotFound("build output not found: " + dir.string());
  }

  std::vector<std::string> files;
  for (auto it = fs::recursive_directory_iterator(dir); it != fs::recursive_directory_iterator(); ++it) {
    if (it->is_regular_file()) {
      files.push_back(fs::relative(it->path(), dir).generic_string());
    }
  }
  std::sort(files.begin(), files.end());

  DigestCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw util::StorageError("sha256 init failed");
  }

  for (const auto& rel : files) {
    Update(ctx.get(), rel.data(), rel.size() + 1);
    HashFile(ctx.get(), dir / rel);
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    throw util::StorageError("sha256 final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  for (unsigned int i = 0; i < 4 && i < length; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0f]);
  }
  return out;
}

} // namespace sandbox::production
