#include "checksum.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

#include "internal/util/errors.hpp"

namespace archstore::util {
namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx NewSha256() {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw InvalidState("sha256 digest init failed");
  }
  return ctx;
}

void Update(EVP_MD_CTX* ctx, const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw InvalidState("sha256 digest update failed");
  }
}

std::string Finish(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               len = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1) {
    throw InvalidState("sha256 digest final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  auto ctx = NewSha256();
  Update(ctx.get(), data.data(), data.size());
  return Finish(ctx.get());
}

std::string Sha256HexOfFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw StorageIOError("cannot read " + path.string());
  }

  auto                  ctx = NewSha256();
  std::array<char, 65536> buf{};
  while (in) {
    in.read(buf.data(), buf.size());
    if (in.gcount() > 0) {
      Update(ctx.get(), buf.data(), static_cast<std::size_t>(in.gcount()));
    }
  }
  if (in.bad()) {
    throw StorageIOError("read failed for " + path.string());
  }
  return Finish(ctx.get());
}

bool VerifyChecksum(std::string_view data, std::string_view expected_hex) {
  return Sha256Hex(data) == expected_hex;
}

} // namespace archstore::util
