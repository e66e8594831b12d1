#include "checksum.hpp"

#include <openssl/evp.h>
#include <zlib.h>

#include <fstream>
#include <memory>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "errors.hpp"
#include "utils.hpp"

namespace {

constexpr std::size_t kReadBlock = 1 << 20;

struct EvpCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::vector<std::string> FileChecksums::as_catalog_strings() const {
  return {
    fmt::format("enstore:{}", enstore),
    fmt::format("adler32:{:08x}", adler32),
    "md5:" + md5
  };
}

FileChecksums compute_file_checksums(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw SourceFileMissingError("Unable to read " + path.string());
  }

  std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter> ctx(EVP_MD_CTX_new());
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("EVP md5 init failed");
  }

  FileChecksums out;
  uLong enstore = 0;
  uLong adler = adler32(0L, Z_NULL, 0);
  std::vector<char> buffer(kReadBlock);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got <= 0) break;
    auto* bytes = reinterpret_cast<const Bytef*>(buffer.data());
    enstore = adler32(enstore, bytes, static_cast<uInt>(got));
    adler = adler32(adler, bytes, static_cast<uInt>(got));
    if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
      throw std::runtime_error("EVP md5 update failed");
    }
    out.bytes += static_cast<uint64_t>(got);
  }
  if(in.bad()) {
    throw std::runtime_error("Read error on " + path.string());
  }

  std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("EVP md5 final failed");
  }
  digest.resize(digest_len);

  out.enstore = static_cast<uint32_t>(enstore);
  out.adler32 = static_cast<uint32_t>(adler);
  out.md5 = hex_from_bytes(digest);
  return out;
}
