#include "digest.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

namespace {

constexpr std::size_t kReadBlock = 64 * 1024;

using MdContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdContext new_sha3_context(const std::string& what) {
  MdContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1) {
    throw IoError(what, "unable to initialise SHA3-256");
  }
  return ctx;
}

Digest finish(EVP_MD_CTX* ctx, const std::string& what) {
  Digest out{};
  unsigned int len = 0;
  if(EVP_DigestFinal_ex(ctx, out.data(), &len) != 1 || len != out.size()) {
    throw IoError(what, "SHA3-256 finalisation failed");
  }
  return out;
}

std::string errno_reason(const char* fallback) {
  return errno != 0 ? std::error_code(errno, std::generic_category()).message() : std::string(fallback);
}

} // namespace

Digest digest_file(const std::filesystem::path& path) {
  const std::string name = path.string();
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if(ec) throw IoError(name, ec.message());
  if(!std::filesystem::is_regular_file(status)) {
    throw IoError(name, std::filesystem::is_directory(status) ? "is a directory" : "not a regular file");
  }

  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if(!in) throw IoError(name, errno_reason("cannot open for reading"));

  auto ctx = new_sha3_context(name);
  std::vector<char> buffer(kReadBlock);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = in.gcount();
    if(read > 0) {
      if(EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(read)) != 1) {
        throw IoError(name, "SHA3-256 update failed");
      }
    }
  }
  if(in.bad()) throw IoError(name, errno_reason("read failed"));
  return finish(ctx.get(), name);
}

Digest digest_bytes(const std::string& data) {
  auto ctx = new_sha3_context("<memory>");
  if(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw IoError("<memory>", "SHA3-256 update failed");
  }
  return finish(ctx.get(), "<memory>");
}

std::string digest_to_hex(const Digest& digest) {
  return hex_from_bytes(digest.data(), digest.size());
}

std::optional<Digest> digest_from_hex(const std::string& hex) {
  auto bytes = bytes_from_hex(hex);
  if(!bytes || bytes->size() != kDigestSize) return std::nullopt;
  Digest out{};
  std::copy(bytes->begin(), bytes->end(), out.begin());
  return out;
}
