#include "md5.hpp"

#include "file_io.hpp"

#include "splitcpp/errors.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <vector>

namespace splitcpp::core {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::runtime_error DigestError(const std::string& message) {
  return std::runtime_error("md5: " + message);
}

}  // namespace

void Md5::CtxDeleter::operator()(EVP_MD_CTX* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw DigestError("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
    throw DigestError("EVP_DigestInit_ex failed");
  }
}

void Md5::Update(std::span<const std::byte> bytes) {
  if (finalized_) {
    throw std::logic_error("Md5::Update called after Finalize");
  }
  if (bytes.empty()) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
    throw DigestError("EVP_DigestUpdate failed");
  }
}

Md5Bytes Md5::Finalize() {
  if (!finalized_) {
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), reinterpret_cast<unsigned char*>(digest_.data()), &out_len) != 1 ||
        out_len != kMd5DigestSize) {
      throw DigestError("EVP_DigestFinal_ex failed");
    }
    finalized_ = true;
  }
  return digest_;
}

Md5Bytes Md5Digest(std::span<const std::byte> bytes) {
  Md5 hasher;
  hasher.Update(bytes);
  return hasher.Finalize();
}

std::string Md5Hex(const Md5Bytes& digest) {
  std::string out;
  out.reserve(digest.size() * 2);
  for (const std::byte value : digest) {
    const auto octet = std::to_integer<std::uint8_t>(value);
    out.push_back(kHexDigits[octet >> 4U]);
    out.push_back(kHexDigits[octet & 0x0FU]);
  }
  return out;
}

bool IsMd5Hex(const std::string& text) {
  if (text.size() != kMd5DigestSize * 2) {
    return false;
  }
  for (const char ch : text) {
    const bool digit = ch >= '0' && ch <= '9';
    const bool lower = ch >= 'a' && ch <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

Md5Bytes Md5File(const std::filesystem::path& path, std::size_t block_size) {
  if (block_size == 0) {
    throw std::invalid_argument("md5: block size must be positive");
  }
  auto in = OpenForRead(path);
  Md5 hasher;
  std::vector<std::byte> block(block_size);
  while (true) {
    const auto got = ReadBlock(in, block);
    if (got == 0) {
      break;
    }
    hasher.Update(std::span<const std::byte>(block.data(), got));
  }
  if (in.bad()) {
    throw Error(ErrorCode::kIOError, "md5: read failed: " + path.string(), path);
  }
  return hasher.Finalize();
}

}  // namespace splitcpp::core
