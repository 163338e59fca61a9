#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace splitcpp::core {

inline constexpr std::size_t kMd5DigestSize = 16;

using Md5Bytes = std::array<std::byte, kMd5DigestSize>;

class Md5 {
 public:
  Md5();

  void Update(std::span<const std::byte> bytes);
  [[nodiscard]] Md5Bytes Finalize();

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const;
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  Md5Bytes digest_{};
  bool finalized_ = false;
};

[[nodiscard]] Md5Bytes Md5Digest(std::span<const std::byte> bytes);

// Lowercase hex, 32 characters.
[[nodiscard]] std::string Md5Hex(const Md5Bytes& digest);

[[nodiscard]] bool IsMd5Hex(const std::string& text);

// Streams the whole file through the digest in block_size reads.
[[nodiscard]] Md5Bytes Md5File(const std::filesystem::path& path, std::size_t block_size);

}  // namespace splitcpp::core
