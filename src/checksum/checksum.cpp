#include "da/checksum/checksum.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include "da/common.h"
#include "da/error.h"

namespace da::checksum {

namespace {

constexpr uint32_t kCRC32Polynomial = 0xEDB88320u;

constexpr std::array<uint32_t, 256> MakeCRC32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < table.size(); ++i) {
    uint32_t value = i;
    for (uint32_t bit = 0; bit < 8; ++bit) {
      if (value & 1u) {
        value = (value >> 1) ^ kCRC32Polynomial;
      } else {
        value >>= 1;
      }
    }
    table[i] = value;
  }
  return table;
}

constexpr auto kCRC32Table = MakeCRC32Table();

uint32_t Crc32Update(uint32_t state, std::span<const uint8_t> data) {
  for (uint8_t byte : data) {
    state = kCRC32Table[(state ^ byte) & 0xFFu] ^ (state >> 8);
  }
  return state;
}

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }
  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;

}  // namespace

struct Accumulator::DigestState {
  DigestCtxPtr ctx;
};

std::string_view AlgorithmTag(Algorithm algorithm) noexcept {
  switch (algorithm) {
    case Algorithm::kCrc32:
      return "crc32";
    case Algorithm::kSha256:
      return "sha256";
  }
  return "crc32";
}

std::optional<Algorithm> ParseAlgorithm(std::string_view tag) noexcept {
  if (tag == "crc32") {
    return Algorithm::kCrc32;
  }
  if (tag == "sha256") {
    return Algorithm::kSha256;
  }
  return std::nullopt;
}

Accumulator::Accumulator(Algorithm algorithm) : algorithm_(algorithm) {
  if (algorithm_ != Algorithm::kSha256) {
    return;
  }
  digest_ = std::make_unique<DigestState>();
  digest_->ctx.reset(EVP_MD_CTX_new());
  if (!digest_->ctx) {
    throw Error{ErrorDomain::Internal, 0, BuildOpenSSLErrorMessage("EVP_MD_CTX_new")};
  }
  if (EVP_DigestInit_ex(digest_->ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw Error{ErrorDomain::Internal, 0, BuildOpenSSLErrorMessage("EVP_DigestInit_ex")};
  }
}

Accumulator::~Accumulator() = default;
Accumulator::Accumulator(Accumulator&& other) noexcept = default;
Accumulator& Accumulator::operator=(Accumulator&& other) noexcept = default;

void Accumulator::Update(std::span<const uint8_t> data) {
  if (finalized_) {
    throw Error{ErrorDomain::Internal, 0, "Checksum already finalized"};
  }
  if (data.empty()) {
    return;
  }
  if (algorithm_ == Algorithm::kCrc32) {
    crc_ = Crc32Update(crc_, data);
  } else if (EVP_DigestUpdate(digest_->ctx.get(), data.data(), data.size()) != 1) {
    throw Error{ErrorDomain::Internal, 0, BuildOpenSSLErrorMessage("EVP_DigestUpdate")};
  }
  bytes_ += data.size();
}

std::string Accumulator::Finalize() {
  if (finalized_) {
    throw Error{ErrorDomain::Internal, 0, "Checksum already finalized"};
  }
  finalized_ = true;
  if (algorithm_ == Algorithm::kCrc32) {
    const uint32_t value = crc_ ^ 0xFFFFFFFFu;
    const std::array<uint8_t, 4> be{static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
                                     static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)};
    return HexEncode(be);
  }
  std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(digest_->ctx.get(), digest.data(), &length) != 1) {
    throw Error{ErrorDomain::Internal, 0, BuildOpenSSLErrorMessage("EVP_DigestFinal_ex")};
  }
  return HexEncode(std::span<const uint8_t>(digest.data(), length));
}

uint32_t Crc32(std::span<const uint8_t> data, uint32_t seed) {
  return Crc32Update(seed ^ 0xFFFFFFFFu, data) ^ 0xFFFFFFFFu;
}

void FeedFile(Accumulator& accumulator, const std::filesystem::path& path, uint64_t length,
              size_t block_size) {
  if (length == 0) {
    return;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno;
    throw Error{ErrorDomain::IO, err, "Failed to open " + PathToUtf8String(path) + " for checksum", err};
  }
  std::vector<uint8_t> buffer(block_size == 0 ? 65536 : block_size);
  uint64_t remaining = length;
  while (remaining > 0) {
    const size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
    const auto got = in.gcount();
    if (got <= 0) {
      throw Error{ErrorDomain::IO, errors::io::kShortRead,
                  "Unexpected end of " + PathToUtf8String(path) + " while computing checksum"};
    }
    accumulator.Update(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(got)));
    remaining -= static_cast<uint64_t>(got);
  }
}

std::string ChecksumFile(const std::filesystem::path& path, Algorithm algorithm, size_t block_size) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, ec.value(), "Failed to stat " + PathToUtf8String(path) + ": " + ec.message(),
                ec.value()};
  }
  Accumulator accumulator(algorithm);
  FeedFile(accumulator, path, size, block_size);
  return accumulator.Finalize();
}

}  // namespace da::checksum
