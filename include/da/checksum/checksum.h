#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace da::checksum {

enum class Algorithm { kCrc32, kSha256 };

// Catalog tag recorded next to every checksum ("crc32" / "sha256").
std::string_view AlgorithmTag(Algorithm algorithm) noexcept;
std::optional<Algorithm> ParseAlgorithm(std::string_view tag) noexcept;

// Incremental checksum over a byte stream. The digest depends only on the
// bytes fed in, never on how they were split across Update calls.
class Accumulator {
public:
  explicit Accumulator(Algorithm algorithm = Algorithm::kCrc32);
  ~Accumulator();

  Accumulator(Accumulator&& other) noexcept;
  Accumulator& operator=(Accumulator&& other) noexcept;
  Accumulator(const Accumulator&) = delete;
  Accumulator& operator=(const Accumulator&) = delete;

  void Update(std::span<const uint8_t> data);

  // Lower-case hex digest. May be called once; further Update calls throw.
  std::string Finalize();

  Algorithm algorithm() const noexcept { return algorithm_; }
  uint64_t bytes() const noexcept { return bytes_; }

private:
  struct DigestState;

  Algorithm algorithm_;
  uint32_t crc_{0xFFFFFFFFu};
  std::unique_ptr<DigestState> digest_;
  uint64_t bytes_{0};
  bool finalized_{false};
};

uint32_t Crc32(std::span<const uint8_t> data, uint32_t seed = 0);

// Feeds the first `length` bytes of an existing file into the accumulator.
// Used to resume a transfer so the final digest covers the whole file.
void FeedFile(Accumulator& accumulator, const std::filesystem::path& path, uint64_t length,
              size_t block_size);

std::string ChecksumFile(const std::filesystem::path& path, Algorithm algorithm,
                         size_t block_size);

}  // namespace da::checksum
