#pragma once
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

namespace da {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Byte count used when a transfer has no known length. Large enough that a
// reader bounded by it stops only at end of stream.
inline constexpr std::uint64_t kUnknownSize = 100'000'000'000ull;

inline constexpr std::uint64_t kBytesPerMegabyte = 1024ull * 1024ull;

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

inline std::tm ToUtcTm(Timestamp tp) {
  auto tt = Clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  return tm;
}

// ISO-8601 UTC with millisecond precision, e.g. 2024-03-01T12:00:00.125Z.
inline std::string FormatTimestamp(Timestamp tp) {
  const std::tm tm = ToUtcTm(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) %
                std::chrono::seconds(1);
  if (millis.count() < 0) {
    millis += std::chrono::seconds(1);
  }
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(3) << std::setfill('0') << millis.count() << 'Z';
  return oss.str();
}

// Inverse of FormatTimestamp. Returns nullopt on malformed input.
inline std::optional<Timestamp> ParseTimestamp(std::string_view text) {
  std::tm tm{};
  std::istringstream iss{std::string(text)};
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
  int millis = 0;
  if (iss.peek() == '.') {
    iss.get();
    std::string digits;
    while (std::isdigit(iss.peek())) {
      digits.push_back(static_cast<char>(iss.get()));
    }
    digits.resize(3, '0');
    millis = std::stoi(digits);
  }
  const std::time_t seconds = timegm(&tm);
  return Clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

// Partition key for the on-volume directory layout (YYYY-MM-DD).
inline std::string DateDirectory(Timestamp tp) {
  const std::tm tm = ToUtcTm(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d");
  return oss.str();
}

inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kHex[(byte >> 4) & 0x0F]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return out;
}

inline double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace da
