#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace da {
  enum class ErrorDomain : std::uint16_t {
    IO = 0x02,
    Validation = 0x04,
    Config = 0x05,
    Catalog = 0x06,
    Transport = 0x08,
    Internal = 0x7F
  };

  // Framework codes start at a per-domain base well above errno values, which
  // travel separately in native_code.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Catalog:
      return 0x0600;
    case ErrorDomain::Transport:
      return 0x0800;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kStagingWriteFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kShortRead = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kMoveFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kFetchFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kOffsetMismatch = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kDiskSpaceQueryFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kProcessFailed = Make(ErrorDomain::IO, 0x07);
    } // namespace io

    namespace validation {
      inline constexpr int kMalformedMultipart = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kDuplicatePartName = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kHeaderTooLong = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kTruncatedBody = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kInvalidUri = Make(ErrorDomain::Validation, 0x05);
    } // namespace validation

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kUnknownKey = Make(ErrorDomain::Config, 0x02);
    } // namespace config

    namespace catalog {
      inline constexpr int kOpenFailed = Make(ErrorDomain::Catalog, 0x01);
      inline constexpr int kStatementFailed = Make(ErrorDomain::Catalog, 0x02);
      inline constexpr int kConstraintViolation = Make(ErrorDomain::Catalog, 0x03);
      inline constexpr int kNotFound = Make(ErrorDomain::Catalog, 0x04);
    } // namespace catalog

    namespace transport {
      inline constexpr int kConnectFailed = Make(ErrorDomain::Transport, 0x01);
      inline constexpr int kProtocolError = Make(ErrorDomain::Transport, 0x02);
      inline constexpr int kHttpStatus = Make(ErrorDomain::Transport, 0x03);
      inline constexpr int kUnsupportedScheme = Make(ErrorDomain::Transport, 0x04);
      inline constexpr int kReadFailed = Make(ErrorDomain::Transport, 0x05);
    } // namespace transport

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Wraps a foreign exception so it can travel in a tagged result.
  inline Error ErrorFromException(const std::exception& ex) {
    if (auto* sys = dynamic_cast<const std::system_error*>(&ex)) {
      const int native = sys->code().value();
      return Error{ErrorDomain::IO, native, sys->what(), native};
    }
    return Error{ErrorDomain::Internal, 0, ex.what()};
  }
} // namespace da
