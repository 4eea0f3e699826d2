#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "da/checksum/checksum.h"
#include "da/common.h"
#include "da/staging/container_tree.h"
#include "da/transport/byte_stream.h"

namespace da::staging {

struct StagingRequest {
  // Full Content-Type header value, parameters included.
  std::string content_type;
  // Name of the root container.
  std::string root_name;
  // Name of the single file when the body is not multipart.
  std::string file_name;
  // Bytes to read at most; kUnknownSize reads to end of stream.
  uint64_t expected_size{kUnknownSize};
};

struct StagedFile {
  size_t container{ContainerTree::kRoot};
  std::filesystem::path path;
  std::string name;
  std::string content_type;
  std::string checksum;
  checksum::Algorithm algorithm{checksum::Algorithm::kCrc32};
  uint64_t size{0};
};

struct StagingResult {
  double elapsed_seconds{0.0};
  ContainerTree tree;
  std::vector<StagedFile> files;
  uint64_t bytes_read{0};
  double ingest_rate{0.0};
  double reading_seconds{0.0};
  double checksum_seconds{0.0};
  double writing_seconds{0.0};
  std::filesystem::path staging_dir;
};

// Streams a request body into a per-request staging directory, one file per
// leaf part, checksumming as it writes. Multipart bodies are laid out as
// <staging_dir>/<container path>/<file name>.
class StagingWriter {
public:
  StagingWriter(size_t block_size, checksum::Algorithm algorithm);

  // On any failure the staging directory is removed and the error rethrown.
  StagingResult Stage(transport::ByteStream& body, const StagingRequest& request,
                      const std::filesystem::path& staging_dir) const;

private:
  void StageSingle(transport::ByteStream& body, const StagingRequest& request, StagingResult& result) const;
  void StageMultipart(transport::ByteStream& body, const StagingRequest& request, std::string_view boundary,
                      StagingResult& result) const;

  size_t block_size_;
  checksum::Algorithm algorithm_;
};

// Number of bytes to read for a transfer: Content-Length for http:// pulls,
// unknown for other pull schemes, the caller's declared size for pushes.
uint64_t EstimateTransferSize(std::string_view uri, const transport::ByteStream& stream,
                              std::optional<uint64_t> declared_size);

// MIME type inferred from a file name's extension, application/octet-stream
// when nothing matches.
std::string GuessMimeType(std::string_view file_name);

}  // namespace da::staging
