#include "da/mirror/resumable_fetch.h"

#include <algorithm>
#include <cassert>
#include <cerrno>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>

#include "da/transport/byte_stream.h"
#include "test_support.h"

namespace {

// Yields `data` from `offset`, failing once `fail_at` absolute bytes have
// been served.
class ScriptedStream final : public da::transport::ByteStream {
public:
  ScriptedStream(std::string data, uint64_t offset, std::optional<uint64_t> fail_at)
      : data_(std::move(data)), position_(offset), fail_at_(fail_at) {}

  size_t Read(std::span<uint8_t> buffer) override {
    uint64_t end = data_.size();
    if (fail_at_) {
      if (position_ >= *fail_at_) {
        throw da::Error{da::ErrorDomain::Transport, da::errors::transport::kReadFailed, "connection reset", ECONNRESET};
      }
      end = std::min<uint64_t>(end, *fail_at_);
    }
    const size_t n = static_cast<size_t>(std::min<uint64_t>(buffer.size(), end - position_));
    std::copy_n(data_.data() + position_, n, buffer.data());
    position_ += n;
    return n;
  }

private:
  std::string data_;
  uint64_t position_;
  std::optional<uint64_t> fail_at_;
};

struct SourceScript {
  std::string payload;
  std::optional<uint64_t> fail_at;
  // Offset the source answers with; nullopt honours the requested start.
  std::optional<uint64_t> forced_start;
  int opens{0};
};

class ScriptedSource final : public da::transport::RemoteSource {
public:
  explicit ScriptedSource(SourceScript& script) : script_(script) {}

  da::transport::OpenedStream Open(uint64_t start_byte) override {
    ++script_.opens;
    const uint64_t start = script_.forced_start.value_or(start_byte);
    da::transport::OpenedStream opened;
    opened.stream = std::make_unique<ScriptedStream>(script_.payload, start, script_.fail_at);
    opened.start_offset = start;
    return opened;
  }
  std::string Describe() const override { return "scripted://source"; }

private:
  SourceScript& script_;
};

da::mirror::SourceFactory FactoryFor(SourceScript& script) {
  return [&script](std::string_view) { return std::make_unique<ScriptedSource>(script); };
}

std::string Digest(std::string_view data, da::checksum::Algorithm algorithm) {
  da::checksum::Accumulator acc(algorithm);
  acc.Update(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
  return acc.Finalize();
}

void TestInterruptedTransferResumes() {
  da::testing::TempDir dir("da_fetch_");
  SourceScript script;
  script.payload = da::testing::Pattern(500, 13);
  script.fail_at = 300;
  da::mirror::StreamFetch fetch(FactoryFor(script), 64, da::checksum::Algorithm::kSha256);

  da::mirror::FetchRequest request;
  request.uri = "http://mirror/obs.fits";
  request.staging_path = dir.path() / "obs.fits.part";

  da::mirror::FetchProgress progress;
  bool threw = false;
  try {
    (void)fetch.Fetch(request, progress);
  } catch (const da::Error& err) {
    threw = true;
    assert(da::mirror::ClassifyFetchFailure(err, progress.bytes_received, request.start_byte) ==
           da::mirror::FetchOutcome::kResumable);
  }
  assert(threw);
  assert(progress.bytes_received == 300);
  assert(std::filesystem::file_size(request.staging_path) == 300);

  script.fail_at.reset();
  request.start_byte = 300;
  da::mirror::FetchProgress resumed;
  const auto result = fetch.Fetch(request, resumed);
  assert(resumed.bytes_received == 200);
  assert(result.bytes_received == 200);
  assert(result.file_size == 500);
  assert(result.algorithm == da::checksum::Algorithm::kSha256);
  assert(result.checksum == Digest(script.payload, da::checksum::Algorithm::kSha256));
  assert(da::testing::ReadText(request.staging_path) == script.payload);
  assert(script.opens == 2);
}

void TestSourceWithoutRangeSupport() {
  da::testing::TempDir dir("da_fetch_");
  SourceScript script;
  script.payload = da::testing::Pattern(1000, 21);
  script.forced_start = 0;
  const auto staging = dir.path() / "part";
  da::testing::WriteFile(staging, std::string_view(script.payload).substr(0, 400));

  da::mirror::StreamFetch fetch(FactoryFor(script), 128, da::checksum::Algorithm::kCrc32);
  da::mirror::FetchRequest request{"http://mirror/x", staging, 400};
  da::mirror::FetchProgress progress;
  const auto result = fetch.Fetch(request, progress);
  assert(progress.bytes_received == 600);
  assert(result.file_size == 1000);
  assert(result.checksum == Digest(script.payload, da::checksum::Algorithm::kCrc32));
  assert(da::testing::ReadText(staging) == script.payload);

  // A source that skips ahead of the partial file is refused.
  script.forced_start = 700;
  da::testing::WriteFile(staging, std::string_view(script.payload).substr(0, 400));
  bool threw = false;
  try {
    da::mirror::FetchProgress ignored;
    (void)fetch.Fetch(request, ignored);
  } catch (const da::Error& err) {
    threw = err.domain == da::ErrorDomain::Transport && err.code == da::errors::transport::kProtocolError;
  }
  assert(threw);
  assert(std::filesystem::file_size(staging) == 400);
}

void TestFreshTransferTruncates() {
  da::testing::TempDir dir("da_fetch_");
  SourceScript script;
  script.payload = "fresh payload";
  const auto staging = dir.path() / "part";
  da::testing::WriteFile(staging, "stale bytes from an abandoned attempt");
  da::mirror::StreamFetch fetch(FactoryFor(script), 4, da::checksum::Algorithm::kCrc32);
  da::mirror::FetchProgress progress;
  const auto result = fetch.Fetch({"http://mirror/x", staging, 0}, progress);
  assert(result.file_size == script.payload.size());
  assert(da::testing::ReadText(staging) == script.payload);
}

void TestClassification() {
  using da::mirror::ClassifyFetchFailure;
  using da::mirror::FetchOutcome;
  const da::Error full{da::ErrorDomain::IO, ENOSPC, "write failed", ENOSPC};
  const da::Error reset{da::ErrorDomain::Transport, da::errors::transport::kReadFailed, "reset"};
  assert(ClassifyFetchFailure(full, 100, 0) == FetchOutcome::kDiskExhausted);
  assert(ClassifyFetchFailure(full, 0, 0) == FetchOutcome::kDiskExhausted);
  assert(ClassifyFetchFailure(reset, 0, 0) == FetchOutcome::kIoFailure);
  assert(ClassifyFetchFailure(reset, 1, 0) == FetchOutcome::kResumable);
  assert(ClassifyFetchFailure(reset, 0, 300) == FetchOutcome::kResumable);
  assert(da::mirror::FetchOutcomeName(FetchOutcome::kResumable) == "resumable");

  assert(da::mirror::ParseFetchMethod("rsync") == da::mirror::FetchMethod::kRsync);
  assert(da::mirror::ParseFetchMethod("HTTP") == da::mirror::FetchMethod::kHttp);
  assert(!da::mirror::ParseFetchMethod("ftp"));
  assert(da::mirror::FetchMethodName(da::mirror::FetchMethod::kRsync) == "RSYNC");
}

void TestRsyncExitStatus() {
  da::mirror::CheckRsyncExit(0, "");

  const int exited_11 = 11 << 8;
  bool threw = false;
  try {
    da::mirror::CheckRsyncExit(exited_11, "rsync: write failed on \"x\": No space left on device (28)");
  } catch (const da::Error& err) {
    threw = err.code == da::errors::io::kProcessFailed && err.native_code == std::optional<int>(ENOSPC);
  }
  assert(threw);

  threw = false;
  try {
    da::mirror::CheckRsyncExit(exited_11 + (1 << 8), "connection unexpectedly closed");
  } catch (const da::Error& err) {
    threw = !err.native_code && err.retryability == da::Retryability::kTransient;
    assert(std::string(err.what()).find("exited with status 12") != std::string::npos);
  }
  assert(threw);
}

std::filesystem::path WriteScript(const std::filesystem::path& path, const std::string& body) {
  da::testing::WriteFile(path, "#!/bin/sh\n" + body);
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path;
}

void TestRsyncProcess() {
  // Scripts live under the working directory; /tmp may be mounted noexec.
  da::testing::TempDir dir("da_fetch_", std::filesystem::current_path());
  const std::string payload = da::testing::Pattern(2048, 17);
  const auto source = dir.path() / "source.bin";
  da::testing::WriteFile(source, payload);
  const auto staging = dir.path() / "staging.bin";

  // Arguments: --append --inplace <source> <target>.
  const auto copier = WriteScript(dir.path() / "fake-rsync", "[ \"$1\" = --append ] || exit 2\ncp \"$3\" \"$4\"\n");
  da::mirror::RsyncFetch fetch(copier.string(), 256, da::checksum::Algorithm::kCrc32);
  da::mirror::FetchProgress progress;
  const auto result = fetch.Fetch({"file://" + source.string(), staging, 0}, progress);
  assert(result.file_size == 2048);
  assert(progress.bytes_received == 2048);
  assert(result.checksum == Digest(payload, da::checksum::Algorithm::kCrc32));
  assert(fetch.method() == da::mirror::FetchMethod::kRsync);

  const auto full = WriteScript(dir.path() / "full-rsync",
                                "head -c 100 \"$3\" > \"$4\"\necho 'rsync: No space left on device (28)' >&2\nexit 11\n");
  da::mirror::RsyncFetch failing(full.string(), 256, da::checksum::Algorithm::kCrc32);
  std::filesystem::remove(staging);
  da::mirror::FetchProgress partial;
  bool threw = false;
  try {
    (void)failing.Fetch({source.string(), staging, 0}, partial);
  } catch (const da::Error& err) {
    threw = da::mirror::ClassifyFetchFailure(err, partial.bytes_received, 0) ==
            da::mirror::FetchOutcome::kDiskExhausted;
  }
  assert(threw);
  assert(partial.bytes_received == 100);
}

}  // namespace

int main() {
  TestInterruptedTransferResumes();
  TestSourceWithoutRangeSupport();
  TestFreshTransferTruncates();
  TestClassification();
  TestRsyncExitStatus();
  TestRsyncProcess();
  std::cout << "resumable fetch tests passed" << std::endl;
  return 0;
}
