#ifndef DATASTORE_TRANSFER_JOB_HPP
#define DATASTORE_TRANSFER_JOB_HPP

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include "transfer/io.hpp"

namespace datastore {
namespace transfer {

// One kind of chunked work the engine can drive
class TransferJob {
public:
  virtual ~TransferJob() = default;

  virtual const char* name() const = 0;

  // Performs one chunk of work. Returns false once the source is exhausted.
  virtual bool process_chunk(std::size_t chunk_size) = 0;
  // Runs after the last chunk, before the task record is removed
  virtual void on_completed() {}
  // Runs when the task was aborted or interrupted or the transfer failed.
  // Must not throw.
  virtual void on_aborted() {}

  // Bytes (or paths, for deletions) processed so far
  std::size_t transferred() const { return transferred_.load(); }

protected:
  std::atomic<std::size_t> transferred_{0};
};


// Streams a prepared file to a sink. The optional scratch directory holds the
// packaged artifact and is removed once the transfer ends either way.
class DownloadJob : public TransferJob {
public:
  DownloadJob(const std::filesystem::path& file_path, std::unique_ptr<ByteSink> sink,
              std::optional<std::filesystem::path> scratch_dir = std::nullopt);

  const char* name() const override { return "download"; }
  bool process_chunk(std::size_t chunk_size) override;
  void on_completed() override;
  void on_aborted() override;

private:
  FileSource source_;
  std::unique_ptr<ByteSink> sink_;
  std::optional<std::filesystem::path> scratch_dir_;

  void remove_scratch_dir();
};


// Writes an inbound stream to a destination file. An aborted upload removes
// the partially written file.
class UploadJob : public TransferJob {
public:
  UploadJob(std::unique_ptr<ByteSource> inbound, const std::filesystem::path& destination);

  const char* name() const override { return "upload"; }
  bool process_chunk(std::size_t chunk_size) override;
  void on_completed() override;
  void on_aborted() override;

private:
  std::unique_ptr<ByteSource> inbound_;
  FileSink sink_;
};


// Deletes one path per chunk
class DeleteJob : public TransferJob {
public:
  explicit DeleteJob(std::unique_ptr<PathSource> paths);

  const char* name() const override { return "delete"; }
  bool process_chunk(std::size_t chunk_size) override;

private:
  std::unique_ptr<PathSource> paths_;
};

} // namespace transfer
} // namespace datastore

#endif // DATASTORE_TRANSFER_JOB_HPP
