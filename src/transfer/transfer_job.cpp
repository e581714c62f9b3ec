#include "transfer/transfer_job.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <system_error>
#include "transfer/transfer_error.hpp"

namespace datastore {
namespace transfer {

//==============================================
// DOWNLOAD
//==============================================

DownloadJob::DownloadJob(const std::filesystem::path& file_path, std::unique_ptr<ByteSink> sink,
                         std::optional<std::filesystem::path> scratch_dir)
  : source_(file_path)
  , sink_(std::move(sink))
  , scratch_dir_(std::move(scratch_dir)) {
  if (!sink_) {
    throw std::invalid_argument("Download job: Sink must not be null");
  }
  BOOST_LOG_TRIVIAL(debug) << "Download job: Prepared " << file_path.string();
}

bool DownloadJob::process_chunk(std::size_t chunk_size) {
  std::string chunk = source_.read(chunk_size);
  if (chunk.empty()) {
    return false;
  }
  sink_->write(chunk.data(), chunk.size());
  transferred_ += chunk.size();
  return true;
}

void DownloadJob::on_completed() {
  sink_->close();
  source_.close();
  remove_scratch_dir();
  BOOST_LOG_TRIVIAL(info) << "Download job: Sent " << transferred() << " bytes";
}

void DownloadJob::on_aborted() {
  source_.close();
  try {
    sink_->close();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Download job: Closing sink after abort failed: " << e.what();
  }
  remove_scratch_dir();
  BOOST_LOG_TRIVIAL(info) << "Download job: Stopped after " << transferred() << " bytes";
}

void DownloadJob::remove_scratch_dir() {
  if (!scratch_dir_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(*scratch_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Download job: Failed to remove scratch directory "
                             << scratch_dir_->string() << ": " << ec.message();
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "Download job: Removed scratch directory " << scratch_dir_->string();
  scratch_dir_.reset();
}


//==============================================
// UPLOAD
//==============================================

UploadJob::UploadJob(std::unique_ptr<ByteSource> inbound, const std::filesystem::path& destination)
  : inbound_(std::move(inbound))
  , sink_(destination) {
  if (!inbound_) {
    throw std::invalid_argument("Upload job: Source must not be null");
  }
  BOOST_LOG_TRIVIAL(debug) << "Upload job: Writing to " << destination.string();
}

bool UploadJob::process_chunk(std::size_t chunk_size) {
  std::string chunk = inbound_->read(chunk_size);
  if (chunk.empty()) {
    return false;
  }
  sink_.write(chunk.data(), chunk.size());
  transferred_ += chunk.size();
  return true;
}

void UploadJob::on_completed() {
  sink_.close();
  BOOST_LOG_TRIVIAL(info) << "Upload job: Stored " << transferred() << " bytes at " << sink_.path().string();
}

void UploadJob::on_aborted() {
  try {
    sink_.close();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Upload job: Closing destination after abort failed: " << e.what();
  }

  std::error_code ec;
  std::filesystem::remove(sink_.path(), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Upload job: Failed to remove partial file "
                             << sink_.path().string() << ": " << ec.message();
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Upload job: Removed partial file " << sink_.path().string();
}


//==============================================
// DELETE
//==============================================

DeleteJob::DeleteJob(std::unique_ptr<PathSource> paths)
  : paths_(std::move(paths)) {
  if (!paths_) {
    throw std::invalid_argument("Delete job: Path source must not be null");
  }
}

bool DeleteJob::process_chunk(std::size_t /*chunk_size*/) {
  std::optional<std::filesystem::path> path = paths_->next();
  if (!path) {
    return false;
  }

  std::error_code ec;
  if (!std::filesystem::remove(*path, ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Delete job: Failed to delete " << path->string() << ": " << ec.message();
      throw TransferError("Failed to delete " + path->string() + ": " + ec.message());
    }
    BOOST_LOG_TRIVIAL(warning) << "Delete job: Already gone: " << path->string();
    return true;
  }

  ++transferred_;
  BOOST_LOG_TRIVIAL(debug) << "Delete job: Deleted " << path->string();
  return true;
}

} // namespace transfer
} // namespace datastore
