#include "transfer/io.hpp"
#include <boost/log/trivial.hpp>
#include "transfer/transfer_error.hpp"

namespace datastore {
namespace transfer {

namespace {

std::string read_chunk(std::istream& input, std::size_t max_bytes) {
  std::string chunk(max_bytes, '\0');
  input.read(&chunk[0], static_cast<std::streamsize>(max_bytes));
  if (input.bad()) {
    throw TransferError("Read from source stream failed");
  }
  chunk.resize(static_cast<std::size_t>(input.gcount()));
  return chunk;
}

} // namespace

//==============================================
// STREAM ADAPTERS
//==============================================

std::string StreamSource::read(std::size_t max_bytes) {
  if (max_bytes == 0 || !input_.good()) {
    return {};
  }
  return read_chunk(input_, max_bytes);
}

void StreamSink::write(const char* data, std::size_t length) {
  output_.write(data, static_cast<std::streamsize>(length));
  if (!output_) {
    throw TransferError("Write to sink stream failed");
  }
}

void StreamSink::close() {
  output_.flush();
  if (!output_) {
    throw TransferError("Flush of sink stream failed");
  }
}


//==============================================
// FILE ADAPTERS
//==============================================

FileSource::FileSource(const std::filesystem::path& file_path)
  : path_(file_path)
  , file_(file_path, std::ios::binary) {
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "File source: Failed to open: " << path_.string();
    throw TransferError("Failed to open source file: " + path_.string());
  }
}

std::string FileSource::read(std::size_t max_bytes) {
  if (max_bytes == 0 || !file_.is_open() || !file_.good()) {
    return {};
  }
  return read_chunk(file_, max_bytes);
}

void FileSource::close() {
  if (file_.is_open()) {
    file_.close();
  }
}

FileSink::FileSink(const std::filesystem::path& file_path)
  : path_(file_path)
  , file_(file_path, std::ios::binary | std::ios::trunc) {
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "File sink: Failed to create: " << path_.string();
    throw TransferError("Failed to create destination file: " + path_.string());
  }
}

void FileSink::write(const char* data, std::size_t length) {
  file_.write(data, static_cast<std::streamsize>(length));
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "File sink: Write failed: " << path_.string();
    throw TransferError("Write to destination file failed: " + path_.string());
  }
}

void FileSink::close() {
  if (!file_.is_open()) {
    return;
  }
  file_.flush();
  file_.close();
  if (file_.fail()) {
    throw TransferError("Failed to close destination file: " + path_.string());
  }
}


//==============================================
// PATH LISTS
//==============================================

std::optional<std::filesystem::path> VectorPathSource::next() {
  if (position_ >= paths_.size()) {
    return std::nullopt;
  }
  return paths_[position_++];
}

} // namespace transfer
} // namespace datastore
