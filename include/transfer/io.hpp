#ifndef DATASTORE_TRANSFER_IO_HPP
#define DATASTORE_TRANSFER_IO_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace datastore {
namespace transfer {

// ---- INTERFACES ----

class ByteSource {
public:
  virtual ~ByteSource() = default;
  // Returns up to max_bytes; an empty result means end of stream
  virtual std::string read(std::size_t max_bytes) = 0;
};

class ByteSink {
public:
  virtual ~ByteSink() = default;
  virtual void write(const char* data, std::size_t length) = 0;
  // Flushes buffered bytes
  virtual void close() {}
};

class PathSource {
public:
  virtual ~PathSource() = default;
  // Next path, or nullopt once exhausted
  virtual std::optional<std::filesystem::path> next() = 0;
};


// ---- STREAM ADAPTERS ----

class StreamSource : public ByteSource {
public:
  explicit StreamSource(std::istream& input) : input_(input) {}
  std::string read(std::size_t max_bytes) override;

private:
  std::istream& input_;
};

class StreamSink : public ByteSink {
public:
  explicit StreamSink(std::ostream& output) : output_(output) {}
  void write(const char* data, std::size_t length) override;
  void close() override;

private:
  std::ostream& output_;
};


// ---- FILE ADAPTERS ----

class FileSource : public ByteSource {
public:
  explicit FileSource(const std::filesystem::path& file_path);
  std::string read(std::size_t max_bytes) override;
  void close();

private:
  std::filesystem::path path_;
  std::ifstream file_;
};

// Creates or truncates the destination file
class FileSink : public ByteSink {
public:
  explicit FileSink(const std::filesystem::path& file_path);
  void write(const char* data, std::size_t length) override;
  void close() override;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::ofstream file_;
};


// ---- PATH LISTS ----

class VectorPathSource : public PathSource {
public:
  explicit VectorPathSource(std::vector<std::filesystem::path> paths)
    : paths_(std::move(paths)) {}
  std::optional<std::filesystem::path> next() override;

private:
  std::vector<std::filesystem::path> paths_;
  std::size_t position_{0};
};

} // namespace transfer
} // namespace datastore

#endif // DATASTORE_TRANSFER_IO_HPP
