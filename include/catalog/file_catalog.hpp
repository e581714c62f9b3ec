#ifndef DATASTORE_CATALOG_FILE_CATALOG_HPP
#define DATASTORE_CATALOG_FILE_CATALOG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace datastore {
namespace catalog {

class CatalogError : public std::runtime_error {
public:
  explicit CatalogError(const std::string& message) : std::runtime_error(message) {}
};

class FileNotFoundError : public CatalogError {
public:
  explicit FileNotFoundError(const std::string& filename)
    : CatalogError("Catalog: File not found: " + filename) {}
};

// Files stored directly under one data directory
class FileCatalog {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  struct StagedFile {
    std::filesystem::path scratch_dir;
    std::filesystem::path file;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileCatalog(const std::filesystem::path& data_dir);


  // ---- QUERY OPERATIONS ----
  // Regular files whose name matches the glob and whose modification time lies
  // in [from, to]. Missing bounds default to the epoch and now. Sorted by name.
  std::vector<std::filesystem::path> select(const std::string& pattern = "*",
                                            std::optional<TimePoint> from = std::nullopt,
                                            std::optional<TimePoint> to = std::nullopt) const;
  // Path of a stored file; rejects names that would leave the data directory
  std::filesystem::path resolve(const std::string& filename) const;
  TimePoint modification_time(const std::filesystem::path& file) const;


  // ---- DOWNLOAD PREPARATION ----
  // Copies a stored file into a fresh directory under scratch_root
  StagedFile stage(const std::string& filename, const std::filesystem::path& scratch_root) const;

  const std::filesystem::path& data_dir() const { return data_dir_; }

private:
  std::filesystem::path data_dir_;
};

// Local time in ISO-8601 "YYYY-MM-DDTHH:MM:SS" form
FileCatalog::TimePoint parse_timestamp(const std::string& text);

} // namespace catalog
} // namespace datastore

#endif // DATASTORE_CATALOG_FILE_CATALOG_HPP
