#include "catalog/file_catalog.hpp"
#include <algorithm>
#include <cstdint>
#include <ctime>
#include <fnmatch.h>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace datastore {
namespace catalog {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileCatalog::FileCatalog(const std::filesystem::path& data_dir)
  : data_dir_(data_dir) {
  std::error_code ec;
  std::filesystem::create_directories(data_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Catalog: Failed to create data directory " << data_dir_.string()
                             << ": " << ec.message();
    throw CatalogError("Catalog: Failed to create data directory: " + data_dir_.string());
  }
  BOOST_LOG_TRIVIAL(info) << "Catalog: Using data directory " << data_dir_.string();
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<std::filesystem::path> FileCatalog::select(const std::string& pattern,
                                                       std::optional<TimePoint> from,
                                                       std::optional<TimePoint> to) const {
  const TimePoint lower = from.value_or(TimePoint{});
  const TimePoint upper = to.value_or(std::chrono::system_clock::now());

  BOOST_LOG_TRIVIAL(debug) << "Catalog: Selecting '" << pattern << "' in " << data_dir_.string();

  std::vector<std::filesystem::path> matches;
  for (const auto& entry : std::filesystem::directory_iterator(data_dir_)) {
    if (!entry.is_regular_file()) {
      continue;
    }

    const std::string name = entry.path().filename().string();
    if (fnmatch(pattern.c_str(), name.c_str(), FNM_PERIOD) != 0) {
      continue;
    }

    const TimePoint modified = modification_time(entry.path());
    if (modified < lower || modified > upper) {
      continue;
    }
    matches.push_back(entry.path());
  }

  std::sort(matches.begin(), matches.end());
  BOOST_LOG_TRIVIAL(debug) << "Catalog: " << matches.size() << " files matched";
  return matches;
}

std::filesystem::path FileCatalog::resolve(const std::string& filename) const {
  if (filename.empty() || filename == "." || filename == ".." ||
      filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "Catalog: Rejected file name: " << filename;
    throw CatalogError("Catalog: Invalid file name: " + filename);
  }
  return data_dir_ / filename;
}

FileCatalog::TimePoint FileCatalog::modification_time(const std::filesystem::path& file) const {
  using namespace std::chrono;

  // file_time_type has no portable conversion in C++17; rebase on the current time of both clocks
  const auto file_time = std::filesystem::last_write_time(file);
  return time_point_cast<system_clock::duration>(
    file_time - std::filesystem::file_time_type::clock::now() + system_clock::now());
}


//==============================================
// DOWNLOAD PREPARATION
//==============================================

FileCatalog::StagedFile FileCatalog::stage(const std::string& filename,
                                           const std::filesystem::path& scratch_root) const {
  const std::filesystem::path source = resolve(filename);
  if (!std::filesystem::is_regular_file(source)) {
    BOOST_LOG_TRIVIAL(error) << "Catalog: File not found: " << source.string();
    throw FileNotFoundError(filename);
  }

  std::filesystem::create_directories(scratch_root);

  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<uint32_t> dis;

  std::filesystem::path scratch_dir;
  do {
    std::ostringstream name;
    name << "stage_" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    scratch_dir = scratch_root / name.str();
  } while (!std::filesystem::create_directory(scratch_dir));

  StagedFile staged{scratch_dir, scratch_dir / filename};
  try {
    std::filesystem::copy_file(source, staged.file);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Catalog: Failed to stage " << filename << ": " << e.what();
    std::error_code ec;
    std::filesystem::remove_all(scratch_dir, ec);
    throw CatalogError("Catalog: Failed to stage " + filename + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Catalog: Staged " << filename << " in " << scratch_dir.string();
  return staged;
}


//==============================================
// TIMESTAMPS
//==============================================

FileCatalog::TimePoint parse_timestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream input(text);
  input >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (input.fail() || input.peek() != std::char_traits<char>::eof()) {
    throw CatalogError("Catalog: Invalid timestamp (expected YYYY-MM-DDTHH:MM:SS): " + text);
  }

  tm.tm_isdst = -1;
  const std::time_t seconds = std::mktime(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    throw CatalogError("Catalog: Timestamp out of range: " + text);
  }
  return std::chrono::system_clock::from_time_t(seconds);
}

} // namespace catalog
} // namespace datastore
