#ifndef DATASTORE_CONFIG_HPP
#define DATASTORE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace datastore::config {

enum class Backend {
    Memory,
    Memcached
};

struct Config {
    Backend backend{Backend::Memory};
    std::string host{"localhost"};
    uint16_t port{11211};
    // TTL of every task record
    std::chrono::seconds default_ttl{86400};
    std::size_t chunk_size{10000};
    std::chrono::milliseconds poll_interval{2000};
    std::string data_dir{"data"};
    // Empty disables snapshot persistence
    std::string snapshot_path{"datastore.snapshot"};
    std::string log_file{"datastore.log"};
    bool verbose{false};
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

using EnvLookup = std::function<const char*(const char*)>;

const char* to_string(Backend backend);
Backend parse_backend(const std::string& name);

// Overlays MEMCACHED_HOST, MEMCACHED_PORT, MEMCACHED_TTL,
// DATASTORE_BACKEND and DATASTORE_DATA_DIR
void apply_environment(Config& config, const EnvLookup& lookup);

// Overlays command-line flags; throws ConfigError on unknown flags or bad values
void apply_command_line(Config& config, int argc, const char* const argv[]);

// Defaults, then environment, then command line
Config load(int argc, const char* const argv[], const EnvLookup& lookup);

std::string usage(const std::string& program_name);

} // namespace datastore::config

#endif // DATASTORE_CONFIG_HPP
