#include "config/config.hpp"
#include <boost/log/trivial.hpp>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace datastore::config {

namespace {

uint64_t parse_unsigned(const std::string& flag, const std::string& value, uint64_t max_value) {
    std::size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        if (value.empty() || value[0] == '-') {
            throw std::invalid_argument(value);
        }
        parsed = std::stoull(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid value for " + flag + ": " + value);
    }
    if (consumed != value.size() || parsed > max_value) {
        throw ConfigError("Invalid value for " + flag + ": " + value);
    }
    return parsed;
}

uint16_t parse_port(const std::string& flag, const std::string& value) {
    uint64_t port = parse_unsigned(flag, value, std::numeric_limits<uint16_t>::max());
    if (port == 0) {
        throw ConfigError("Invalid value for " + flag + ": port must be positive");
    }
    return static_cast<uint16_t>(port);
}

std::chrono::seconds parse_ttl(const std::string& flag, const std::string& value) {
    uint64_t seconds = parse_unsigned(flag, value, std::numeric_limits<int32_t>::max());
    if (seconds == 0) {
        throw ConfigError("Invalid value for " + flag + ": TTL must be positive");
    }
    return std::chrono::seconds(seconds);
}

} // namespace

const char* to_string(Backend backend) {
    switch (backend) {
        case Backend::Memory:    return "memory";
        case Backend::Memcached: return "memcached";
        default:                 return "unknown";
    }
}

Backend parse_backend(const std::string& name) {
    if (name == "memory") return Backend::Memory;
    if (name == "memcached") return Backend::Memcached;
    throw ConfigError("Unknown store backend: " + name);
}

void apply_environment(Config& config, const EnvLookup& lookup) {
    if (const char* host = lookup("MEMCACHED_HOST"); host && *host) {
        config.host = host;
    }
    if (const char* port = lookup("MEMCACHED_PORT"); port && *port) {
        config.port = parse_port("MEMCACHED_PORT", port);
    }
    if (const char* ttl = lookup("MEMCACHED_TTL"); ttl && *ttl) {
        config.default_ttl = parse_ttl("MEMCACHED_TTL", ttl);
    }
    if (const char* backend = lookup("DATASTORE_BACKEND"); backend && *backend) {
        config.backend = parse_backend(backend);
    }
    if (const char* data_dir = lookup("DATASTORE_DATA_DIR"); data_dir && *data_dir) {
        config.data_dir = data_dir;
    }
}

void apply_command_line(Config& config, int argc, const char* const argv[]) {
    enum class Option { Backend, Host, Port, Ttl, ChunkSize, PollInterval, DataDir, Snapshot, LogFile };

    const std::unordered_map<std::string, Option> flag_map = {
        {"-b", Option::Backend},      {"--backend", Option::Backend},
        {"-h", Option::Host},         {"--host", Option::Host},
        {"-p", Option::Port},         {"--port", Option::Port},
        {"-t", Option::Ttl},          {"--ttl", Option::Ttl},
        {"-c", Option::ChunkSize},    {"--chunk-size", Option::ChunkSize},
        {"-i", Option::PollInterval}, {"--poll-interval", Option::PollInterval},
        {"-d", Option::DataDir},      {"--data-dir", Option::DataDir},
        {"-s", Option::Snapshot},     {"--snapshot", Option::Snapshot},
        {"-l", Option::LogFile},      {"--log-file", Option::LogFile}
    };

    for (int i = 1; i < argc; ++i) {
        const std::string flag(argv[i]);

        if (flag == "-v" || flag == "--verbose") {
            config.verbose = true;
            continue;
        }

        auto option = flag_map.find(flag);
        if (option == flag_map.end()) {
            throw ConfigError("Unknown argument: " + flag);
        }
        if (i + 1 >= argc) {
            throw ConfigError("Missing value for " + flag);
        }
        const std::string value(argv[++i]);

        switch (option->second) {
            case Option::Backend:
                config.backend = parse_backend(value);
                break;
            case Option::Host:
                config.host = value;
                break;
            case Option::Port:
                config.port = parse_port(flag, value);
                break;
            case Option::Ttl:
                config.default_ttl = parse_ttl(flag, value);
                break;
            case Option::ChunkSize: {
                uint64_t chunk = parse_unsigned(flag, value, std::numeric_limits<uint32_t>::max());
                if (chunk == 0) {
                    throw ConfigError("Invalid value for " + flag + ": chunk size must be positive");
                }
                config.chunk_size = static_cast<std::size_t>(chunk);
                break;
            }
            case Option::PollInterval: {
                uint64_t interval = parse_unsigned(flag, value, std::numeric_limits<int32_t>::max());
                if (interval == 0) {
                    throw ConfigError("Invalid value for " + flag + ": poll interval must be positive");
                }
                config.poll_interval = std::chrono::milliseconds(interval);
                break;
            }
            case Option::DataDir:
                config.data_dir = value;
                break;
            case Option::Snapshot:
                config.snapshot_path = value;
                break;
            case Option::LogFile:
                config.log_file = value;
                break;
        }
    }
}

Config load(int argc, const char* const argv[], const EnvLookup& lookup) {
    Config config;
    apply_environment(config, lookup);
    apply_command_line(config, argc, argv);

    BOOST_LOG_TRIVIAL(debug) << "Config: backend=" << to_string(config.backend)
                             << " host=" << config.host << " port=" << config.port
                             << " ttl=" << config.default_ttl.count() << "s"
                             << " chunk=" << config.chunk_size
                             << " poll=" << config.poll_interval.count() << "ms";
    return config;
}

std::string usage(const std::string& program_name) {
    std::ostringstream out;
    out << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -b, --backend <memory|memcached>  Task store backend (default: memory)\n"
        << "  -h, --host <host>                 Memcached host (default: localhost)\n"
        << "  -p, --port <port>                 Memcached port (default: 11211)\n"
        << "  -t, --ttl <seconds>               Task timeout (default: 86400)\n"
        << "  -c, --chunk-size <bytes>          Transfer chunk size (default: 10000)\n"
        << "  -i, --poll-interval <ms>          Pause poll interval (default: 2000)\n"
        << "  -d, --data-dir <path>             Stored files directory (default: data)\n"
        << "  -s, --snapshot <path>             Memory store snapshot file, empty to disable\n"
        << "  -l, --log-file <path>             Log file (default: datastore.log)\n"
        << "  -v, --verbose                     Debug logging on the console\n"
        << "Environment: MEMCACHED_HOST, MEMCACHED_PORT, MEMCACHED_TTL, DATASTORE_BACKEND, DATASTORE_DATA_DIR\n"
        << "Example: " << program_name << " -b memcached -h 127.0.0.1 -p 11211\n";
    return out.str();
}

} // namespace datastore::config
