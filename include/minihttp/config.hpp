#ifndef MINIHTTP_CONFIG_HPP
#define MINIHTTP_CONFIG_HPP

#include <cstdint>
#include <cstddef>
#include <string>

namespace minihttp::config {
    inline constexpr std::size_t BUF_LEN            = 4096;
    inline constexpr uint16_t DEFAULT_PORT          = 4221;
    inline constexpr int BACKLOG_SIZE               = 10;
    inline constexpr char DEFAULT_ROOT_PATH[]       = ".";
}

namespace minihttp {
    struct ServerConfig {
        uint16_t port = config::DEFAULT_PORT;
        std::string root_path = config::DEFAULT_ROOT_PATH;
    };

    // Build a ServerConfig from the command line.
    // Accepts --directory/-d <path> and --port=<n>, --port <n>, -p <n>.
    // Throws std::invalid_argument on unknown options or bad values.
    ServerConfig parse_args(int argc, const char *const *argv);

    // Throws std::runtime_error unless config.root_path is an existing directory
    void validate_config(const ServerConfig &config);
}

#endif
