#include <minihttp/config.hpp>
#include <filesystem>       // std::filesystem
#include <stdexcept>        // std::invalid_argument, std::runtime_error

namespace {
    uint16_t parse_port(const std::string &port_str) {
        std::size_t consumed = 0;
        long port = 0;
        try {
            port = std::stol(port_str, &consumed);
        } catch (const std::exception &) {
            throw std::invalid_argument("Invalid port specification: " + port_str);
        }
        if(consumed != port_str.size()) {
            throw std::invalid_argument("Invalid port specification: " + port_str);
        }
        if(port <= 0 || port > 65535) {
            throw std::invalid_argument("Port must be between 1-65535");
        }
        return static_cast<uint16_t>(port);
    }
}

minihttp::ServerConfig minihttp::parse_args(int argc, const char *const *argv) {
    ServerConfig config;

    for(int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if(arg == "--directory" || arg == "-d") {
            if(i + 1 >= argc) {
                throw std::invalid_argument(arg + " option requires a path argument");
            }
            config.root_path = argv[++i];
        } else if(arg.rfind("--port=", 0) == 0) {
            config.port = parse_port(arg.substr(7));
        } else if(arg == "--port" || arg == "-p") {
            if(i + 1 >= argc) {
                throw std::invalid_argument(arg + " option requires a port argument");
            }
            config.port = parse_port(argv[++i]);
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return config;
}

void minihttp::validate_config(const ServerConfig &config) {
    if(!std::filesystem::exists(config.root_path)) {
        throw std::runtime_error("Root directory does not exist: " + config.root_path);
    }
    if(!std::filesystem::is_directory(config.root_path)) {
        throw std::runtime_error("Specified path is not a directory: " + config.root_path);
    }
}
