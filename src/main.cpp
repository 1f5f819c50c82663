#include <minihttp/server.hpp>
#include <minihttp/handlers.hpp>
#include <minihttp/compression/registry.hpp>
#include <minihttp/compression/gzip.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {
    minihttp::HTTP_Server *active_server = nullptr;

    void handle_stop_signal(int) {
        if(active_server) {
            active_server->stop();
        }
    }
}

int main(int argc, char **argv) {
    try {
        minihttp::ServerConfig config = minihttp::parse_args(argc, argv);
        minihttp::validate_config(config);

        // A client hanging up mid-response must not terminate the process
        std::signal(SIGPIPE, SIG_IGN);

        // Compressors registration
        minihttp::compression::CompressionRegistry compressors;
        compressors.register_compressor(std::make_unique<minihttp::compression::GzipCompressor>());

        minihttp::HTTP_Server server(config);
        std::cout << "Starting HTTP server on port " << config.port << " with root directory: " << config.root_path << std::endl;

        server.add_route("echo", std::make_unique<minihttp::EchoHandler>(compressors));
        server.add_route("user-agent", std::make_unique<minihttp::UserAgentHandler>());
        server.add_route("files", std::make_unique<minihttp::FilesHandler>(config.root_path));

        active_server = &server;
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);

        server.run();
        active_server = nullptr;
    } catch(const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
