#ifndef MINIHTTP_SERVER_HPP
#define MINIHTTP_SERVER_HPP

#include <minihttp/config.hpp>      // ServerConfig
#include <minihttp/connection.hpp>  // Connection
#include <minihttp/router.hpp>      // Router
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace minihttp {
    // Listens on config.port and serves every accepted connection on its own detached thread.
    // Throws std::runtime_error from the constructor when the socket cannot be bound.
    class HTTP_Server {
    public:
        explicit HTTP_Server(ServerConfig config = ServerConfig{});
        ~HTTP_Server();
        HTTP_Server(const HTTP_Server &) = delete;
        HTTP_Server &operator=(const HTTP_Server &) = delete;

        // Routes must be added before run()
        void add_route(const std::string &segment, std::unique_ptr<RequestHandler> handler);
        // Accept loop. Returns after stop(), once every connection thread has finished.
        void run();
        // Async-signal-safe
        void stop();

        // One request/response exchange on an already accepted connection
        void serve(Connection &connection, const std::string &client_ip) const;

        uint16_t port() const;
        // Connections accepted and not yet finished
        std::size_t open_connections() const;
    private:
        int server_fd = -1;
        ServerConfig server_config;
        Router router;
        std::atomic<bool> running{false};

        mutable std::mutex connections_mutex;
        std::condition_variable connections_done;
        std::set<int> client_fds;

        void release_connection(int client_fd);
        void drain_connections();
    };
}
#endif
