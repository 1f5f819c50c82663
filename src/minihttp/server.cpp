#include <minihttp/server.hpp>
#include <minihttp/request.hpp>
#include <minihttp/response.hpp>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>      // sockaddr_in, htons(), INADDR_ANY, inet_ntop()
#include <unistd.h>         // close()
#include <cerrno>
#include <cstring>          // std::memset, strerror
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

minihttp::HTTP_Server::HTTP_Server(ServerConfig config) : server_config(std::move(config)) {
    try {
        // Create socket
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if(server_fd < 0) {
            throw std::runtime_error("Failed to create socket: " + std::string(strerror(errno)));
        }

        // Allow rebinding right after a restart
        int opt = 1;
        if(setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            throw std::runtime_error("Failed to set socket options");
        }

        struct sockaddr_in server_address;
        std::memset(&server_address, 0, sizeof(server_address));
        server_address.sin_family = AF_INET;
        server_address.sin_addr.s_addr = INADDR_ANY;
        server_address.sin_port = htons(server_config.port);

        if(bind(server_fd, (struct sockaddr *)&server_address, sizeof(server_address)) < 0) {
            throw std::runtime_error("Failed to bind to port " + std::to_string(server_config.port)
                                     + ": " + strerror(errno));
        }

        if(listen(server_fd, config::BACKLOG_SIZE) < 0) {
            throw std::runtime_error("Failed to listen on port " + std::to_string(server_config.port));
        }

        running = true;
        std::cout << "Server initialized on port " << port() << std::endl;
    } catch (const std::exception& e) {
        if(server_fd >= 0) {
            close(server_fd);
            server_fd = -1;
        }
        std::cerr << "Server initialization error: " << e.what() << std::endl;
        throw;  // Re-throw to be handled by main()
    }
}

minihttp::HTTP_Server::~HTTP_Server() {
    if(server_fd >= 0) {
        close(server_fd);
        server_fd = -1;
    }
}

void minihttp::HTTP_Server::add_route(const std::string &segment, std::unique_ptr<RequestHandler> handler) {
    router.add_route(segment, std::move(handler));
}

uint16_t minihttp::HTTP_Server::port() const {
    struct sockaddr_in bound_address;
    socklen_t len = sizeof(bound_address);
    if(getsockname(server_fd, (struct sockaddr *)&bound_address, &len) < 0) {
        throw std::runtime_error("getsockname failed: " + std::string(strerror(errno)));
    }
    return ntohs(bound_address.sin_port);
}

void minihttp::HTTP_Server::stop() {
    running = false;
    // Wakes up a blocked accept()
    if(server_fd >= 0) {
        shutdown(server_fd, SHUT_RDWR);
    }
}

void minihttp::HTTP_Server::run() {
    std::cout << "Server starting to listen for connections..." << std::endl;

    while(running) {
        try {
            struct sockaddr_in client_address;
            socklen_t client_address_len = sizeof(client_address);

            int client_fd = accept(server_fd, (struct sockaddr *)&client_address, &client_address_len);
            if(client_fd < 0) {
                if(!running) {
                    break;
                }
                if(errno == EINTR) {
                    continue;
                }
                throw std::runtime_error("Accept failed: " + std::string(strerror(errno)));
            }
            auto connection = std::make_unique<SocketConnection>(client_fd);

            char client_ip[INET_ADDRSTRLEN] = "unknown";
            inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN);

            {
                std::lock_guard<std::mutex> lock(connections_mutex);
                client_fds.insert(client_fd);
            }

            // The thread owns the connection; it is closed when the lambda is destroyed,
            // after release_connection() so drain_connections() never touches a closed fd
            try {
                std::thread([this, client_fd, connection = std::move(connection), ip = std::string(client_ip)]() {
                    try {
                        serve(*connection, ip);
                    } catch (const std::exception& e) {
                        std::cerr << "Error handling client " << ip << ": " << e.what() << std::endl;
                    }
                    release_connection(client_fd);
                }).detach();
            } catch (const std::exception&) {
                release_connection(client_fd);
                throw;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error accepting connection: " << e.what() << std::endl;
            // Continue to accept other connections even if one fails
        }
    }
    drain_connections();
    std::cout << "Server stopped" << std::endl;
}

void minihttp::HTTP_Server::release_connection(int client_fd) {
    std::lock_guard<std::mutex> lock(connections_mutex);
    client_fds.erase(client_fd);
    // Notify under the lock: once the set is empty the server may be destroyed
    connections_done.notify_all();
}

void minihttp::HTTP_Server::drain_connections() {
    std::unique_lock<std::mutex> lock(connections_mutex);
    if(!client_fds.empty()) {
        std::cout << "Closing " << client_fds.size() << " open connection(s)" << std::endl;
    }
    // Unblocks threads still waiting on a slow client
    for(int client_fd : client_fds) {
        shutdown(client_fd, SHUT_RDWR);
    }
    connections_done.wait(lock, [this] { return client_fds.empty(); });
}

std::size_t minihttp::HTTP_Server::open_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex);
    return client_fds.size();
}

void minihttp::HTTP_Server::serve(Connection &connection, const std::string &client_ip) const {
    RequestReader reader(connection);
    std::optional<HTTP_Request> request = read_request(reader);
    if(!request) {
        std::cout << client_ip << " - empty or invalid request, closing" << std::endl;
        return;
    }

    if(!running) {
        std::cout << client_ip << " - server stopping, request dropped" << std::endl;
        return;
    }

    HTTP_Response response = router.dispatch(*request);
    connection.write_all(response.to_string());

    std::cout << client_ip << " - " << request->method << " " << request->path
              << " - " << response.status_code << std::endl;
}
