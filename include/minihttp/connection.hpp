#ifndef MINIHTTP_CONNECTION_HPP
#define MINIHTTP_CONNECTION_HPP

#include <minihttp/config.hpp>  // BUF_LEN
#include <string>
#include <optional>
#include <cstddef>

namespace minihttp {
    // Byte stream of a single client connection
    class Connection {
    public:
        virtual ~Connection() = default;
        // Read at most len bytes. Returns 0 at end of stream, throws std::runtime_error on failure.
        virtual std::size_t read_some(char *buffer, std::size_t len) = 0;
        // Write all of data or throw std::runtime_error
        virtual void write_all(const std::string &data) = 0;
    };

    // Owns an accepted socket; shuts it down and closes it on destruction
    class SocketConnection: public Connection {
    public:
        explicit SocketConnection(int fd);
        ~SocketConnection() override;
        SocketConnection(const SocketConnection &) = delete;
        SocketConnection &operator=(const SocketConnection &) = delete;

        std::size_t read_some(char *buffer, std::size_t len) override;
        void write_all(const std::string &data) override;
    private:
        int fd;
    };

    // Connection over a fixed input buffer that records everything written to it
    class StringConnection: public Connection {
    public:
        explicit StringConnection(std::string input);

        std::size_t read_some(char *buffer, std::size_t len) override;
        void write_all(const std::string &data) override;
        const std::string &output() const { return written; }
    private:
        std::string input;
        std::size_t offset = 0;
        std::string written;
    };

    // Buffered line/byte reader on top of a Connection
    class RequestReader {
    public:
        explicit RequestReader(Connection &connection);

        // Next line without its CRLF (or LF). std::nullopt at end of stream with nothing buffered.
        std::optional<std::string> read_line();
        // Up to len bytes; fewer only if the stream ended first
        std::string read_exact(std::size_t len);
    private:
        Connection &connection;
        std::string buffer;
        bool eof = false;

        bool fill();
    };
}

#endif
