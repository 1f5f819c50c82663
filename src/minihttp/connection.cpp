#include <minihttp/connection.hpp>
#include <sys/socket.h>
#include <unistd.h>         // close()
#include <algorithm>        // std::min
#include <cerrno>
#include <cstring>          // strerror
#include <stdexcept>
#include <utility>          // std::move

minihttp::SocketConnection::SocketConnection(int fd) : fd(fd) {}

minihttp::SocketConnection::~SocketConnection() {
    if(fd >= 0) {
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
}

std::size_t minihttp::SocketConnection::read_some(char *buffer, std::size_t len) {
    while(true) {
        ssize_t bytes_read = recv(fd, buffer, len, 0);
        if(bytes_read >= 0) {
            return static_cast<std::size_t>(bytes_read);
        }
        if(errno != EINTR) {
            throw std::runtime_error("Error reading from socket: " + std::string(strerror(errno)));
        }
    }
}

void minihttp::SocketConnection::write_all(const std::string &data) {
    std::size_t sent = 0;
    while(sent < data.size()) {
        // MSG_NOSIGNAL: a peer that already hung up must not raise SIGPIPE
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if(n < 0) {
            if(errno == EINTR) {
                continue;
            }
            throw std::runtime_error("Error sending response: " + std::string(strerror(errno)));
        }
        sent += static_cast<std::size_t>(n);
    }
}

minihttp::StringConnection::StringConnection(std::string input) : input(std::move(input)) {}

std::size_t minihttp::StringConnection::read_some(char *buffer, std::size_t len) {
    std::size_t n = std::min(len, input.size() - offset);
    input.copy(buffer, n, offset);
    offset += n;
    return n;
}

void minihttp::StringConnection::write_all(const std::string &data) {
    written += data;
}

minihttp::RequestReader::RequestReader(Connection &connection) : connection(connection) {}

bool minihttp::RequestReader::fill() {
    if(eof) {
        return false;
    }
    char chunk[config::BUF_LEN];
    std::size_t n = connection.read_some(chunk, sizeof(chunk));
    if(n == 0) {
        eof = true;
        return false;
    }
    buffer.append(chunk, n);
    return true;
}

std::optional<std::string> minihttp::RequestReader::read_line() {
    std::size_t scanned = 0;
    while(true) {
        size_t pos = buffer.find('\n', scanned);
        if(pos != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if(!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        scanned = buffer.size();
        if(!fill()) {
            break;
        }
    }

    // Stream ended: hand back an unterminated last line, if any
    if(buffer.empty()) {
        return std::nullopt;
    }
    std::string line;
    line.swap(buffer);
    if(line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::string minihttp::RequestReader::read_exact(std::size_t len) {
    while(buffer.size() < len && fill()) {
    }
    std::size_t n = std::min(len, buffer.size());
    std::string bytes = buffer.substr(0, n);
    buffer.erase(0, n);
    return bytes;
}
