#ifndef MINIHTTP_REQUEST_HPP
#define MINIHTTP_REQUEST_HPP

#include <string>
#include <map>
#include <optional>

namespace minihttp {
    class RequestReader;

    struct HTTP_Request {
        std::string method, path, version;
        // Header names are stored lowercased
        std::map<std::string, std::string> headers;
        std::string body;

        // Value of the header, or an empty string when absent. Name is case-insensitive.
        std::string header(const std::string &name) const;
        bool has_header(const std::string &name) const;
    };

    // Read one request from the connection behind reader.
    // Returns std::nullopt when the peer sent nothing or the request line is malformed.
    // Throws std::runtime_error when the underlying connection fails.
    std::optional<HTTP_Request> read_request(RequestReader &reader);

    // Same as read_request, over an in-memory buffer
    std::optional<HTTP_Request> parse_request(const std::string &raw);

    std::string to_lower(std::string str);
}

#endif
