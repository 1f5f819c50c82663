#include <minihttp/request.hpp>
#include <minihttp/connection.hpp>
#include <vector>
#include <stdexcept>
#include <iostream>
#include <algorithm>        // std::all_of, std::transform
#include <cctype>           // std::isdigit, std::tolower

namespace {
    std::string trim(const std::string &str) {
        const char *whitespace = " \t";
        size_t first = str.find_first_not_of(whitespace);
        if(first == std::string::npos) {
            return "";
        }
        size_t last = str.find_last_not_of(whitespace);
        return str.substr(first, last - first + 1);
    }

    // Split on single spaces. Interior empty tokens are kept, trailing ones dropped.
    std::vector<std::string> split_request_line(const std::string &line) {
        std::vector<std::string> tokens;
        size_t start = 0;
        size_t end;
        while((end = line.find(' ', start)) != std::string::npos) {
            tokens.push_back(line.substr(start, end - start));
            start = end + 1;
        }
        tokens.push_back(line.substr(start));
        while(!tokens.empty() && tokens.back().empty()) {
            tokens.pop_back();
        }
        return tokens;
    }

    // Declared body length, 0 when absent or not a positive integer
    std::size_t content_length(const minihttp::HTTP_Request &request) {
        if(!request.has_header("content-length")) {
            return 0;
        }
        const std::string value = request.header("content-length");
        bool digits_only = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if(digits_only) {
            try {
                return static_cast<std::size_t>(std::stoull(value));
            } catch (const std::out_of_range &) {
            }
        }
        std::cerr << "Invalid Content-Length header: " << value << std::endl;
        return 0;
    }
}

std::string minihttp::to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

std::string minihttp::HTTP_Request::header(const std::string &name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

bool minihttp::HTTP_Request::has_header(const std::string &name) const {
    return headers.find(to_lower(name)) != headers.end();
}

std::optional<minihttp::HTTP_Request> minihttp::read_request(RequestReader &reader) {
    HTTP_Request request;

    // Request line
    auto request_line = reader.read_line();
    if(!request_line || request_line->empty()) {
        return std::nullopt;
    }
    std::vector<std::string> tokens = split_request_line(*request_line);
    if(tokens.size() < 3) {
        std::cerr << "Invalid request line: " << *request_line << std::endl;
        return std::nullopt;
    }
    request.method  = tokens[0];
    request.path    = tokens[1];
    request.version = tokens[2];

    // Headers, up to the empty line
    while(auto line = reader.read_line()) {
        if(line->empty()) {
            break;
        }
        size_t sep = line->find(':');
        std::string name = sep == std::string::npos ? "" : trim(line->substr(0, sep));
        if(name.empty()) {
            std::cerr << "Skipping malformed header: " << *line << std::endl;
            continue;
        }
        request.headers[to_lower(name)] = trim(line->substr(sep + 1));
    }

    // Body
    if(std::size_t length = content_length(request)) {
        request.body = reader.read_exact(length);
        if(request.body.size() < length) {
            std::cerr << "Warning: Content-Length (" << length << ") exceeds received body size ("
                      << request.body.size() << ")" << std::endl;
        }
    }

    return request;
}

std::optional<minihttp::HTTP_Request> minihttp::parse_request(const std::string &raw) {
    StringConnection connection(raw);
    RequestReader reader(connection);
    return read_request(reader);
}
