#include <minihttp/response.hpp>
#include <minihttp/status.hpp>
#include <sstream>
#include <utility>          // std::move

std::string minihttp::reason_phrase(HTTP_STATUS_CODE code) {
    switch(code) {
        case HTTP_STATUS_CODE::OK:                      return "OK";
        case HTTP_STATUS_CODE::CREATED:                 return "Created";
        case HTTP_STATUS_CODE::NOT_FOUND:               return "Not Found";
        case HTTP_STATUS_CODE::INTERNAL_SERVER_ERROR:   return "Internal Server Error";
    }
    return "Unknown";
}

minihttp::HTTP_Response minihttp::make_response(HTTP_STATUS_CODE code, std::string body, const std::string &content_type) {
    HTTP_Response response {
        static_cast<int>(code),
        reason_phrase(code),
        {},
        std::move(body)
    };
    if(!content_type.empty()) {
        response.headers["Content-Type"] = content_type;
    }
    return response;
}

std::string minihttp::HTTP_Response::to_string() const {
    std::ostringstream ss;

    // Status line
    ss << "HTTP/1.1 " << status_code << " " << status_message << "\r\n";

    // Content-Length must describe the bytes actually written below
    std::map<std::string, std::string> all_headers = headers;
    all_headers.erase("Content-Length");
    if(!body.empty() || all_headers.count("Content-Type")) {
        all_headers["Content-Length"] = std::to_string(body.size());
    }

    for(const auto &[name, value] : all_headers) {
        ss << name << ": " << value << "\r\n";
    }

    // Empty line separator
    ss << "\r\n";

    ss << body;
    return ss.str();
}
