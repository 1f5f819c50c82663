#ifndef MINIHTTP_RESPONSE_HPP
#define MINIHTTP_RESPONSE_HPP

#include <minihttp/status.hpp>  // HTTP_STATUS_CODE
#include <string>
#include <map>

namespace minihttp {
    struct HTTP_Response {
        int status_code;
        std::string status_message;
        std::map<std::string, std::string> headers;
        std::string body;

        // Serialize to wire format. Content-Length is always recomputed from body.
        std::string to_string() const;
    };

    HTTP_Response make_response(HTTP_STATUS_CODE code, std::string body = "", const std::string &content_type = "");
}
#endif
