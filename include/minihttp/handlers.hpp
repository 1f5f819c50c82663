#ifndef MINIHTTP_HANDLERS_HPP
#define MINIHTTP_HANDLERS_HPP

#include <minihttp/router.hpp>                  // RequestHandler
#include <minihttp/compression/registry.hpp>    // CompressionRegistry
#include <string>

namespace minihttp {
    // /echo/{text}: replies with text, compressed when the client accepts a registered encoding
    class EchoHandler: public RequestHandler {
    public:
        explicit EchoHandler(const compression::CompressionRegistry &compressors);
        HTTP_Response handle(const HTTP_Request &request, const Segments &segments) const override;
    private:
        const compression::CompressionRegistry &compressors;
    };

    // /user-agent: replies with the User-Agent header
    class UserAgentHandler: public RequestHandler {
    public:
        HTTP_Response handle(const HTTP_Request &request, const Segments &segments) const override;
    };

    // /files/{name}: GET reads, POST writes a file under root_path
    class FilesHandler: public RequestHandler {
    public:
        explicit FilesHandler(std::string root_path);
        HTTP_Response handle(const HTTP_Request &request, const Segments &segments) const override;
    private:
        std::string root_path;

        HTTP_Response download(const std::string &file_path) const;
        HTTP_Response upload(const std::string &file_path, const std::string &content) const;
    };
}

#endif
