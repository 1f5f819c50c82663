#include <minihttp/handlers.hpp>
#include <minihttp/status.hpp>
#include <utils/file_utils.hpp>
#include <utils/path_validation.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace minihttp {
    EchoHandler::EchoHandler(const compression::CompressionRegistry &compressors) : compressors(compressors) {}

    HTTP_Response EchoHandler::handle(const HTTP_Request &request, const Segments &segments) const {
        if(segments.size() < 2) {
            return make_response(HTTP_STATUS_CODE::NOT_FOUND);
        }
        const std::string &msg = segments[1];

        if(const auto *c = compressors.select_compressor(request.header("Accept-Encoding"))) {
            if(auto compressed_msg = c->compress(msg)) {
                HTTP_Response response = make_response(HTTP_STATUS_CODE::OK, std::move(*compressed_msg), "text/plain");
                response.headers["Content-Encoding"] = c->encoding_name();
                return response;
            }
        }

        return make_response(HTTP_STATUS_CODE::OK, msg, "text/plain");
    }

    HTTP_Response UserAgentHandler::handle(const HTTP_Request &request, const Segments &) const {
        return make_response(HTTP_STATUS_CODE::OK, request.header("User-Agent"), "text/plain");
    }

    FilesHandler::FilesHandler(std::string root_path) : root_path(std::move(root_path)) {}

    HTTP_Response FilesHandler::handle(const HTTP_Request &request, const Segments &segments) const {
        if(segments.size() < 2) {
            return make_response(HTTP_STATUS_CODE::NOT_FOUND);
        }

        std::string validated_path;
        try {
            validated_path = path_validation::validate_file_path(root_path, segments[1]);
        } catch (const std::runtime_error &) {
            return make_response(HTTP_STATUS_CODE::NOT_FOUND);
        }

        if(request.method == "GET") {
            return download(validated_path);
        }
        if(request.method == "POST") {
            return upload(validated_path, request.body);
        }
        return make_response(HTTP_STATUS_CODE::NOT_FOUND);
    }

    HTTP_Response FilesHandler::download(const std::string &file_path) const {
        if(auto content = file_utils::read_file(file_path)) {
            return make_response(HTTP_STATUS_CODE::OK, std::move(*content), "application/octet-stream");
        }
        return make_response(HTTP_STATUS_CODE::NOT_FOUND);
    }

    HTTP_Response FilesHandler::upload(const std::string &file_path, const std::string &content) const {
        try {
            file_utils::save_file(file_path, content);
        } catch (const std::exception &e) {
            std::cerr << "Error saving file: " << e.what() << std::endl;
            return make_response(HTTP_STATUS_CODE::INTERNAL_SERVER_ERROR);
        }
        std::cout << "File written: " << file_path << " (" << content.size() << " bytes)" << std::endl;
        return make_response(HTTP_STATUS_CODE::CREATED);
    }
}
