#ifndef MINIHTTP_ROUTER_HPP
#define MINIHTTP_ROUTER_HPP

#include <minihttp/request.hpp>  // HTTP_Request
#include <minihttp/response.hpp> // HTTP_Response
#include <memory>                // std::unique_ptr
#include <string>
#include <unordered_map>
#include <vector>

namespace minihttp {
    // Non-empty path segments, e.g. "/files/a.txt" -> {"files", "a.txt"}
    using Segments = std::vector<std::string>;

    class RequestHandler {
    public:
        virtual ~RequestHandler() = default;
        virtual HTTP_Response handle(const HTTP_Request &request, const Segments &segments) const = 0;
    };

    // Dispatches on the first path segment. Routes are added before serving starts
    // and never change afterwards, so dispatch() is safe from any thread.
    class Router {
        private:
            std::unordered_map<std::string, std::unique_ptr<RequestHandler>> routes;
        public:
            HTTP_Response dispatch(const HTTP_Request &request) const;
            void add_route(const std::string &segment, std::unique_ptr<RequestHandler> handler);
            static Segments split_path(const std::string &path);
    };
}

#endif
