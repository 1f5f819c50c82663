#include <minihttp/router.hpp>
#include <minihttp/status.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

void minihttp::Router::add_route(const std::string &segment, std::unique_ptr<RequestHandler> handler) {
    std::cout << "Registering route: /" << segment << std::endl;
    routes[segment] = std::move(handler);
}

// Empty segments are dropped, so "/echo//x" echoes "x" instead of an empty text
minihttp::Segments minihttp::Router::split_path(const std::string &path) {
    Segments segments;
    size_t start = 0;
    while(start <= path.size()) {
        size_t end = path.find('/', start);
        if(end == std::string::npos) {
            end = path.size();
        }
        if(end > start) {
            segments.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return segments;
}

minihttp::HTTP_Response minihttp::Router::dispatch(const HTTP_Request &request) const {
    if(request.path.empty() || request.path == "/") {
        return make_response(HTTP_STATUS_CODE::OK);
    }

    Segments segments = split_path(request.path);
    if(segments.empty()) {
        return make_response(HTTP_STATUS_CODE::NOT_FOUND);
    }

    auto it = routes.find(segments.front());
    if(it == routes.end()) {
        return make_response(HTTP_STATUS_CODE::NOT_FOUND);
    }

    try {
        return it->second->handle(request, segments);
    } catch (const std::exception& e) {
        std::cerr << "Error dispatching request: " << e.what() << std::endl;
        return make_response(HTTP_STATUS_CODE::INTERNAL_SERVER_ERROR);
    }
}
