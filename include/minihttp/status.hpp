#ifndef MINIHTTP_STATUS_HPP
#define MINIHTTP_STATUS_HPP

#include <string>

namespace minihttp {
    enum class HTTP_STATUS_CODE{
        OK                      = 200,
        CREATED                 = 201,
        NOT_FOUND               = 404,
        INTERNAL_SERVER_ERROR   = 500,
    };

    // Reason phrase sent on the status line
    std::string reason_phrase(HTTP_STATUS_CODE code);
}

#endif
