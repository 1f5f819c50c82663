#ifndef MINIHTTP_COMPRESSOR_HPP
#define MINIHTTP_COMPRESSOR_HPP

#include <string>
#include <optional>

namespace minihttp::compression {
    inline constexpr int GZIP_BUF_LEN = 32768; // Output chunk length for deflate
    class Compressor {
    public:
        virtual ~Compressor() = default;
        // Encoded bytes, or std::nullopt when the encoder failed
        virtual std::optional<std::string> compress(const std::string &data) const = 0;
        // Token used both for Accept-Encoding matching and as the Content-Encoding value
        virtual std::string encoding_name() const = 0;
    };
}

#endif
