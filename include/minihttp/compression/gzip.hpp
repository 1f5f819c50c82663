#ifndef MINIHTTP_GZIP_HPP
#define MINIHTTP_GZIP_HPP
#include "compressor.hpp"

namespace minihttp::compression {
    class GzipCompressor: public Compressor {
    public:
        std::optional<std::string> compress(const std::string &data) const override;
        std::string encoding_name() const override {
            return "gzip";
        }
    };
}

#endif
