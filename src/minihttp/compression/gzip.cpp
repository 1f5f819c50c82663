#include <minihttp/compression/gzip.hpp>
#include <zlib.h>
#include <iostream>

namespace minihttp::compression {
    std::optional<std::string> GzipCompressor::compress(const std::string &data) const {
        z_stream zstream{};
        // 15 + 16: maximum window with a gzip header and trailer
        if(deflateInit2(&zstream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            std::cerr << "Compression error: failed to initialize zlib" << std::endl;
            return std::nullopt;
        }

        zstream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        zstream.avail_in  = static_cast<uInt>(data.size());

        std::string out;
        out.reserve(data.size() / 2 + 32);  // heuristic

        char buffer[GZIP_BUF_LEN];
        int ret;
        do {
            zstream.next_out  = reinterpret_cast<Bytef*>(buffer);
            zstream.avail_out = sizeof(buffer);

            ret = deflate(&zstream, Z_FINISH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                std::cerr << "Compression error: deflate failed: "
                          << (zstream.msg ? zstream.msg : "unknown error") << std::endl;
                deflateEnd(&zstream);
                return std::nullopt;
            }

            std::size_t have = sizeof(buffer) - zstream.avail_out;
            out.append(buffer, have);
        } while (ret != Z_STREAM_END);

        deflateEnd(&zstream);
        return out;
    }
}
