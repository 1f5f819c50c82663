#ifndef MINIHTTP_REGISTRY_HPP
#define MINIHTTP_REGISTRY_HPP
#include "compressor.hpp"
#include <memory>
#include <vector>

namespace minihttp::compression {
    // Filled once at startup, read-only while connections are served
    class CompressionRegistry {
    public:
        void register_compressor(std::unique_ptr<Compressor> compressor);
        // First registered compressor whose name occurs in accept_encodings, or nullptr
        const Compressor* select_compressor(const std::string &accept_encodings) const;
    private:
        std::vector<std::unique_ptr<Compressor>> compressors;
    };
}

#endif
