#include <minihttp/compression/registry.hpp>
#include <utility>

namespace minihttp::compression {
    void CompressionRegistry::register_compressor(std::unique_ptr<Compressor> compressor) {
        /*
        * Register a compressor. The registry takes ownership; registration order
        * decides priority when several encodings are accepted.
        */
        compressors.push_back(std::move(compressor));
    }

    const Compressor* CompressionRegistry::select_compressor(const std::string &accept_encodings) const {
        /*
        * Choose a compressor based on the Accept-Encoding header.
        * Matching is a plain substring search; quality values are not interpreted.
        */
        for (const auto &compressor : compressors) {
            if (accept_encodings.find(compressor->encoding_name()) != std::string::npos) {
                return compressor.get();
            }
        }
        return nullptr;
    }
}
