#include <utils/file_utils.hpp>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <iterator>         // std::istreambuf_iterator
#include <stdexcept>

namespace minihttp::file_utils {
    std::optional<std::string> read_file(const std::string& file_path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            return std::nullopt;
        }

        std::ifstream file{file_path, std::ios::binary};
        if(!file) {
            std::cerr << "Error reading file: failed to open " << file_path << std::endl;
            return std::nullopt;
        }

        std::string content {
            std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()
        };
        if(file.bad()) {
            std::cerr << "Error reading file: " << file_path << std::endl;
            return std::nullopt;
        }
        return content;
    }

    void save_file(const std::string& file_path, const std::string& content) {
        std::filesystem::path parent_path = std::filesystem::path(file_path).parent_path();

        // Create directories if they don't exist. create_directories is a no-op for existing ones.
        if (!parent_path.empty()) {
            std::filesystem::create_directories(parent_path);
        }

        std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
        if(!file) {
            throw std::runtime_error("Failed to open file for writing: " + file_path);
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.close();
        if(!file) {
            throw std::runtime_error("Failed to write to file: " + file_path);
        }
    }
}
