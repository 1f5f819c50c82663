#ifndef MINIHTTP_FILE_UTILS_HPP
#define MINIHTTP_FILE_UTILS_HPP

#include <string>
#include <optional>
namespace minihttp::file_utils {
    // Read an entire regular file into a string; std::nullopt if missing or unreadable
    std::optional<std::string> read_file(const std::string& file_path);

    // Write 'data' into 'path', creating parent directories and overwriting if exists.
    // Throws std::runtime_error or std::filesystem::filesystem_error on failure.
    void save_file(const std::string& path, const std::string& data);
}


#endif
