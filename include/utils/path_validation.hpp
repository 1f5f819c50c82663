#ifndef MINIHTTP_PATH_VALIDATION_HPP
#define MINIHTTP_PATH_VALIDATION_HPP

#include <filesystem>
#include <string>
namespace minihttp::path_validation {
    // True when path lies strictly below directory. Purely lexical, neither needs to exist.
    bool is_path_inside_directory(const std::filesystem::path& path, const std::filesystem::path& directory);
    // root/requested, or std::runtime_error if that escapes root
    std::string validate_file_path(const std::string& directory_root, const std::string& requested_path);
}

#endif
