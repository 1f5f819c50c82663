#include <utils/path_validation.hpp>

#include <filesystem>
#include <stdexcept>
#include <iostream>

namespace minihttp::path_validation {
    bool is_path_inside_directory(const std::filesystem::path& path, const std::filesystem::path& directory) {
        std::filesystem::path abs_directory = std::filesystem::absolute(directory).lexically_normal();
        std::filesystem::path abs_path = std::filesystem::absolute(path).lexically_normal();

        // "/srv/files/" iterates with a trailing empty element
        if (!abs_directory.has_filename()) {
            abs_directory = abs_directory.parent_path();
        }
        if (!abs_path.has_filename()) {
            abs_path = abs_path.parent_path();
        }

        // Compare paths to check if abs_path starts with abs_directory
        auto it1 = abs_path.begin();
        auto it2 = abs_directory.begin();

        while (it2 != abs_directory.end()) {
            if (it1 == abs_path.end() || *it1 != *it2) {
                return false;
            }
            ++it1;
            ++it2;
        }

        // The directory itself is not inside itself
        return it1 != abs_path.end();
    }

    std::string validate_file_path(const std::string& directory_root, const std::string& requested_path) {
        std::filesystem::path root_path = directory_root;
        std::filesystem::path full_path = root_path / requested_path;

        if (requested_path.empty() || !is_path_inside_directory(full_path, root_path)) {
            std::cerr << "Path validation error: rejected " << requested_path << std::endl;
            throw std::runtime_error("Directory traversal attempt detected");
        }

        return full_path.string();
    }
}
