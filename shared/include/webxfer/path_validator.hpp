#pragma once

#include "result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace webxfer {

constexpr size_t MAX_PATH_LENGTH = 4096;
constexpr size_t MAX_FILENAME_LENGTH = 255;

enum class PathErrorCode {
    InvalidPath,
    PathTooLong,
    PathTraversal,
    PathForbidden,
    ExtensionBlocked
};

// "INVALID_PATH", "PATH_TRAVERSAL", ...
const char *path_error_name(const PathErrorCode &code);

struct PathError {
    PathErrorCode code;
    std::string message;
};

struct PathValidationOptions {
    // nullopt or empty: every path is allowed
    std::optional<std::vector<std::string>> allowed_paths;
    std::vector<std::string> blocked_extensions;
    bool check_extension = true;
    size_t max_path_length = MAX_PATH_LENGTH;
};

using PathResult = Result<std::string, PathError>;

std::string normalize_posix(const std::string &path);
std::string normalize_path(const std::string &path);

bool is_home_relative(const std::string &path);
bool has_traversal(const std::string &normalized);
bool is_path_allowed(const std::string &normalized, const std::optional<std::vector<std::string>> &allowed_paths);

std::string base_name(const std::string &path);
std::string file_extension(const std::string &path);
bool is_extension_blocked(const std::string &path, const std::vector<std::string> &blocked_extensions);

PathResult validate_path(const std::string &path, const PathValidationOptions &options);
PathResult validate_file_name(const std::string &name);
PathResult join_path_safely(const std::string &base, const std::string &relative);

}
