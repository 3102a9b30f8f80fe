#include "webxfer/path_validator.hpp"

#include <algorithm>
#include <cctype>

namespace webxfer {

namespace {

PathResult path_err(const PathErrorCode &code, const std::string &message) {
    return PathResult::err(PathError{code, message});
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

bool starts_with_dir(const std::string &path, const std::string &dir) {
    if (dir == "/") {
        return path.starts_with("/");
    }
    return path == dir || path.starts_with(dir + "/");
}

std::string strip_trailing_slash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}

const char *path_error_name(const PathErrorCode &code) {
    switch (code) {
        case PathErrorCode::InvalidPath:      return "INVALID_PATH";
        case PathErrorCode::PathTooLong:      return "PATH_TOO_LONG";
        case PathErrorCode::PathTraversal:    return "PATH_TRAVERSAL";
        case PathErrorCode::PathForbidden:    return "PATH_FORBIDDEN";
        case PathErrorCode::ExtensionBlocked: return "EXTENSION_BLOCKED";
    }
    return "INVALID_PATH";
}

std::string normalize_posix(const std::string &path) {
    if (path.empty()) {
        return ".";
    }
    const bool absolute = path.front() == '/';
    const bool trailing = path.back() == '/';

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t pos = path.find('/', start);
        if (pos == std::string::npos) {
            pos = path.size();
        }
        std::string segment = path.substr(start, pos - start);
        start = pos + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.push_back(segment);
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string result = absolute ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += segments[i];
    }
    if (result.empty()) {
        result = ".";
    }
    if (trailing && result != "/") {
        result += '/';
    }
    return result;
}

std::string normalize_path(const std::string &path) {
    // an empty path stays empty so that validating the result still rejects it
    if (path.empty()) {
        return "";
    }
    if (path == ".") {
        return ".";
    }
    if (path == "~" || path == "~/") {
        return "~";
    }
    if (path.starts_with("~/")) {
        // the remainder is relative to home, so extra separators after "~/" do not make it absolute
        size_t first = path.find_first_not_of('/', 2);
        if (first == std::string::npos) {
            return "~";
        }
        std::string rest = normalize_posix(path.substr(first));
        if (rest == "." || rest == "./") {
            return "~";
        }
        return "~/" + rest;
    }
    return normalize_posix(path);
}

bool is_home_relative(const std::string &path) {
    return path == "~" || path.starts_with("~/");
}

bool has_traversal(const std::string &normalized) {
    return normalized.starts_with("..") || normalized.starts_with("~/..");
}

bool is_path_allowed(const std::string &normalized, const std::optional<std::vector<std::string>> &allowed_paths) {
    if (!allowed_paths || allowed_paths->empty()) {
        return true;
    }

    if (is_home_relative(normalized)) {
        for (const auto &allowed : *allowed_paths) {
            if (is_home_relative(allowed)) {
                return true;
            }
        }
    }

    const std::string target = strip_trailing_slash(normalized);
    for (const auto &allowed : *allowed_paths) {
        if (allowed.empty()) {
            continue;
        }
        const std::string prefix = strip_trailing_slash(normalize_path(allowed));
        if (starts_with_dir(target, prefix)) {
            return true;
        }
    }
    return false;
}

std::string base_name(const std::string &path) {
    std::string trimmed = strip_trailing_slash(path);
    if (trimmed == "/") {
        return "";
    }
    size_t pos = trimmed.find_last_of('/');
    if (pos == std::string::npos) {
        return trimmed;
    }
    return trimmed.substr(pos + 1);
}

std::string file_extension(const std::string &path) {
    std::string name = base_name(path);
    size_t dot = name.find_last_of('.');
    // dotfiles such as ".bashrc" carry no extension
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return to_lower(name.substr(dot));
}

bool is_extension_blocked(const std::string &path, const std::vector<std::string> &blocked_extensions) {
    if (blocked_extensions.empty()) {
        return false;
    }
    std::string ext = file_extension(path);
    if (ext.empty()) {
        return false;
    }
    for (const auto &blocked : blocked_extensions) {
        if (blocked.empty()) {
            continue;
        }
        std::string normalized = to_lower(blocked);
        if (normalized.front() != '.') {
            normalized = "." + normalized;
        }
        if (normalized == ext) {
            return true;
        }
    }
    return false;
}

PathResult validate_path(const std::string &path, const PathValidationOptions &options) {
    if (path.empty()) {
        return path_err(PathErrorCode::InvalidPath, "Path is required");
    }
    if (path.find('\0') != std::string::npos) {
        return path_err(PathErrorCode::InvalidPath, "Path contains null byte");
    }
    if (path.size() > options.max_path_length) {
        return path_err(PathErrorCode::PathTooLong, "Path exceeds maximum length of " + std::to_string(options.max_path_length));
    }

    std::string normalized = normalize_path(path);
    if (has_traversal(normalized)) {
        return path_err(PathErrorCode::PathTraversal, "Path traversal is not allowed");
    }
    if (normalized.find('\0') != std::string::npos) {
        return path_err(PathErrorCode::InvalidPath, "Path contains null byte");
    }

    if (!is_path_allowed(normalized, options.allowed_paths)) {
        return path_err(PathErrorCode::PathForbidden, "Access to this path is not allowed");
    }

    if (options.check_extension && is_extension_blocked(normalized, options.blocked_extensions)) {
        return path_err(PathErrorCode::ExtensionBlocked, "File extension " + file_extension(normalized) + " is not allowed");
    }

    return PathResult::ok(normalized);
}

PathResult validate_file_name(const std::string &name) {
    if (name.empty()) {
        return path_err(PathErrorCode::InvalidPath, "File name is required");
    }
    if (name.find('\0') != std::string::npos) {
        return path_err(PathErrorCode::InvalidPath, "File name contains null byte");
    }
    if (name.size() > MAX_FILENAME_LENGTH) {
        return path_err(PathErrorCode::PathTooLong, "File name exceeds maximum length of " + std::to_string(MAX_FILENAME_LENGTH));
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        return path_err(PathErrorCode::InvalidPath, "File name cannot contain path separators");
    }
    if (name == "." || name == "..") {
        return path_err(PathErrorCode::InvalidPath, "Invalid file name");
    }
    return PathResult::ok(name);
}

PathResult join_path_safely(const std::string &base, const std::string &relative) {
    std::string rel = normalize_posix(relative);
    if (rel.starts_with("/") || rel.starts_with("..")) {
        return path_err(PathErrorCode::PathTraversal, "Relative path escapes its base directory");
    }

    std::string joined = normalize_path(base + "/" + relative);
    if (base != "." && base != "~") {
        std::string prefix = strip_trailing_slash(normalize_path(base));
        if (!starts_with_dir(strip_trailing_slash(joined), prefix)) {
            return path_err(PathErrorCode::PathTraversal, "Joined path escapes its base directory");
        }
    }
    return PathResult::ok(joined);
}

}
