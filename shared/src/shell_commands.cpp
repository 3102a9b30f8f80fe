#include "webxfer/shell_commands.hpp"
#include "webxfer/path_validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace webxfer {

namespace {

const std::array<std::string, 12> MONTHS = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"
};

std::string trim(const std::string &str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split_fields(const std::string &line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }
    return fields;
}

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::optional<long long> parse_int(const std::string &str) {
    if (str.empty() || !std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return std::stoll(str);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

// start of the name column: after exactly eight whitespace separated fields
size_t name_start(const std::string &line) {
    size_t pos = 0;
    for (int field = 0; field < 8; ++field) {
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) {
            return std::string::npos;
        }
        pos = line.find_first_of(" \t", pos);
        if (pos == std::string::npos) {
            return std::string::npos;
        }
    }
    return line.find_first_not_of(" \t", pos);
}

EntryType type_from_char(const char &c) {
    switch (c) {
        case 'd': return EntryType::Directory;
        case 'l': return EntryType::Symlink;
        case '-': return EntryType::File;
        default:  return EntryType::Other;
    }
}

std::string dir_name(const std::string &path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

}

std::string escape_shell_path(const std::string &path) {
    std::string escaped = "'";
    for (char c : path) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped += c;
        }
    }
    escaped += "'";
    return escaped;
}

std::string build_list_command(const std::string &path, const bool &show_hidden) {
    return std::string("ls ") + (show_hidden ? "-laA -- " : "-la -- ") + escape_shell_path(path);
}

std::string build_stat_command(const std::string &path) {
    return "ls -lad -- " + escape_shell_path(path);
}

std::string build_home_command() {
    return "echo ~";
}

std::string build_mkdir_command(const std::string &path, const std::uint32_t &mode) {
    std::ostringstream oss;
    oss << "mkdir -m " << std::oct << (mode & 07777) << " -- " << escape_shell_path(path);
    return oss.str();
}

std::string build_remove_file_command(const std::string &path) {
    return "rm -f -- " + escape_shell_path(path);
}

std::string build_remove_dir_command(const std::string &path, const bool &recursive) {
    if (recursive) {
        return "rm -rf -- " + escape_shell_path(path);
    }
    return "rmdir -- " + escape_shell_path(path);
}

std::string build_read_command(const std::string &path) {
    return "cat -- " + escape_shell_path(path);
}

std::string build_write_command(const std::string &path, const bool &overwrite) {
    // noclobber makes the redirection fail when the target already exists
    if (overwrite) {
        return "cat > " + escape_shell_path(path);
    }
    return "set -C; cat > " + escape_shell_path(path);
}

std::string resolve_home_path(const std::string &stdout_text) {
    return trim(stdout_text);
}

std::uint32_t parse_permission_string(const std::string &perm) {
    std::uint32_t octal = 0;
    for (size_t i = 0; i < 9 && i + 1 < perm.size(); ++i) {
        char c = perm[i + 1];
        if (c != '-') {
            octal |= 0400u >> i;
        }
    }
    return octal;
}

std::string parse_ls_date(const std::string &month, const std::string &day, const std::string &time_or_year, const std::time_t &now) {
    std::string lower = month;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    auto it = std::find(MONTHS.begin(), MONTHS.end(), lower);
    auto day_num = parse_int(day);
    if (it == MONTHS.end() || !day_num) {
        return iso_time(0);
    }

    std::tm tm{};
    tm.tm_mon = static_cast<int>(it - MONTHS.begin());
    tm.tm_mday = static_cast<int>(*day_num);

    size_t colon = time_or_year.find(':');
    if (colon != std::string::npos) {
        // "HH:MM" means within the last six months
        std::tm now_tm{};
        gmtime_r(&now, &now_tm);
        tm.tm_year = now_tm.tm_year;
        tm.tm_hour = static_cast<int>(parse_int(time_or_year.substr(0, colon)).value_or(0));
        tm.tm_min = static_cast<int>(parse_int(time_or_year.substr(colon + 1)).value_or(0));
        std::time_t t = timegm(&tm);
        if (t > now) {
            tm.tm_year -= 1;
            t = timegm(&tm);
        }
        return iso_time(t);
    }

    auto year = parse_int(time_or_year);
    if (!year) {
        return iso_time(0);
    }
    tm.tm_year = static_cast<int>(*year) - 1900;
    return iso_time(timegm(&tm));
}

std::optional<FileEntry> parse_ls_line(const std::string &line, const std::string &base_path, const std::time_t &now) {
    std::vector<std::string> fields = split_fields(line);
    if (fields.size() < 9 || fields[0].size() < 10) {
        return std::nullopt;
    }

    size_t start = name_start(line);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    std::string name = trim(line.substr(start));
    size_t arrow = name.find(" -> ");
    if (arrow != std::string::npos) {
        name = name.substr(0, arrow);
    }

    const std::string &perm = fields[0];
    FileEntry entry;
    entry.name = name;
    entry.path = (base_path == "/" || base_path == ".") ? "/" + name : join_remote(base_path, name);
    entry.type = type_from_char(perm[0]);
    entry.size = static_cast<std::uint64_t>(parse_int(fields[4]).value_or(0));
    entry.permissions = perm.substr(1, 9);
    entry.permissions_octal = parse_permission_string(perm);
    entry.owner = fields[2];
    entry.group = fields[3];
    entry.modified_at = parse_ls_date(fields[5], fields[6], fields[7], now);
    // ls does not report access time
    entry.accessed_at = entry.modified_at;
    entry.is_hidden = name.starts_with(".");
    return entry;
}

std::vector<FileEntry> parse_directory_listing(const std::string &stdout_text, const std::string &base_path, const std::time_t &now) {
    std::vector<FileEntry> entries;
    for (const auto &raw : split_lines(stdout_text)) {
        std::string line = trim(raw);
        if (line.empty() || line.starts_with("total ")) {
            continue;
        }
        auto entry = parse_ls_line(line, base_path, now);
        if (!entry || entry->name == "." || entry->name == "..") {
            continue;
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}

std::optional<FileEntry> parse_stat_entry(const std::string &stdout_text, const std::string &path, const std::time_t &now) {
    for (const auto &raw : split_lines(stdout_text)) {
        std::string line = trim(raw);
        if (line.empty() || line.starts_with("total ")) {
            continue;
        }
        auto entry = parse_ls_line(line, dir_name(path), now);
        if (entry) {
            // ls -lad prints the operand, not the basename
            entry->path = path;
            entry->name = base_name(path);
            entry->is_hidden = entry->name.starts_with(".");
            return entry;
        }
    }
    return std::nullopt;
}

}
