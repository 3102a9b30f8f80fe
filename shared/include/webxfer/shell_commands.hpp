#pragma once

#include "file_entry.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace webxfer {

// Wraps a path in single quotes for a POSIX shell.
std::string escape_shell_path(const std::string &path);

std::string build_list_command(const std::string &path, const bool &show_hidden);
std::string build_stat_command(const std::string &path);
std::string build_home_command();
std::string build_mkdir_command(const std::string &path, const std::uint32_t &mode);
std::string build_remove_file_command(const std::string &path);
std::string build_remove_dir_command(const std::string &path, const bool &recursive);
std::string build_read_command(const std::string &path);
std::string build_write_command(const std::string &path, const bool &overwrite);

std::string resolve_home_path(const std::string &stdout_text);

std::uint32_t parse_permission_string(const std::string &perm);
std::string parse_ls_date(const std::string &month, const std::string &day, const std::string &time_or_year, const std::time_t &now);

std::optional<FileEntry> parse_ls_line(const std::string &line, const std::string &base_path, const std::time_t &now);
std::vector<FileEntry> parse_directory_listing(const std::string &stdout_text, const std::string &base_path, const std::time_t &now);
std::optional<FileEntry> parse_stat_entry(const std::string &stdout_text, const std::string &path, const std::time_t &now);

}
