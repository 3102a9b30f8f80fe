#pragma once

#include "remote.hpp"

#include <cstdint>
#include <string>

namespace webxfer {

enum class EntryType {
    File,
    Directory,
    Symlink,
    Other
};

const char *entry_type_name(const EntryType &type);

struct FileEntry {
    std::string name;
    std::string path;
    EntryType type = EntryType::Other;
    std::uint64_t size = 0;
    std::string permissions;             // "rwxr-xr-x"
    std::uint32_t permissions_octal = 0; // mode & 0777
    std::string owner;
    std::string group;
    std::string modified_at;             // ISO-8601 UTC
    std::string accessed_at;
    bool is_hidden = false;
};

EntryType entry_type_from_mode(const std::uint32_t &mode);
std::string permissions_string(const std::uint32_t &mode);
std::string iso_time(const std::int64_t &epoch_seconds);
std::string join_remote(const std::string &dir, const std::string &name);

FileEntry entry_from_attributes(const std::string &name, const std::string &path, const RemoteAttributes &attrs);

}
