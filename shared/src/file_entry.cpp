#include "webxfer/file_entry.hpp"

#include <ctime>

namespace webxfer {

const char *entry_type_name(const EntryType &type) {
    switch (type) {
        case EntryType::File:      return "file";
        case EntryType::Directory: return "directory";
        case EntryType::Symlink:   return "symlink";
        case EntryType::Other:     return "other";
    }
    return "other";
}

EntryType entry_type_from_mode(const std::uint32_t &mode) {
    switch (mode & 0170000) {
        case 0040000: return EntryType::Directory;
        case 0100000: return EntryType::File;
        case 0120000: return EntryType::Symlink;
        default:      return EntryType::Other;
    }
}

std::string permissions_string(const std::uint32_t &mode) {
    static const char flags[] = "rwxrwxrwx";
    std::string result(9, '-');
    for (int i = 0; i < 9; ++i) {
        if (mode & (0400u >> i)) {
            result[static_cast<size_t>(i)] = flags[i];
        }
    }
    return result;
}

std::string iso_time(const std::int64_t &epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm{};
    if (!gmtime_r(&t, &tm)) {
        return "1970-01-01T00:00:00.000Z";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S.000Z", &tm);
    return buf;
}

std::string join_remote(const std::string &dir, const std::string &name) {
    if (dir.empty() || dir == ".") {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

FileEntry entry_from_attributes(const std::string &name, const std::string &path, const RemoteAttributes &attrs) {
    FileEntry entry;
    entry.name = name;
    entry.path = path;
    entry.type = entry_type_from_mode(attrs.mode);
    entry.size = attrs.size;
    entry.permissions = permissions_string(attrs.mode);
    entry.permissions_octal = attrs.mode & 0777;
    entry.owner = std::to_string(attrs.uid);
    entry.group = std::to_string(attrs.gid);
    entry.modified_at = iso_time(attrs.mtime);
    entry.accessed_at = iso_time(attrs.atime);
    entry.is_hidden = name.starts_with(".");
    return entry;
}

}
