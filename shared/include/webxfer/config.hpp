#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace webxfer {

constexpr size_t MIN_CHUNK_SIZE = 1024;
constexpr size_t MAX_CHUNK_SIZE = 1024 * 1024;
constexpr size_t MAX_DIRECTORY_ENTRIES = 10000;

enum class BackendKind {
    Sftp,
    Shell,
    Auto
};

const char *backend_kind_name(const BackendKind &kind);

struct SftpConfig {
    bool enabled = false;
    BackendKind backend = BackendKind::Sftp;
    std::uint64_t max_file_size = 100 * 1024 * 1024;
    std::uint64_t rate_limit_bytes_per_sec = 0;
    size_t chunk_size = 32 * 1024;
    size_t max_concurrent_transfers = 2;
    std::optional<std::vector<std::string>> allowed_paths;
    std::vector<std::string> blocked_extensions;
    std::chrono::milliseconds timeout{30000};
    std::uint32_t dir_mode = 0755;
    std::chrono::milliseconds progress_interval{250};
    size_t download_concurrency = 8;
    size_t max_directory_entries = MAX_DIRECTORY_ENTRIES;
};

struct SshConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 22;
    std::string username;
    std::string password;
    std::string private_key;
    std::string passphrase;
    std::string known_hosts;
};

struct ServerConfig {
    std::uint16_t port = 9000;
    SshConfig ssh;
    SftpConfig sftp;
};

using EnvLookup = std::function<const char *(const char *)>;

size_t clamp_chunk_size(const size_t &chunk_size);

// Parses a JSON configuration document. Throws std::runtime_error("config_invalid: ...").
ServerConfig parse_config(const std::string &json_text);
ServerConfig load_config(const std::string &path);
void apply_env_overrides(SftpConfig &config, const EnvLookup &lookup);

}
