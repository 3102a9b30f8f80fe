#include "webxfer/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace webxfer {

namespace {

using json = nlohmann::json;

BackendKind parse_backend(const std::string &value) {
    if (value == "sftp") {
        return BackendKind::Sftp;
    }
    if (value == "shell") {
        return BackendKind::Shell;
    }
    if (value == "auto") {
        return BackendKind::Auto;
    }
    throw std::runtime_error("config_invalid: unknown backend '" + value + "' (expected sftp, shell or auto)");
}

std::vector<std::string> split_list(const std::string &value) {
    std::vector<std::string> items;
    std::istringstream iss(value);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::uint64_t parse_number(const char *name, const std::string &value) {
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception &) {
        throw std::runtime_error(std::string("config_invalid: ") + name + " must be a non-negative integer, got '" + value + "'");
    }
}

bool parse_bool(const std::string &value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

void read_sftp(const json &j, SftpConfig &cfg) {
    cfg.enabled = j.value("enabled", cfg.enabled);
    if (j.contains("backend")) {
        cfg.backend = parse_backend(j.at("backend").get<std::string>());
    }
    cfg.max_file_size = j.value("maxFileSize", cfg.max_file_size);
    cfg.rate_limit_bytes_per_sec = j.value("transferRateLimitBytesPerSec", cfg.rate_limit_bytes_per_sec);
    cfg.chunk_size = clamp_chunk_size(j.value("chunkSize", cfg.chunk_size));
    cfg.max_concurrent_transfers = j.value("maxConcurrentTransfers", cfg.max_concurrent_transfers);
    if (j.contains("allowedPaths")) {
        const json &allowed = j.at("allowedPaths");
        if (allowed.is_null()) {
            cfg.allowed_paths.reset();
        } else {
            cfg.allowed_paths = allowed.get<std::vector<std::string>>();
        }
    }
    if (j.contains("blockedExtensions")) {
        cfg.blocked_extensions = j.at("blockedExtensions").get<std::vector<std::string>>();
    }
    cfg.timeout = std::chrono::milliseconds(j.value("timeout", static_cast<std::int64_t>(cfg.timeout.count())));
    cfg.dir_mode = j.value("dirMode", cfg.dir_mode);
    cfg.progress_interval = std::chrono::milliseconds(j.value("progressIntervalMs", static_cast<std::int64_t>(cfg.progress_interval.count())));
    cfg.download_concurrency = j.value("downloadConcurrency", cfg.download_concurrency);
}

void read_ssh(const json &j, SshConfig &cfg) {
    cfg.host = j.value("host", cfg.host);
    cfg.port = j.value("port", cfg.port);
    cfg.username = j.value("username", cfg.username);
    cfg.password = j.value("password", cfg.password);
    cfg.private_key = j.value("privateKey", cfg.private_key);
    cfg.passphrase = j.value("passphrase", cfg.passphrase);
    cfg.known_hosts = j.value("knownHosts", cfg.known_hosts);
}

// A chunk must fit one window of the rate budget or it would never be admitted.
void fit_chunk_to_rate(SftpConfig &cfg) {
    if (cfg.rate_limit_bytes_per_sec == 0 || cfg.chunk_size <= cfg.rate_limit_bytes_per_sec) {
        return;
    }
    if (cfg.rate_limit_bytes_per_sec < MIN_CHUNK_SIZE) {
        throw std::runtime_error("config_invalid: sftp.transferRateLimitBytesPerSec must be 0 or at least " +
                                 std::to_string(MIN_CHUNK_SIZE));
    }
    cfg.chunk_size = static_cast<size_t>(cfg.rate_limit_bytes_per_sec);
}

void check(const ServerConfig &cfg) {
    if (cfg.sftp.max_concurrent_transfers == 0) {
        throw std::runtime_error("config_invalid: sftp.maxConcurrentTransfers must be at least 1");
    }
    if (cfg.sftp.timeout.count() <= 0) {
        throw std::runtime_error("config_invalid: sftp.timeout must be positive");
    }
    if (cfg.sftp.download_concurrency == 0) {
        throw std::runtime_error("config_invalid: sftp.downloadConcurrency must be at least 1");
    }
}

}

const char *backend_kind_name(const BackendKind &kind) {
    switch (kind) {
        case BackendKind::Sftp:  return "sftp";
        case BackendKind::Shell: return "shell";
        case BackendKind::Auto:  return "auto";
    }
    return "sftp";
}

size_t clamp_chunk_size(const size_t &chunk_size) {
    return std::clamp(chunk_size, MIN_CHUNK_SIZE, MAX_CHUNK_SIZE);
}

ServerConfig parse_config(const std::string &json_text) {
    ServerConfig cfg;
    try {
        json j = json::parse(json_text);
        if (j.contains("listen")) {
            cfg.port = j.at("listen").value("port", cfg.port);
        }
        if (j.contains("ssh")) {
            read_ssh(j.at("ssh"), cfg.ssh);
        }
        if (j.contains("sftp")) {
            read_sftp(j.at("sftp"), cfg.sftp);
        }
    } catch (const json::exception &e) {
        throw std::runtime_error(std::string("config_invalid: ") + e.what());
    }
    fit_chunk_to_rate(cfg.sftp);
    check(cfg);
    return cfg;
}

ServerConfig load_config(const std::string &path) {
    std::ifstream infile(path);
    if (!infile) {
        throw std::runtime_error("config_invalid: Failed to open config file (path: " + path + ")");
    }
    std::stringstream buffer;
    buffer << infile.rdbuf();
    return parse_config(buffer.str());
}

void apply_env_overrides(SftpConfig &config, const EnvLookup &lookup) {
    auto get = [&](const char *name) -> std::optional<std::string> {
        const char *value = lookup(name);
        if (!value || !*value) {
            return std::nullopt;
        }
        return std::string(value);
    };

    if (auto v = get("WEBXFER_SFTP_ENABLED")) {
        config.enabled = parse_bool(*v);
    }
    if (auto v = get("WEBXFER_SFTP_BACKEND")) {
        config.backend = parse_backend(*v);
    }
    if (auto v = get("WEBXFER_SFTP_MAX_FILE_SIZE")) {
        config.max_file_size = parse_number("WEBXFER_SFTP_MAX_FILE_SIZE", *v);
    }
    if (auto v = get("WEBXFER_SFTP_RATE_LIMIT")) {
        config.rate_limit_bytes_per_sec = parse_number("WEBXFER_SFTP_RATE_LIMIT", *v);
    }
    if (auto v = get("WEBXFER_SFTP_CHUNK_SIZE")) {
        config.chunk_size = clamp_chunk_size(parse_number("WEBXFER_SFTP_CHUNK_SIZE", *v));
    }
    if (auto v = get("WEBXFER_SFTP_MAX_CONCURRENT_TRANSFERS")) {
        config.max_concurrent_transfers = parse_number("WEBXFER_SFTP_MAX_CONCURRENT_TRANSFERS", *v);
        if (config.max_concurrent_transfers == 0) {
            throw std::runtime_error("config_invalid: WEBXFER_SFTP_MAX_CONCURRENT_TRANSFERS must be at least 1");
        }
    }
    if (auto v = get("WEBXFER_SFTP_ALLOWED_PATHS")) {
        config.allowed_paths = split_list(*v);
    }
    if (auto v = get("WEBXFER_SFTP_BLOCKED_EXTENSIONS")) {
        config.blocked_extensions = split_list(*v);
    }
    if (auto v = get("WEBXFER_SFTP_TIMEOUT")) {
        config.timeout = std::chrono::milliseconds(parse_number("WEBXFER_SFTP_TIMEOUT", *v));
        if (config.timeout.count() <= 0) {
            throw std::runtime_error("config_invalid: WEBXFER_SFTP_TIMEOUT must be positive");
        }
    }
    fit_chunk_to_rate(config);
}

}
