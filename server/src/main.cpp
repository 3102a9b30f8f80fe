#include <iostream>
#include <string>
#include <cstdint>
#include <cstdlib>

#include <libssh2.h>
#include <sodium.h>

#include "webxfer/config.hpp"
#include "webxfer/version.hpp"
#include "simple_server.hpp"

int main(int argc, char* argv[]) {
    // Echo full command line once for diagnostics
    std::cout << "[cmd]";
    for (int i = 0; i < argc; ++i) {
        std::cout << " \"" << argv[i] << '"';
    }
    std::cout << std::endl;

    std::string config_path = "";
    int port = -1;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            port = std::stoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = std::string(argv[++i]);
        }
    }

    webxfer::ServerConfig config;
    try {
        if (!config_path.empty()) {
            config = webxfer::load_config(config_path);
        }
        webxfer::apply_env_overrides(config.sftp, [](const char *name) { return std::getenv(name); });
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    if (port > 0) {
        config.port = static_cast<std::uint16_t>(port);
    }

    if (sodium_init() < 0) {
        std::cerr << "Error: failed to initialize libsodium" << std::endl;
        return 1;
    }
    if (libssh2_init(0) != 0) {
        std::cerr << "Error: failed to initialize libssh2" << std::endl;
        return 1;
    }

    std::cout << "Starting webxfer server (version " << webxfer::version() << ") on port " << config.port
              << ", upstream " << config.ssh.username << "@" << config.ssh.host << ":" << config.ssh.port << std::endl;
    start_simple_server(config);
    libssh2_exit();
    std::cout << "Server exited." << std::endl;
    return 0;
}
