#pragma once

#include "webxfer/config.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <iostream>

// Serves clients until select() fails. Each client gets its own SSH connection to config.ssh.
void start_simple_server(const webxfer::ServerConfig &config);
