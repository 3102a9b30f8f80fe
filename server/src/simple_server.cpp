#include "simple_server.hpp"
#include "session.hpp"
#include "webxfer/helpers.hpp"

#include <sys/select.h>

#include <algorithm>
#include <unordered_map>
#include <vector>

using namespace webxfer;

namespace {

// select() timeout while an SSH connection has calls in flight
constexpr std::chrono::milliseconds BUSY_POLL_INTERVAL{20};

int create_listen_socket(std::uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        std::perror("socket");
        return -1;
    }

    int enable = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
        std::perror("setsockopt");
        ::close(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::perror("bind");
        ::close(fd);
        return -1;
    }

    if (::listen(fd, 8) < 0) {
        std::perror("listen");
        ::close(fd);
        return -1;
    }
    return fd;
}

std::shared_ptr<SshConnection> open_ssh(const SshConfig &config) {
    try {
        return SshConnection::connect(config);
    } catch (const std::exception &e) {
        // the session still starts; file operations answer SFTP_NO_CONNECTION
        std::cerr << "[server] " << e.what() << std::endl;
        return nullptr;
    }
}

timeval select_timeout(const TimerQueue &timers, const bool &busy) {
    std::chrono::milliseconds wait{1000};
    if (auto deadline = timers.nextDeadline()) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - TimerQueue::Clock::now());
        wait = std::clamp(until, std::chrono::milliseconds(0), wait);
    }
    if (busy) {
        wait = std::min(wait, BUSY_POLL_INTERVAL);
    }
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(wait.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((wait.count() % 1000) * 1000);
    return tv;
}

}

void start_simple_server(const ServerConfig &config) {
    // create listen socket
    int listen_fd = create_listen_socket(config.port);
    if (listen_fd < 0) {
        std::cerr << "[server] failed to set up listen socket on port " << config.port << std::endl;
        return;
    }
    std::cout << "[server] listening on port " << config.port << std::endl;

    TimerQueue timers;
    std::unordered_map<int, std::shared_ptr<Session>> sessions;
    std::unordered_map<std::string, std::shared_ptr<SshConnection>> connections;

    TransferService service(config.sftp, [&connections](const std::string &connection_id) -> std::shared_ptr<RemoteConnection> {
        auto it = connections.find(connection_id);
        return it == connections.end() ? nullptr : it->second;
    }, timers);

    // main server loop
    std::vector<int> toClose;
    while (true) {
        toClose.clear();

        // add client and ssh fds to sets
        fd_set readfds;
        fd_set writefds;
        FD_ZERO(&readfds);
        FD_ZERO(&writefds);
        FD_SET(listen_fd, &readfds);
        int maxfd = listen_fd;
        bool busy = false;
        for (auto &p : sessions) {
            FD_SET(p.first, &readfds);
            maxfd = std::max(maxfd, p.first);
        }
        for (auto &p : connections) {
            int ssh_fd = p.second->socket();
            FD_SET(ssh_fd, &readfds);
            if (p.second->wantsWrite()) {
                FD_SET(ssh_fd, &writefds);
            }
            busy = busy || p.second->busy();
            maxfd = std::max(maxfd, ssh_fd);
        }

        // wait for event or the next timer
        timeval tv = select_timeout(timers, busy);
        int activity = ::select(maxfd + 1, &readfds, &writefds, nullptr, &tv);
        if (activity < 0) {
            if (errno == EINTR) continue;
            std::perror("select");
            break;
        }

        // new client -> connect upstream and create session
        if (FD_ISSET(listen_fd, &readfds)) {
            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client_fd < 0) {
                std::perror("accept");
            } else {
                char ipbuf[INET_ADDRSTRLEN];
                const char* ipstr = ::inet_ntop(AF_INET, &client_addr.sin_addr, ipbuf, sizeof(ipbuf));
                if (ipstr) {
                    std::cout << "[server] client connected from " << ipstr << ":" << ntohs(client_addr.sin_port) << " (fd=" << client_fd << ")" << std::endl;
                }

                std::string connection_id = "c-" + generate_transfer_id();
                auto ssh = config.sftp.enabled ? open_ssh(config.ssh) : nullptr;
                if (ssh) {
                    connections.emplace(connection_id, ssh);
                }
                sessions.emplace(client_fd, std::make_shared<Session>(client_fd, connection_id, ssh, service, [&toClose](int fd) {
                    toClose.push_back(fd);
                }));
            }
        }

        // existing client sent message -> read and process
        for (auto &p : sessions) {
            int fd = p.first;
            if (!FD_ISSET(fd, &readfds)) {
                continue;
            }
            std::string msg;
            try {
                msg = recv_msg(fd);
            } catch (const std::exception &e) {
                if (std::string(e.what()).find("connection_closed") != std::string::npos) {
                    std::cout << "[server] client fd=" << fd << " disconnected" << std::endl;
                } else {
                    std::cerr << "[server] error receiving message from client fd=" << fd << ": " << e.what() << std::endl;
                }
                // a broken frame leaves the stream unusable
                toClose.push_back(fd);
                continue;
            }
            p.second->onMessage(msg);
        }

        // drive remote I/O and timers
        auto live = connections;
        for (auto &p : live) {
            p.second->poll();
        }
        timers.runDue(TimerQueue::Clock::now());

        // close disconnected sessions
        std::sort(toClose.begin(), toClose.end());
        toClose.erase(std::unique(toClose.begin(), toClose.end()), toClose.end());
        for (int fd : toClose) {
            auto it = sessions.find(fd);
            if (it == sessions.end()) {
                continue;
            }
            std::string connection_id = it->second->getConnectionId();
            sessions.erase(it);
            connections.erase(connection_id);
            ::close(fd);
        }
    }

    sessions.clear();
    service.shutdown();
    connections.clear();
    ::close(listen_fd);
}
