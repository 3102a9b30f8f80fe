#include "webxfer/helpers.hpp"

#include <sodium.h>
#include <sys/socket.h>

#include <cerrno>
#include <stdexcept>
#include <vector>

namespace webxfer {

namespace {

void ensure_sodium() {
    static const bool ready = [] {
        if (sodium_init() < 0) {
            throw std::runtime_error("sodium_init: Failed to initialize libsodium");
        }
        return true;
    }();
    (void)ready;
}

}

size_t receive_length_prefix(const int &fd) {
    char c = '\0';
    size_t length = 0;
    size_t digits = 0;
    while (true) {
        ssize_t recvd = ::recv(fd, &c, 1, 0);
        if (recvd < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("recv: Failed to receive length");
        }
        if (recvd == 0) {
            throw std::runtime_error("connection_closed: Connection closed by remote node");
        }
        if (c == ' ' && digits > 0) {
            break;
        }
        if (c < '0' || c > '9') {
            throw std::runtime_error("bad_frame: Invalid length prefix");
        }
        length *= 10;
        length += static_cast<size_t>(c - '0');
        digits++;
        if (length > MAX_MESSAGE_SIZE) {
            throw std::runtime_error("message_too_large: Message exceeds " + std::to_string(MAX_MESSAGE_SIZE) + " bytes");
        }
    }
    return length;
}

const std::string recv_msg(const int &fd) {
    std::string result;

    // receive message length
    size_t len = receive_length_prefix(fd);
    result.reserve(len);

    // receive exactly the framed bytes, the next frame stays in the socket
    size_t remaining = len;
    char temp[TMP_BUFF_SIZE];
    while (remaining > 0) {
        ssize_t recvd = ::recv(fd, temp, remaining < sizeof(temp) ? remaining : sizeof(temp), 0);
        if (recvd < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("recv: Failed to receive message");
        }
        if (recvd == 0) {
            throw std::runtime_error("connection_closed: Connection closed by remote node");
        }
        result.append(temp, static_cast<size_t>(recvd));
        remaining -= static_cast<size_t>(recvd);
    }
    return result;
}

void send_msg(const int &fd, const std::string &msg) {
    // add length prefix
    std::string full_msg = std::to_string(msg.size()) + ' ' + msg;

    // send full message
    size_t total_sent = 0;
    while (total_sent < full_msg.size()) {
        ssize_t sent = ::send(fd, full_msg.data() + total_sent, full_msg.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("send: Failed to send message");
        }
        total_sent += static_cast<size_t>(sent);
    }
}

std::string base64_encode(const std::string &data) {
    ensure_sodium();
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::vector<char> out(encoded_len);
    sodium_bin2base64(out.data(), out.size(), reinterpret_cast<const unsigned char *>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    return std::string(out.data());
}

std::optional<std::string> base64_decode(const std::string &text) {
    ensure_sodium();
    if (text.empty()) {
        return std::string();
    }
    std::vector<unsigned char> out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char *end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &bin_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    if (end != text.data() + text.size()) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char *>(out.data()), bin_len);
}

std::string generate_transfer_id() {
    ensure_sodium();
    unsigned char bytes[16];
    randombytes_buf(bytes, sizeof(bytes));
    char hex[sizeof(bytes) * 2 + 1];
    sodium_bin2hex(hex, sizeof(hex), bytes, sizeof(bytes));
    return std::string(hex);
}

bool is_valid_transfer_id(const std::string &id) {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    for (char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

}
