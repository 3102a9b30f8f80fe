#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace webxfer {

constexpr size_t TMP_BUFF_SIZE = 64 * 1024; // 64 KB receive buffer
constexpr size_t MAX_MESSAGE_SIZE = 4 * 1024 * 1024;

// "<len> <msg>" framing over a connected socket. Throws runtime_error("code: message").
size_t receive_length_prefix(const int &fd);
const std::string recv_msg(const int &fd);
void send_msg(const int &fd, const std::string &msg);

std::string base64_encode(const std::string &data);
// Standard alphabet with padding; nullopt on malformed input.
std::optional<std::string> base64_decode(const std::string &text);

std::string generate_transfer_id();
bool is_valid_transfer_id(const std::string &id);

}
