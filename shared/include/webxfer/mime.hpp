#pragma once

#include <string>

namespace webxfer {

constexpr const char *DEFAULT_MIME_TYPE = "application/octet-stream";

std::string mime_type_for(const std::string &file_name);

}
