#include "webxfer/mime.hpp"
#include "webxfer/path_validator.hpp"

#include <unordered_map>

namespace webxfer {

namespace {

const std::unordered_map<std::string, std::string> MIME_TYPES = {
    // text
    {".txt", "text/plain"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".css", "text/css"},
    {".js", "text/javascript"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".csv", "text/csv"},
    {".md", "text/markdown"},
    {".yaml", "text/yaml"},
    {".yml", "text/yaml"},
    // images
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".ico", "image/x-icon"},
    // archives
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".tar", "application/x-tar"},
    {".tgz", "application/gzip"},
    {".7z", "application/x-7z-compressed"},
    {".rar", "application/vnd.rar"},
    // documents
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    // scripts
    {".sh", "application/x-sh"},
    {".bash", "application/x-sh"},
    {".py", "text/x-python"},
    {".rb", "text/x-ruby"},
    {".php", "text/x-php"},
    {".ts", "text/typescript"},
    {".tsx", "text/typescript"},
};

}

std::string mime_type_for(const std::string &file_name) {
    auto it = MIME_TYPES.find(file_extension(file_name));
    if (it == MIME_TYPES.end()) {
        return DEFAULT_MIME_TYPE;
    }
    return it->second;
}

}
