#include "lostore/bindings/mime.hpp"

#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace lostore::bindings::http {

namespace {

using Entry = std::pair<std::string_view, std::string_view>;

// Shorthand archive suffixes.
constexpr std::array<std::pair<std::string_view, std::string_view>, 5> kAliases{{
    {".tgz", ".tar.gz"},
    {".taz", ".tar.gz"},
    {".tz", ".tar.gz"},
    {".tbz2", ".tar.bz2"},
    {".txz", ".tar.xz"},
}};

// Case-sensitive; ".Z" and ".z" are different things.
constexpr std::array<Entry, 5> kEncodings{{
    {".gz", "gzip"},
    {".Z", "compress"},
    {".bz2", "bzip2"},
    {".xz", "xz"},
    {".br", "br"},
}};

constexpr std::array<Entry, 44> kTypes{{
    {".txt", "text/plain"},
    {".text", "text/plain"},
    {".log", "text/plain"},
    {".csv", "text/csv"},
    {".htm", "text/html"},
    {".html", "text/html"},
    {".css", "text/css"},
    {".js", "text/javascript"},
    {".mjs", "text/javascript"},
    {".xml", "text/xml"},
    {".md", "text/markdown"},
    {".json", "application/json"},
    {".pdf", "application/pdf"},
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".wasm", "application/wasm"},
    {".bin", "application/octet-stream"},
    {".doc", "application/msword"},
    {".xls", "application/vnd.ms-excel"},
    {".ppt", "application/vnd.ms-powerpoint"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".odt", "application/vnd.oasis.opendocument.text"},
    {".rtf", "application/rtf"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".ico", "image/vnd.microsoft.icon"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".mp3", "audio/mpeg"},
    {".wav", "audio/x-wav"},
    {".ogg", "audio/ogg"},
    {".flac", "audio/flac"},
    {".mp4", "video/mp4"},
    {".mpeg", "video/mpeg"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},
    {".avi", "video/x-msvideo"},
    {".woff2", "font/woff2"},
}};

std::string_view base_name(std::string_view name) {
    const auto slash = name.find_last_of("/\\");
    return slash == std::string_view::npos ? name : name.substr(slash + 1);
}

// Last dot-suffix, or empty. A leading dot is part of the name.
std::string_view last_suffix(std::string_view base) {
    const auto dot = base.rfind('.');
    if (dot == std::string_view::npos || dot == 0) {
        return {};
    }
    return base.substr(dot);
}

std::string_view lookup(const auto& table, std::string_view key) {
    for (const auto& [ext, value] : table) {
        if (ext == key) return value;
    }
    return {};
}

} // namespace

ContentType guess_content_type(std::string_view name) noexcept {
    ContentType out{};
    std::string base(base_name(name));

    std::string_view ext = last_suffix(base);
    if (std::string_view alias = lookup(kAliases, ext); !alias.empty()) {
        base.resize(base.size() - ext.size());
        base.append(alias);
        ext = last_suffix(base);
    }

    if (std::string_view enc = lookup(kEncodings, ext); !enc.empty()) {
        out.encoding = enc;
        base.resize(base.size() - ext.size());
        ext = last_suffix(base);
    }

    if (ext.empty()) {
        return out;
    }
    std::string_view type = lookup(kTypes, ext);
    if (type.empty()) {
        std::string lower(ext);
        for (char& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        type = lookup(kTypes, lower);
    }
    if (!type.empty()) {
        out.type = type;
    }
    return out;
}

} // namespace lostore::bindings::http
