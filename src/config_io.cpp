#include "config_io.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {
// Helper to split option path "remote:url" -> ["remote", "url"]
std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, ':')) {
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r");
    return str.substr(start, end - start + 1);
}

struct OpenKey {
    size_t indent;
    std::string name;
};
}  // namespace

size_t ConfigIO::getIndent(const std::string& line) {
    size_t indent = 0;
    while (indent < line.size() && line[indent] == ' ') {
        ++indent;
    }
    return indent;
}

std::string ConfigIO::quote(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        switch (c) {
            case '"': quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\n': quoted += "\\n"; break;
            case '\r': quoted += "\\r"; break;
            case '\t': quoted += "\\t"; break;
            default: {
                unsigned char byte = static_cast<unsigned char>(c);
                if (byte < 0x20 || byte == 0x7F) {
                    static const char hex[] = "0123456789ABCDEF";
                    quoted += "\\x";
                    quoted += hex[byte >> 4];
                    quoted += hex[byte & 0x0F];
                } else {
                    quoted += c;
                }
                break;
            }
        }
    }
    quoted += '"';
    return quoted;
}

std::string ConfigIO::unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
        std::string out;
        const std::string inner = value.substr(1, value.size() - 2);
        for (size_t i = 0; i < inner.size(); ++i) {
            out += inner[i];
            if (inner[i] == '\'' && i + 1 < inner.size() && inner[i + 1] == '\'') {
                ++i;
            }
        }
        return out;
    }

    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return value;
    }

    std::string out;
    const std::string inner = value.substr(1, value.size() - 2);
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.size()) {
            out += inner[i];
            continue;
        }
        char next = inner[++i];
        switch (next) {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'x':
                if (i + 2 < inner.size() && std::isxdigit(static_cast<unsigned char>(inner[i + 1])) &&
                    std::isxdigit(static_cast<unsigned char>(inner[i + 2]))) {
                    out += static_cast<char>(std::stoi(inner.substr(i + 1, 2), nullptr, 16));
                    i += 2;
                } else {
                    out += next;
                }
                break;
            default: out += next; break;
        }
    }
    return out;
}

bool ConfigIO::writeDocument(const std::string& filePath, const std::vector<std::string>& lines,
                             std::string& error) {
    namespace fs = std::filesystem;

    const fs::path target(filePath);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            error = "Cannot create directory " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    // Each write gets its own sibling so overlapping saves never share an inode.
    std::string tmpTemplate = filePath + ".XXXXXX";
    std::vector<char> tmpName(tmpTemplate.begin(), tmpTemplate.end());
    tmpName.push_back('\0');
    int fd = mkstemp(tmpName.data());
    if (fd < 0) {
        error = "Cannot create temporary file next to " + filePath + ": " + std::strerror(errno);
        return false;
    }
    const std::string tmpPath(tmpName.data());
    // mkstemp creates the file 0600; the config is meant to be world-readable.
    if (fchmod(fd, 0644) != 0) {
        error = "Cannot set permissions on " + tmpPath + ": " + std::strerror(errno);
        ::close(fd);
        std::remove(tmpPath.c_str());
        return false;
    }

    std::string content;
    for (const auto& l : lines) {
        content += l;
        content += '\n';
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = "Failed writing " + tmpPath + ": " + std::strerror(errno);
            ::close(fd);
            std::remove(tmpPath.c_str());
            return false;
        }
        written += static_cast<size_t>(n);
    }
    if (::close(fd) != 0) {
        error = "Failed writing " + tmpPath + ": " + std::strerror(errno);
        std::remove(tmpPath.c_str());
        return false;
    }

    fs::rename(tmpPath, target, ec);
    if (ec) {
        error = "Cannot replace " + filePath + ": " + ec.message();
        std::remove(tmpPath.c_str());
        return false;
    }
    return true;
}

std::optional<std::string> ConfigIO::readOption(const std::string& filePath, const std::string& optionPath) {
    std::ifstream inFile(filePath);
    if (!inFile.is_open()) {
        return std::nullopt;
    }

    const auto parts = split_path(optionPath);
    if (parts.empty()) {
        return std::nullopt;
    }

    std::vector<OpenKey> open;
    std::string line;
    while (std::getline(inFile, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == '-') {
            continue;
        }

        size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }

        const size_t indent = getIndent(line);
        while (!open.empty() && open.back().indent >= indent) {
            open.pop_back();
        }
        open.push_back({indent, trim(trimmed.substr(0, colon))});

        if (open.size() != parts.size()) {
            continue;
        }

        bool matches = true;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (open[i].name != parts[i]) {
                matches = false;
                break;
            }
        }
        if (matches) {
            return unquote(trim(trimmed.substr(colon + 1)));
        }
    }

    return std::nullopt;
}
