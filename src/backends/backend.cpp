#include "backend.hpp"
#include <core/utils.hpp>
#include <algorithm>

const char* backend_type_name(BackendType type) {
    switch (type) {
        case BackendType::LOCAL:  return "local";
        case BackendType::DOCKER: return "docker";
        case BackendType::SSH:    return "ssh";
    }
    return "unknown";
}

std::string os_release_name(const std::string& text) {
    auto unquote = [](std::string v) {
        v.erase(std::remove(v.begin(), v.end(), '"'), v.end());
        return v;
    };
    std::string version;
    for (const auto& raw : split_lines(text)) {
        std::string line = trimmed(raw);
        if (line.rfind("PRETTY_NAME=", 0) == 0) return unquote(line.substr(12));
        if (line.rfind("VERSION=", 0) == 0) version = unquote(line.substr(8));
    }
    return version;
}
