#include "filebeam/FileName.h"
#include "filebeam/config.h"

#include <string_view>
#include <vector>

namespace FileBeam {
namespace {

static bool isSeparator(char ch) {
    return ch == '/' || ch == '\\';
}

static std::vector<std::string_view> splitComponents(std::string_view path) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    for (size_t i = 0; i <= path.size(); ++i) {
        if (i == path.size() || isSeparator(path[i])) {
            std::string_view part = path.substr(start, i - start);
            // Repeated separators and "." do not name anything
            if (!part.empty() && part != ".") {
                parts.push_back(part);
            }
            start = i + 1;
        }
    }
    return parts;
}

}  // namespace

std::string sanitizeFileName(const std::string& rawName) {
    const auto parts = splitComponents(rawName);
    if (parts.empty() || parts.back() == "..") {
        return FALLBACK_FILE_NAME;
    }

    std::string name(parts.back());
    for (char& ch : name) {
        if (ch == '\0') {
            ch = '_';
        }
    }
    return name;
}

bool isSafeFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char ch : name) {
        if (isSeparator(ch) || ch == '\0') {
            return false;
        }
    }
    return true;
}

}  // namespace FileBeam
