#include "utils.hpp"
#include "logging.hpp"
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace utils {

std::string sanitizeFilename(const std::string& filename) {
    const std::string invalid_chars = "\\/*?\"<>|";
    std::string result;
    result.reserve(filename.size());

    bool last_was_space = false;
    for (char c : trim(filename)) {
        if (c == ':') {
            result += " -";
            last_was_space = false;
            continue;
        }
        if (invalid_chars.find(c) != std::string::npos) {
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!last_was_space) {
                result += ' ';
            }
            last_was_space = true;
            continue;
        }
        result += c;
        last_was_space = false;
    }

    result = trim(result);
    // "." and ".." would escape the destination directory
    if (result.empty() || result == "." || result == "..") {
        return "untitled";
    }
    if (result.size() > 200) {
        result = trim(result.substr(0, 200));
    }
    return result;
}

std::string trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string formatFileSize(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024 && unit < 4) {
        size /= 1024;
        unit++;
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return ss.str();
}

std::vector<std::string> splitString(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

bool createDirectoryIfNotExists(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        SERMONDL_LOG(ERROR, "Error creating directory " << path << ": " << ec.message());
        return false;
    }
    return true;
}

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

}
