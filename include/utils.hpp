#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace utils {
    // Safe for file and folder names; never returns an empty string.
    std::string sanitizeFilename(const std::string& filename);
    std::string trim(const std::string& str);
    std::string formatFileSize(std::uint64_t bytes);
    std::vector<std::string> splitString(const std::string& str, char delim);
    bool createDirectoryIfNotExists(const std::string& path);
    std::string shellQuote(const std::string& arg);
}
