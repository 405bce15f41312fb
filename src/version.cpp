#include "version.hpp"

namespace version {
    std::string userAgent() {
        return "Mozilla/5.0 (compatible; sermondl/" + std::string(CURRENT_VERSION) + ")";
    }
}
