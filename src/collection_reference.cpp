#include "collection_reference.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <regex>

namespace {
    bool isUrl(const std::string& input) {
        return input.rfind("http://", 0) == 0 || input.rfind("https://", 0) == 0 ||
               input.find("sermonaudio.com/") != std::string::npos;
    }

    std::string searchPath(const std::string& input, const std::regex& pattern) {
        std::smatch match;
        if (std::regex_search(input, match, pattern)) {
            return match[1].str();
        }
        return "";
    }
}

CollectionReference CollectionReference::sermon(const std::string& input) {
    std::string arg = utils::trim(input);

    static const std::regex bare_id(R"(\d{6,})");
    if (std::regex_match(arg, bare_id)) {
        return CollectionReference(SingleSermon{arg});
    }

    if (isUrl(arg)) {
        static const std::regex page_path(R"(/sermons/(\d+))");
        static const std::regex media_path(R"(/media/(?:audio|video)/[^/]+/(\d+)\.\w+)");
        std::string id = searchPath(arg, page_path);
        if (id.empty()) {
            id = searchPath(arg, media_path);
        }
        if (!id.empty()) {
            return CollectionReference(SingleSermon{id});
        }
    }

    throw InvalidReferenceError("Could not extract a sermon ID from: " + arg);
}

CollectionReference CollectionReference::speaker(const std::string& input) {
    std::string arg = utils::trim(input);

    static const std::regex bare_id(R"(\d+)");
    if (std::regex_match(arg, bare_id)) {
        return CollectionReference(Speaker{arg});
    }

    static const std::regex speaker_path(R"(/speakers/(\d+))");
    std::string id = searchPath(arg, speaker_path);
    if (id.empty()) {
        throw InvalidReferenceError("Could not extract speaker ID from: " + arg);
    }
    return CollectionReference(Speaker{id});
}

CollectionReference CollectionReference::broadcaster(const std::string& input) {
    std::string arg = utils::trim(input);

    if (isUrl(arg)) {
        static const std::regex broadcaster_path(R"(/broadcasters/([^/?#]+))");
        std::string id = searchPath(arg, broadcaster_path);
        if (id.empty()) {
            // Last path segment, e.g. a vanity URL ending in the slug
            std::string path = arg.substr(0, arg.find_first_of("?#"));
            while (!path.empty() && path.back() == '/') {
                path.pop_back();
            }
            auto slash = path.rfind('/');
            id = slash == std::string::npos ? path : path.substr(slash + 1);
            if (id.find('.') != std::string::npos || id.find(':') != std::string::npos) {
                id.clear();
            }
        }
        if (!id.empty()) {
            return CollectionReference(Broadcaster{id});
        }
        throw InvalidReferenceError("Could not extract broadcaster ID from: " + arg);
    }

    static const std::regex slug(R"([A-Za-z0-9_.\-]+)");
    if (!std::regex_match(arg, slug)) {
        throw InvalidReferenceError("Invalid broadcaster ID: " + arg);
    }
    return CollectionReference(Broadcaster{arg});
}

CollectionReference CollectionReference::series(const std::string& input) {
    std::string arg = utils::trim(input);

    static const std::regex bare_id(R"(\d{3,})");
    if (std::regex_match(arg, bare_id)) {
        return CollectionReference(Series{arg});
    }

    if (isUrl(arg)) {
        static const std::regex series_path(R"(/series/(\d+))");
        std::string id = searchPath(arg, series_path);
        if (!id.empty()) {
            return CollectionReference(Series{id});
        }
    }

    throw InvalidReferenceError("Could not extract series ID from: " + arg);
}

const std::string& CollectionReference::id() const {
    return std::visit([](const auto& target) -> const std::string& { return target.id; }, target_);
}

const char* CollectionReference::kindName() const {
    switch (target_.index()) {
        case 0: return "sermon";
        case 1: return "speaker";
        case 2: return "broadcaster";
        default: return "series";
    }
}

const char* CollectionReference::listingParameter() const {
    switch (target_.index()) {
        case 1: return "speakerID";
        case 2: return "broadcasterID";
        case 3: return "seriesID";
        default: return "";
    }
}

const char* CollectionReference::webPath() const {
    switch (target_.index()) {
        case 1: return "speakers";
        case 2: return "broadcasters";
        case 3: return "series";
        default: return "sermons";
    }
}
