#include "sermon.hpp"

const char* mediaKindName(MediaKind kind) {
    return kind == MediaKind::Audio ? "audio" : "video";
}

MediaPreference MediaPreference::defaultAudio() {
    return MediaPreference{MediaKind::Audio, {"low", "high"}};
}

MediaPreference MediaPreference::defaultVideo() {
    return MediaPreference{MediaKind::Video, {"low", "high", "1080p"}};
}
