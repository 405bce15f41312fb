#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class MediaKind { Audio, Video };

const char* mediaKindName(MediaKind kind);

struct SermonMetadata {
    std::string title;
    std::string speaker;
    std::string broadcaster;
    std::string series;
    std::string preach_date;
    std::string language;
};

struct ResolvedAsset {
    MediaKind kind = MediaKind::Audio;
    std::string url;
    std::string tier;
    std::string format;
    std::optional<std::uint64_t> expected_size;
};

struct ItemDescriptor {
    std::string id;
    SermonMetadata metadata;
    int page = 0;
    // Set when the listing already carried the media variants.
    std::optional<std::vector<ResolvedAsset>> assets;
};

struct MediaPreference {
    MediaKind kind = MediaKind::Audio;
    std::vector<std::string> quality_order;

    static MediaPreference defaultAudio();
    static MediaPreference defaultVideo();
};
