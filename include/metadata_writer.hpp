#pragma once
#include "sermon.hpp"
#include <string>

// Applies tags to a finished file. Throws on failure.
class MetadataWriter {
public:
    virtual ~MetadataWriter() = default;

    virtual void write(const SermonMetadata& metadata, const std::string& path) = 0;
};

class NullMetadataWriter : public MetadataWriter {
public:
    void write(const SermonMetadata&, const std::string&) override {}
};

// Rewrites the container with `ffmpeg -c copy` into a hidden sibling file and
// renames it over the downloaded file, so the final name never shows a partial file.
class FfmpegMetadataWriter : public MetadataWriter {
public:
    static bool isAvailable();

    void write(const SermonMetadata& metadata, const std::string& path) override;

    static std::string buildCommand(const SermonMetadata& metadata, const std::string& input,
                                    const std::string& output);
};
