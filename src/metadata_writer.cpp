#include "metadata_writer.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
    void appendTag(std::string& command, const char* key, const std::string& value) {
        if (!value.empty()) {
            command += " -metadata " + utils::shellQuote(std::string(key) + "=" + value);
        }
    }
}

bool FfmpegMetadataWriter::isAvailable() {
    return system("which ffmpeg >/dev/null 2>&1") == 0;
}

std::string FfmpegMetadataWriter::buildCommand(const SermonMetadata& metadata, const std::string& input,
                                               const std::string& output) {
    std::string command = "ffmpeg -v quiet -nostdin -y -i " + utils::shellQuote(input) + " -map 0 -c copy";
    if (fs::path(output).extension() == ".mp3") {
        command += " -id3v2_version 3";
    }
    appendTag(command, "title", metadata.title);
    appendTag(command, "artist", metadata.speaker);
    appendTag(command, "album", !metadata.series.empty() ? metadata.series : metadata.broadcaster);
    appendTag(command, "date", metadata.preach_date);
    appendTag(command, "comment", metadata.broadcaster);
    command += " " + utils::shellQuote(output);
    return command;
}

void FfmpegMetadataWriter::write(const SermonMetadata& metadata, const std::string& path) {
    fs::path target(path);
    fs::path tagged = target.parent_path() / ("." + target.stem().string() + ".tagging" + target.extension().string());

    std::string command = buildCommand(metadata, target.string(), tagged.string());
    if (system(command.c_str()) != 0) {
        std::error_code ec;
        fs::remove(tagged, ec);
        throw std::runtime_error("ffmpeg could not tag " + target.filename().string());
    }

    std::error_code ec;
    fs::rename(tagged, target, ec);
    if (ec) {
        fs::remove(tagged, ec);
        throw std::runtime_error("Could not replace " + target.filename().string() + " with tagged copy");
    }
}
