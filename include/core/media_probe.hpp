#pragma once

#include "core/media.hpp"
#include "core/transcode_result.hpp"
#include <string>

/**
 * @brief Builds media descriptors from source files using libavformat
 */
class MediaProbe
{
public:
    /**
     * @brief Open the file and read its container and stream parameters
     * @param file_path Source media file
     * @param media_id Id given to the descriptor; the file stem when empty
     * @param media Filled on success
     * @return NOT_FOUND for a missing file, VALIDATION when it cannot be demuxed
     */
    static TranscodeResult probe(const std::string &file_path, const std::string &media_id, Media &media);

    /**
     * @brief Fill title and episode fields from a file name such as "Show.Name.S01E02.mkv"
     *
     * Names without a season/episode marker only set the title.
     */
    static void applyNameHeuristics(const std::string &file_path, Media &media);

    /**
     * @brief "2160p", "1080p", "720p"... from a frame height; empty for unknown heights
     */
    static std::string resolutionLabel(int width, int height);
};
