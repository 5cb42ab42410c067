#pragma once

#include <optional>
#include <string>

/**
 * @brief Read-only descriptor of an ingested media item
 *
 * Owned by the media catalog; the engine only reads it. Episode fields are
 * left empty for movies.
 */
struct Media
{
    std::string id;
    std::string title;
    std::string series_title;
    std::string season_title;
    std::optional<int> season_number;
    std::optional<int> episode_number;

    std::string source_path;
    double duration_seconds = 0.0;

    int width = 0;
    int height = 0;
    std::string resolution; // e.g. "1080p"; derived from height when empty

    std::string video_codec;
    std::string audio_codec;
    std::string container;

    std::string resolutionLabel() const
    {
        if (!resolution.empty())
            return resolution;
        if (height > 0)
            return std::to_string(height) + "p";
        return "";
    }

    std::string toString() const
    {
        return "Media{ID=" + id + " Title=" + title + " Source=" + source_path + "}";
    }
};
