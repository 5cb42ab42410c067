#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Sparse set of encoder parameters
 *
 * Unset fields are left to the encoder's own defaults. Options are plain
 * values; combining two profiles never mutates either of them.
 */
struct EncoderOptions
{
    // Video
    std::optional<std::string> video_codec;
    std::optional<std::string> video_bitrate;
    std::optional<std::string> max_rate;
    std::optional<std::string> buffer_size;
    std::optional<std::string> resolution; // Frame size, e.g. "1280x720"
    std::optional<std::string> aspect;
    std::optional<std::string> frame_rate;
    std::optional<int> keyframe_interval;
    std::optional<std::string> preset;
    std::optional<std::string> tune;
    std::optional<std::string> video_profile;
    std::optional<int> crf;
    std::optional<std::string> pixel_format;
    std::optional<std::string> video_filter;
    std::optional<bool> skip_video;

    // Audio
    std::optional<std::string> audio_codec;
    std::optional<std::string> audio_bitrate;
    std::optional<int> audio_rate;
    std::optional<int> audio_channels;
    std::optional<std::string> audio_filter;
    std::optional<bool> skip_audio;

    // Container and timing
    std::optional<int> threads;
    std::optional<std::string> output_format;
    std::optional<std::string> movflags;
    std::optional<double> seek_time;
    std::optional<double> duration;

    // HLS
    std::optional<int> hls_segment_duration;
    std::optional<std::string> hls_playlist_type;
    std::optional<int> hls_list_size;
    std::optional<std::string> hls_segment_filename;
    std::optional<std::string> hls_flags;
    std::optional<int> start_number;

    // Raw output flags without a dedicated field, e.g. {"-map_metadata", "-1"}
    std::map<std::string, std::string> extra_args;

    /**
     * @brief Field-wise combination of two profiles
     *
     * Every field set in overrides replaces the base value; extra_args are
     * combined key by key with the override keys winning.
     *
     * @param base Profile supplying the defaults
     * @param overrides Profile whose set fields win
     * @return New profile; neither argument is changed
     */
    static EncoderOptions merge(const EncoderOptions &base, const EncoderOptions &overrides);

    /**
     * @brief Arguments placed before "-i" (input seeking)
     */
    std::vector<std::string> toInputArguments() const;

    /**
     * @brief Arguments placed between the input and the output path
     */
    std::vector<std::string> toOutputArguments() const;

    bool operator==(const EncoderOptions &other) const;
    bool operator!=(const EncoderOptions &other) const { return !(*this == other); }
};

void to_json(nlohmann::json &j, const EncoderOptions &options);

// Unknown keys are ignored; a value of the wrong JSON type throws nlohmann::json::type_error
void from_json(const nlohmann::json &j, EncoderOptions &options);
