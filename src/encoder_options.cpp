#include "core/encoder_options.hpp"
#include <sstream>

namespace
{
    template <typename T>
    void pick(std::optional<T> &out, const std::optional<T> &base, const std::optional<T> &overrides)
    {
        out = overrides ? overrides : base;
    }

    std::string formatNumber(double value)
    {
        std::ostringstream ss;
        ss.precision(10);
        ss << value;
        return ss.str();
    }

    void append(std::vector<std::string> &args, const std::string &flag, const std::optional<std::string> &value)
    {
        if (value && !value->empty())
        {
            args.push_back(flag);
            args.push_back(*value);
        }
    }

    void append(std::vector<std::string> &args, const std::string &flag, const std::optional<int> &value)
    {
        if (value)
        {
            args.push_back(flag);
            args.push_back(std::to_string(*value));
        }
    }

    void append(std::vector<std::string> &args, const std::string &flag, const std::optional<double> &value)
    {
        if (value)
        {
            args.push_back(flag);
            args.push_back(formatNumber(*value));
        }
    }

    template <typename T>
    void put(nlohmann::json &j, const char *key, const std::optional<T> &value)
    {
        if (value)
            j[key] = *value;
    }

    template <typename T>
    void get(const nlohmann::json &j, const char *key, std::optional<T> &value)
    {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null())
            value = it->template get<T>();
    }
}

EncoderOptions EncoderOptions::merge(const EncoderOptions &base, const EncoderOptions &overrides)
{
    EncoderOptions out;
    pick(out.video_codec, base.video_codec, overrides.video_codec);
    pick(out.video_bitrate, base.video_bitrate, overrides.video_bitrate);
    pick(out.max_rate, base.max_rate, overrides.max_rate);
    pick(out.buffer_size, base.buffer_size, overrides.buffer_size);
    pick(out.resolution, base.resolution, overrides.resolution);
    pick(out.aspect, base.aspect, overrides.aspect);
    pick(out.frame_rate, base.frame_rate, overrides.frame_rate);
    pick(out.keyframe_interval, base.keyframe_interval, overrides.keyframe_interval);
    pick(out.preset, base.preset, overrides.preset);
    pick(out.tune, base.tune, overrides.tune);
    pick(out.video_profile, base.video_profile, overrides.video_profile);
    pick(out.crf, base.crf, overrides.crf);
    pick(out.pixel_format, base.pixel_format, overrides.pixel_format);
    pick(out.video_filter, base.video_filter, overrides.video_filter);
    pick(out.skip_video, base.skip_video, overrides.skip_video);

    pick(out.audio_codec, base.audio_codec, overrides.audio_codec);
    pick(out.audio_bitrate, base.audio_bitrate, overrides.audio_bitrate);
    pick(out.audio_rate, base.audio_rate, overrides.audio_rate);
    pick(out.audio_channels, base.audio_channels, overrides.audio_channels);
    pick(out.audio_filter, base.audio_filter, overrides.audio_filter);
    pick(out.skip_audio, base.skip_audio, overrides.skip_audio);

    pick(out.threads, base.threads, overrides.threads);
    pick(out.output_format, base.output_format, overrides.output_format);
    pick(out.movflags, base.movflags, overrides.movflags);
    pick(out.seek_time, base.seek_time, overrides.seek_time);
    pick(out.duration, base.duration, overrides.duration);

    pick(out.hls_segment_duration, base.hls_segment_duration, overrides.hls_segment_duration);
    pick(out.hls_playlist_type, base.hls_playlist_type, overrides.hls_playlist_type);
    pick(out.hls_list_size, base.hls_list_size, overrides.hls_list_size);
    pick(out.hls_segment_filename, base.hls_segment_filename, overrides.hls_segment_filename);
    pick(out.hls_flags, base.hls_flags, overrides.hls_flags);
    pick(out.start_number, base.start_number, overrides.start_number);

    out.extra_args = base.extra_args;
    for (const auto &[flag, value] : overrides.extra_args)
        out.extra_args[flag] = value;

    return out;
}

std::vector<std::string> EncoderOptions::toInputArguments() const
{
    std::vector<std::string> args;
    append(args, "-ss", seek_time);
    return args;
}

std::vector<std::string> EncoderOptions::toOutputArguments() const
{
    std::vector<std::string> args;

    if (skip_video.value_or(false))
    {
        args.push_back("-vn");
    }
    else
    {
        append(args, "-c:v", video_codec);
        append(args, "-preset", preset);
        append(args, "-tune", tune);
        append(args, "-profile:v", video_profile);
        append(args, "-crf", crf);
        append(args, "-b:v", video_bitrate);
        append(args, "-maxrate", max_rate);
        append(args, "-bufsize", buffer_size);
        append(args, "-s", resolution);
        append(args, "-aspect", aspect);
        append(args, "-r", frame_rate);
        append(args, "-g", keyframe_interval);
        append(args, "-pix_fmt", pixel_format);
        append(args, "-vf", video_filter);
    }

    if (skip_audio.value_or(false))
    {
        args.push_back("-an");
    }
    else
    {
        append(args, "-c:a", audio_codec);
        append(args, "-b:a", audio_bitrate);
        append(args, "-ar", audio_rate);
        append(args, "-ac", audio_channels);
        append(args, "-af", audio_filter);
    }

    append(args, "-threads", threads);
    append(args, "-t", duration);
    append(args, "-f", output_format);
    append(args, "-movflags", movflags);

    append(args, "-hls_time", hls_segment_duration);
    append(args, "-hls_playlist_type", hls_playlist_type);
    append(args, "-hls_list_size", hls_list_size);
    append(args, "-hls_segment_filename", hls_segment_filename);
    append(args, "-hls_flags", hls_flags);
    append(args, "-start_number", start_number);

    for (const auto &[flag, value] : extra_args)
    {
        args.push_back(flag);
        if (!value.empty())
            args.push_back(value);
    }

    return args;
}

bool EncoderOptions::operator==(const EncoderOptions &other) const
{
    return video_codec == other.video_codec && video_bitrate == other.video_bitrate &&
           max_rate == other.max_rate && buffer_size == other.buffer_size &&
           resolution == other.resolution && aspect == other.aspect &&
           frame_rate == other.frame_rate && keyframe_interval == other.keyframe_interval &&
           preset == other.preset && tune == other.tune && video_profile == other.video_profile &&
           crf == other.crf && pixel_format == other.pixel_format &&
           video_filter == other.video_filter && skip_video == other.skip_video &&
           audio_codec == other.audio_codec && audio_bitrate == other.audio_bitrate &&
           audio_rate == other.audio_rate && audio_channels == other.audio_channels &&
           audio_filter == other.audio_filter && skip_audio == other.skip_audio &&
           threads == other.threads && output_format == other.output_format &&
           movflags == other.movflags && seek_time == other.seek_time &&
           duration == other.duration && hls_segment_duration == other.hls_segment_duration &&
           hls_playlist_type == other.hls_playlist_type && hls_list_size == other.hls_list_size &&
           hls_segment_filename == other.hls_segment_filename && hls_flags == other.hls_flags &&
           start_number == other.start_number && extra_args == other.extra_args;
}

void to_json(nlohmann::json &j, const EncoderOptions &options)
{
    j = nlohmann::json::object();
    put(j, "video_codec", options.video_codec);
    put(j, "video_bitrate", options.video_bitrate);
    put(j, "max_rate", options.max_rate);
    put(j, "buffer_size", options.buffer_size);
    put(j, "resolution", options.resolution);
    put(j, "aspect", options.aspect);
    put(j, "frame_rate", options.frame_rate);
    put(j, "keyframe_interval", options.keyframe_interval);
    put(j, "preset", options.preset);
    put(j, "tune", options.tune);
    put(j, "video_profile", options.video_profile);
    put(j, "crf", options.crf);
    put(j, "pixel_format", options.pixel_format);
    put(j, "video_filter", options.video_filter);
    put(j, "skip_video", options.skip_video);
    put(j, "audio_codec", options.audio_codec);
    put(j, "audio_bitrate", options.audio_bitrate);
    put(j, "audio_rate", options.audio_rate);
    put(j, "audio_channels", options.audio_channels);
    put(j, "audio_filter", options.audio_filter);
    put(j, "skip_audio", options.skip_audio);
    put(j, "threads", options.threads);
    put(j, "output_format", options.output_format);
    put(j, "movflags", options.movflags);
    put(j, "seek_time", options.seek_time);
    put(j, "duration", options.duration);
    put(j, "hls_segment_duration", options.hls_segment_duration);
    put(j, "hls_playlist_type", options.hls_playlist_type);
    put(j, "hls_list_size", options.hls_list_size);
    put(j, "hls_segment_filename", options.hls_segment_filename);
    put(j, "hls_flags", options.hls_flags);
    put(j, "start_number", options.start_number);
    if (!options.extra_args.empty())
        j["extra_args"] = options.extra_args;
}

void from_json(const nlohmann::json &j, EncoderOptions &options)
{
    options = EncoderOptions{};
    get(j, "video_codec", options.video_codec);
    get(j, "video_bitrate", options.video_bitrate);
    get(j, "max_rate", options.max_rate);
    get(j, "buffer_size", options.buffer_size);
    get(j, "resolution", options.resolution);
    get(j, "aspect", options.aspect);
    get(j, "frame_rate", options.frame_rate);
    get(j, "keyframe_interval", options.keyframe_interval);
    get(j, "preset", options.preset);
    get(j, "tune", options.tune);
    get(j, "video_profile", options.video_profile);
    get(j, "crf", options.crf);
    get(j, "pixel_format", options.pixel_format);
    get(j, "video_filter", options.video_filter);
    get(j, "skip_video", options.skip_video);
    get(j, "audio_codec", options.audio_codec);
    get(j, "audio_bitrate", options.audio_bitrate);
    get(j, "audio_rate", options.audio_rate);
    get(j, "audio_channels", options.audio_channels);
    get(j, "audio_filter", options.audio_filter);
    get(j, "skip_audio", options.skip_audio);
    get(j, "threads", options.threads);
    get(j, "output_format", options.output_format);
    get(j, "movflags", options.movflags);
    get(j, "seek_time", options.seek_time);
    get(j, "duration", options.duration);
    get(j, "hls_segment_duration", options.hls_segment_duration);
    get(j, "hls_playlist_type", options.hls_playlist_type);
    get(j, "hls_list_size", options.hls_list_size);
    get(j, "hls_segment_filename", options.hls_segment_filename);
    get(j, "hls_flags", options.hls_flags);
    get(j, "start_number", options.start_number);

    auto extra = j.find("extra_args");
    if (extra != j.end() && extra->is_object())
        options.extra_args = extra->get<std::map<std::string, std::string>>();
}
