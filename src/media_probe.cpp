#include "core/media_probe.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

namespace fs = std::filesystem;

namespace
{
    // Closes the demuxer on every return path
    class AVFormatContextRAII
    {
    public:
        AVFormatContextRAII() = default;
        ~AVFormatContextRAII()
        {
            if (ctx_)
                avformat_close_input(&ctx_);
        }

        AVFormatContextRAII(const AVFormatContextRAII &) = delete;
        AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

        AVFormatContext *get() { return ctx_; }
        AVFormatContext **address() { return &ctx_; }

    private:
        AVFormatContext *ctx_ = nullptr;
    };

    std::string avError(int code)
    {
        char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(code, buffer, sizeof(buffer));
        return buffer;
    }

    std::string cleanName(std::string text)
    {
        std::replace(text.begin(), text.end(), '.', ' ');
        std::replace(text.begin(), text.end(), '_', ' ');
        while (!text.empty() && (text.back() == ' ' || text.back() == '-'))
            text.pop_back();
        while (!text.empty() && text.front() == ' ')
            text.erase(0, 1);
        return text;
    }
}

TranscodeResult MediaProbe::probe(const std::string &file_path, const std::string &media_id, Media &media)
{
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec))
    {
        return TranscodeResult::failure(TranscodeError::NOT_FOUND, "Media source not found: " + file_path);
    }

    AVFormatContextRAII format_ctx;
    int rc = avformat_open_input(format_ctx.address(), file_path.c_str(), nullptr, nullptr);
    if (rc < 0)
    {
        return TranscodeResult::failure(TranscodeError::VALIDATION,
                                        "Could not open media file " + file_path + ": " + avError(rc));
    }

    rc = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (rc < 0)
    {
        return TranscodeResult::failure(TranscodeError::VALIDATION,
                                        "Could not read stream information of " + file_path + ": " + avError(rc));
    }

    Media probed;
    probed.id = media_id.empty() ? fs::path(file_path).stem().string() : media_id;
    probed.source_path = fs::absolute(file_path, ec).string();
    if (ec)
        probed.source_path = file_path;

    AVFormatContext *ctx = format_ctx.get();
    if (ctx->duration > 0)
        probed.duration_seconds = static_cast<double>(ctx->duration) / AV_TIME_BASE;

    if (ctx->iformat && ctx->iformat->name)
    {
        // Demuxer names list aliases, e.g. "mov,mp4,m4a,3gp,3g2,mj2"
        std::string name = ctx->iformat->name;
        probed.container = name.substr(0, name.find(','));
    }

    for (unsigned int i = 0; i < ctx->nb_streams; ++i)
    {
        const AVCodecParameters *params = ctx->streams[i]->codecpar;
        if (params->codec_type == AVMEDIA_TYPE_VIDEO && probed.video_codec.empty())
        {
            probed.video_codec = avcodec_get_name(params->codec_id);
            probed.width = params->width;
            probed.height = params->height;
        }
        else if (params->codec_type == AVMEDIA_TYPE_AUDIO && probed.audio_codec.empty())
        {
            probed.audio_codec = avcodec_get_name(params->codec_id);
        }
    }
    probed.resolution = resolutionLabel(probed.width, probed.height);

    applyNameHeuristics(file_path, probed);
    const AVDictionaryEntry *title = av_dict_get(ctx->metadata, "title", nullptr, 0);
    if (title && title->value && *title->value && !probed.episode_number)
        probed.title = title->value;

    Logger::info("Probed " + probed.toString() + " duration=" + std::to_string(probed.duration_seconds) +
                 "s video=" + probed.video_codec + " " + probed.resolution + " audio=" + probed.audio_codec);
    media = probed;
    return TranscodeResult::ok();
}

void MediaProbe::applyNameHeuristics(const std::string &file_path, Media &media)
{
    std::string stem = fs::path(file_path).stem().string();
    static const std::regex episode_pattern(R"(^(.*?)[ ._-]*[Ss](\d{1,2})[ ._-]?[Ee](\d{1,3})(.*)$)");

    std::smatch match;
    if (std::regex_match(stem, match, episode_pattern))
    {
        media.series_title = cleanName(match[1].str());
        media.season_number = std::stoi(match[2].str());
        media.episode_number = std::stoi(match[3].str());
        media.season_title = "Season " + std::to_string(*media.season_number);
        std::string episode_title = cleanName(match[4].str());
        media.title = episode_title.empty() ? media.series_title : episode_title;
        return;
    }

    media.title = cleanName(stem);
}

std::string MediaProbe::resolutionLabel(int width, int height)
{
    if (width <= 0 && height <= 0)
        return "";
    if (width >= 3840 || height >= 2160)
        return "2160p";
    if (width >= 2560 || height >= 1440)
        return "1440p";
    if (width >= 1920 || height >= 1080)
        return "1080p";
    if (width >= 1280 || height >= 720)
        return "720p";
    if (height >= 576)
        return "576p";
    if (height >= 480)
        return "480p";
    return height > 0 ? std::to_string(height) + "p" : "";
}
