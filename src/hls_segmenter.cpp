#include "core/hls_segmenter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    std::string formatSeconds(double seconds)
    {
        std::ostringstream ss;
        ss.precision(10);
        ss << seconds;
        return ss.str();
    }

    bool fileExists(const std::string &path)
    {
        std::error_code ec;
        return fs::exists(path, ec);
    }
}

HlsSegmenter::HlsSegmenter(EncoderCommandFactory command_factory, TargetPtr stream_target, Settings settings)
    : command_factory_(std::move(command_factory)), stream_target_(std::move(stream_target)),
      settings_(std::move(settings))
{
    if (settings_.segment_length_seconds < 1)
    {
        Logger::warn("Invalid HLS segment length " + std::to_string(settings_.segment_length_seconds) + ", using 5");
        settings_.segment_length_seconds = 5;
    }
    if (settings_.poll_interval.count() < 1)
        settings_.poll_interval = std::chrono::milliseconds(1);
    if (settings_.max_concurrent_encodes < 1)
    {
        Logger::warn("Invalid HLS encode limit " + std::to_string(settings_.max_concurrent_encodes) + ", using 1");
        settings_.max_concurrent_encodes = 1;
    }
}

HlsSegmenter::~HlsSegmenter()
{
    cancelAll();
}

int HlsSegmenter::segmentCount(double duration_seconds, int segment_length_seconds)
{
    if (duration_seconds <= 0.0 || segment_length_seconds < 1)
        return 0;
    return static_cast<int>(std::ceil(duration_seconds / segment_length_seconds));
}

std::string HlsSegmenter::buildManifest(double duration_seconds, int segment_length_seconds)
{
    std::ostringstream manifest;
    manifest << "#EXTM3U\n"
             << "#EXT-X-PLAYLIST-TYPE:VOD\n"
             << "#EXT-X-VERSION:3\n"
             << "#EXT-X-TARGETDURATION:" << segment_length_seconds << "\n"
             << "#EXT-X-MEDIA-SEQUENCE:0\n";

    int count = segmentCount(duration_seconds, segment_length_seconds);
    for (int i = 0; i < count; ++i)
    {
        double remaining = duration_seconds - static_cast<double>(i) * segment_length_seconds;
        double length = std::min(static_cast<double>(segment_length_seconds), remaining);
        manifest << "#EXTINF:" << formatSeconds(length) << ",\n"
                 << i << ".ts\n";
    }

    manifest << "#EXT-X-ENDLIST\n";
    return manifest.str();
}

std::string HlsSegmenter::getManifest(const Media &media) const
{
    return buildManifest(media.duration_seconds, settings_.segment_length_seconds);
}

EncoderOptions HlsSegmenter::segmentOptions(const std::string &directory, int index) const
{
    const int length = settings_.segment_length_seconds;

    EncoderOptions overrides;
    overrides.output_format = "hls";
    overrides.hls_segment_duration = length;
    overrides.hls_playlist_type = "vod";
    overrides.hls_list_size = 0;
    overrides.seek_time = static_cast<double>(index) * length;
    overrides.duration = static_cast<double>(length);
    overrides.start_number = index;
    overrides.hls_segment_filename = (fs::path(directory) / "%d.ts").string();
    overrides.hls_flags = "temp_file";
    overrides.preset = settings_.preset;

    EncoderOptions base = stream_target_ ? stream_target_->options : EncoderOptions{};
    return EncoderOptions::merge(base, overrides);
}

TranscodeResult HlsSegmenter::outputDirectoryFor(const Media &media, std::string &directory) const
{
    std::error_code ec;
    fs::path root;
    if (settings_.output_directory.empty())
    {
        root = fs::temp_directory_path(ec);
        if (!ec)
        {
            // ffmpeg is handed the resolved path, not a symlinked temp root
            fs::path resolved = fs::canonical(root, ec);
            if (!ec)
                root = resolved;
        }
    }
    else
    {
        root = fs::absolute(settings_.output_directory, ec);
    }
    if (ec)
    {
        return TranscodeResult::failure(TranscodeError::RESOURCE,
                                        "Unable to resolve segment output root: " + ec.message());
    }

    fs::path dir = root / media.id;
    fs::create_directories(dir, ec);
    if (ec)
    {
        Logger::error("Unable to create segment output directory " + dir.string() + ": " + ec.message());
        return TranscodeResult::failure(TranscodeError::RESOURCE,
                                        "Unable to create segment output directory " + dir.string() + ": " +
                                            ec.message());
    }

    directory = dir.string();
    return TranscodeResult::ok();
}

SegmentResult HlsSegmenter::getSegment(const Media &media, int index)
{
    const int length = settings_.segment_length_seconds;
    int count = segmentCount(media.duration_seconds, length);
    if (index < 0 || index >= count)
    {
        return SegmentResult(TranscodeResult::failure(TranscodeError::VALIDATION,
                                                      "Segment " + std::to_string(index) + " is outside media " +
                                                          media.id + " (" + std::to_string(count) + " segments)"));
    }

    std::string directory;
    auto dir_result = outputDirectoryFor(media, directory);
    if (!dir_result.success)
        return SegmentResult(dir_result);

    std::string segment_path = (fs::path(directory) / (std::to_string(index) + ".ts")).string();
    if (fileExists(segment_path))
        return SegmentResult(TranscodeResult::ok(), segment_path);

    SegmentKey key(media.id, index);
    auto deadline = std::chrono::steady_clock::now() + settings_.max_wait;
    std::shared_future<TranscodeResult> pending;
    std::shared_ptr<TranscodeTask> task;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bool announced_wait = false;
        while (true)
        {
            auto it = in_flight_.find(key);
            if (it != in_flight_.end() &&
                it->second.result.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
            {
                // Leftover of a finished encode nobody collected; start over
                in_flight_.erase(it);
                it = in_flight_.end();
            }

            if (it != in_flight_.end())
            {
                Logger::debug("Joining in-flight encode of HLS segment " + std::to_string(index) + " of media " +
                              media.id);
                pending = it->second.result;
                task = it->second.task;
                break;
            }

            if (fileExists(segment_path))
                return SegmentResult(TranscodeResult::ok(), segment_path);

            if (active_encodes_ < static_cast<size_t>(settings_.max_concurrent_encodes))
            {
                double remaining = media.duration_seconds - static_cast<double>(index) * length;
                double expected = std::min(static_cast<double>(length), remaining);
                std::string playlist = (fs::path(directory) / ("segment_" + std::to_string(index) + ".m3u8")).string();
                std::string task_id = "segment_" + media.id + "_" + std::to_string(index) + "_" +
                                      std::to_string(++task_counter_);

                auto new_task = std::make_shared<TranscodeTask>(task_id, media, stream_target_,
                                                                segmentOptions(directory, index), playlist, expected,
                                                                command_factory_);
                InFlight flight;
                flight.task = new_task;
                ++active_encodes_;
                flight.result = std::async(std::launch::async, [this, new_task]()
                                           {
                    TranscodeResult result = new_task->run();
                    {
                        std::lock_guard<std::mutex> slot_lock(mutex_);
                        --active_encodes_;
                    }
                    slot_cv_.notify_all();
                    return result; })
                                    .share();
                it = in_flight_.emplace(key, std::move(flight)).first;
                Logger::info("Producing HLS segment " + std::to_string(index) + " of media " + media.id);
                pending = it->second.result;
                task = it->second.task;
                break;
            }

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                Logger::warn("No encode slot freed up for HLS segment " + segment_path);
                return SegmentResult(TranscodeResult::failure(TranscodeError::TIMEOUT,
                                                              "No encode slot for segment " + segment_path +
                                                                  " within " +
                                                                  std::to_string(settings_.max_wait.count()) + "ms"));
            }
            if (!announced_wait)
            {
                Logger::debug("HLS segment " + std::to_string(index) + " of media " + media.id + " waits for one of " +
                              std::to_string(settings_.max_concurrent_encodes) + " encode slots");
                announced_wait = true;
            }
            slot_cv_.wait_until(lock, std::min(deadline, now + settings_.poll_interval));
        }
    }

    while (true)
    {
        if (fileExists(segment_path))
            return SegmentResult(TranscodeResult::ok(), segment_path);

        if (pending.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
        {
            TranscodeResult result = pending.get();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = in_flight_.find(key);
                if (it != in_flight_.end() && it->second.task == task)
                    in_flight_.erase(it);
            }

            if (fileExists(segment_path))
                return SegmentResult(TranscodeResult::ok(), segment_path);
            if (result.success)
            {
                return SegmentResult(TranscodeResult::failure(TranscodeError::COMMAND,
                                                              "Encode finished without producing " + segment_path));
            }
            if (result.error != TranscodeError::CANCELLED)
                result.error = TranscodeError::COMMAND;
            Logger::error("HLS segment " + std::to_string(index) + " of media " + media.id + " failed: " +
                          result.error_message);
            return SegmentResult(result);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            Logger::warn("Timed out waiting for HLS segment " + segment_path);
            return SegmentResult(TranscodeResult::failure(TranscodeError::TIMEOUT,
                                                          "Segment " + segment_path + " not produced within " +
                                                              std::to_string(settings_.max_wait.count()) + "ms"));
        }

        auto step = std::min<std::chrono::steady_clock::duration>(settings_.poll_interval, deadline - now);
        pending.wait_for(step);
    }
}

void HlsSegmenter::cancelMedia(const std::string &media_id)
{
    std::vector<InFlight> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = in_flight_.begin(); it != in_flight_.end();)
        {
            if (it->first.first == media_id)
            {
                it->second.task->cancel();
                cancelled.push_back(std::move(it->second));
                it = in_flight_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    slot_cv_.notify_all();

    // Released outside the lock; the last reference to an async result waits for its encode
    for (auto &flight : cancelled)
        flight.result.wait();
}

void HlsSegmenter::cancelAll()
{
    std::vector<InFlight> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[key, flight] : in_flight_)
        {
            flight.task->cancel();
            cancelled.push_back(std::move(flight));
        }
        in_flight_.clear();
    }
    slot_cv_.notify_all();

    for (auto &flight : cancelled)
        flight.result.wait();

    if (!cancelled.empty())
        Logger::info("Cancelled " + std::to_string(cancelled.size()) + " HLS segment encodes");
}

size_t HlsSegmenter::inFlightCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

size_t HlsSegmenter::activeEncodeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_encodes_;
}
