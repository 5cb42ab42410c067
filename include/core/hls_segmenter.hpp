#pragma once

#include "core/encoder_command.hpp"
#include "core/encoder_options.hpp"
#include "core/media.hpp"
#include "core/target.hpp"
#include "core/transcode_result.hpp"
#include "core/transcode_task.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

/**
 * @brief On-demand HLS manifest and segment production
 *
 * Each segment is produced by its own encode that seeks to the segment
 * start and stops after one segment length. Segments already on disk are
 * served without encoding, and concurrent requests for the same segment
 * share a single encode.
 */
class HlsSegmenter
{
public:
    struct Settings
    {
        int segment_length_seconds = 5;
        std::string output_directory; // Empty selects the system temp directory
        std::chrono::milliseconds max_wait{30000};
        std::chrono::milliseconds poll_interval{1000};
        std::string preset = "veryfast";
        int max_concurrent_encodes = 4; // New segment encodes wait for a free slot beyond this
    };

    /**
     * @param command_factory Creates the encoder command of each segment encode
     * @param stream_target Base profile for segment encodes; may be null
     * @param settings Segment length, output root and wait bounds
     */
    HlsSegmenter(EncoderCommandFactory command_factory, TargetPtr stream_target, Settings settings);
    ~HlsSegmenter();

    HlsSegmenter(const HlsSegmenter &) = delete;
    HlsSegmenter &operator=(const HlsSegmenter &) = delete;

    /**
     * @brief VOD playlist listing every segment of the media
     */
    std::string getManifest(const Media &media) const;

    /**
     * @brief Produce, or find, segment `index` of the media
     *
     * Blocks until the segment file exists, the encode fails or the
     * configured wait expires. Starting a new encode also waits, inside the
     * same bound, while max_concurrent_encodes encodes are running.
     *
     * @return Path of "<dir>/<index>.ts"; VALIDATION for an index outside the
     * media, COMMAND when the encode failed, TIMEOUT when the wait expired
     */
    SegmentResult getSegment(const Media &media, int index);

    /**
     * @brief Options of the encode producing segment `index` into `directory`
     */
    EncoderOptions segmentOptions(const std::string &directory, int index) const;

    /**
     * @brief Directory holding the segments of the media, created when missing
     */
    TranscodeResult outputDirectoryFor(const Media &media, std::string &directory) const;

    /**
     * @brief Cancel the in-flight segment encodes of one media item
     */
    void cancelMedia(const std::string &media_id);

    /**
     * @brief Cancel every in-flight segment encode and wait for them to stop
     */
    void cancelAll();

    size_t inFlightCount() const;
    size_t activeEncodeCount() const;

    const Settings &getSettings() const { return settings_; }

    static std::string buildManifest(double duration_seconds, int segment_length_seconds);
    static int segmentCount(double duration_seconds, int segment_length_seconds);

private:
    struct InFlight
    {
        std::shared_ptr<TranscodeTask> task;
        std::shared_future<TranscodeResult> result;
    };

    using SegmentKey = std::pair<std::string, int>;

    EncoderCommandFactory command_factory_;
    TargetPtr stream_target_;
    Settings settings_;

    mutable std::mutex mutex_;
    std::condition_variable slot_cv_;
    std::map<SegmentKey, InFlight> in_flight_;
    size_t active_encodes_{0}; // Encodes whose run() has not returned yet
    uint64_t task_counter_{0};
};
