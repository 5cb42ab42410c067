#pragma once

#include "core/encoder_options.hpp"
#include "core/progress.hpp"
#include "core/transcode_result.hpp"
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief One invocation of the external encoder
 *
 * A command runs at most once. interrupt() may be called from any thread
 * while run() is blocked.
 */
class EncoderCommand
{
public:
    virtual ~EncoderCommand() = default;

    /**
     * @brief Run the encoder to completion
     * @param options Encoding parameters
     * @param on_progress Called from the calling thread for every progress snapshot
     * @return success, CANCELLED after interrupt(), or COMMAND with the encoder's message
     */
    virtual TranscodeResult run(const EncoderOptions &options, const ProgressCallback &on_progress) = 0;

    /**
     * @brief Ask the running encoder to stop; safe before run() and after it returned
     */
    virtual void interrupt() = 0;
};

using EncoderCommandPtr = std::shared_ptr<EncoderCommand>;

/**
 * @brief Creates the command for one encode
 * @param source Input media path
 * @param output Output path
 * @param expected_duration Seconds of media the encode should produce, used for progress
 */
using EncoderCommandFactory = std::function<EncoderCommandPtr(const std::string &source, const std::string &output,
                                                              double expected_duration)>;

/**
 * @brief Accumulates "-progress" key=value lines into snapshots
 */
class FfmpegProgressParser
{
public:
    explicit FfmpegProgressParser(double expected_duration);

    /**
     * @brief Consume one line of progress output
     * @return true when the line closed a block and current() holds a new snapshot
     */
    bool feed(const std::string &line);

    const Progress &current() const { return progress_; }

private:
    double expected_duration_;
    Progress progress_;
};

/**
 * @brief EncoderCommand backed by an ffmpeg child process
 *
 * The child is started with fork/execvp, progress is read from its stdout
 * ("-progress pipe:1") and the tail of stderr is kept for error messages.
 * Interrupting sends SIGTERM, then SIGKILL once the grace period expires.
 */
class FfmpegCommand : public EncoderCommand
{
public:
    FfmpegCommand(const std::string &ffmpeg_path, const std::string &source, const std::string &output,
                  double expected_duration, int kill_grace_ms);

    TranscodeResult run(const EncoderOptions &options, const ProgressCallback &on_progress) override;
    void interrupt() override;

    /**
     * @brief Full argument vector, program name first
     */
    std::vector<std::string> buildArguments(const EncoderOptions &options) const;

    /**
     * @brief Factory producing FfmpegCommand instances for the scheduler and segmenter
     */
    static EncoderCommandFactory factory(const std::string &ffmpeg_path, int kill_grace_ms);

private:
    void readStderr(int fd);
    void signalProcessLocked(int signal_number);
    void escalateIfDue();
    std::string stderrTail() const;

    std::string ffmpeg_path_;
    std::string source_;
    std::string output_;
    double expected_duration_;
    std::chrono::milliseconds kill_grace_;

    std::mutex process_mutex_;
    pid_t pid_{-1};
    std::atomic<bool> interrupted_{false};
    bool killed_{false};
    std::chrono::steady_clock::time_point kill_deadline_{};
    std::atomic<bool> started_{false};

    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_lines_;
};
