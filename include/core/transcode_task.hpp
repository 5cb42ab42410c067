#pragma once

#include "core/encoder_command.hpp"
#include "core/encoder_options.hpp"
#include "core/media.hpp"
#include "core/progress.hpp"
#include "core/target.hpp"
#include "core/transcode_result.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>

enum class TranscodeTaskStatus
{
    WAITING,
    WORKING,
    SUSPENDED,
    TROUBLED,
    CANCELLED,
    COMPLETE
};

std::string toString(TranscodeTaskStatus status);

inline bool isTerminal(TranscodeTaskStatus status)
{
    return status == TranscodeTaskStatus::COMPLETE || status == TranscodeTaskStatus::CANCELLED;
}

/**
 * @brief Copy of a task's observable state
 */
struct TaskSnapshot
{
    std::string id;
    std::string media_id;
    std::string target_id;
    std::string output_path;
    TranscodeTaskStatus status = TranscodeTaskStatus::WAITING;
    std::optional<Progress> progress; // Only while an encode is running
    TranscodeResult last_error;       // success == true when the task never failed
};

/**
 * @brief One-line summary of how a task ended, e.g. "TROUBLED: [COMMAND] ..."
 */
std::string describeOutcome(const TaskSnapshot &snapshot);

/**
 * @brief One encode attempt of a media item against a target
 *
 * The task owns at most one encoder command at a time. All state is guarded
 * by the task's mutex; run() blocks the calling worker while the encoder
 * works and may be interrupted from any thread through cancel() or suspend().
 */
class TranscodeTask
{
public:
    using StatusListener = std::function<void(const TranscodeTask &task, TranscodeTaskStatus from,
                                              TranscodeTaskStatus to)>;
    // Consulted under the task mutex right before the attempt starts
    using StartGate = std::function<bool()>;

    /**
     * @param id Unique task id
     * @param media Media to encode
     * @param target Target profile; may be null for ad-hoc encodes
     * @param options Effective encoder options for this task
     * @param output_path File the encoder writes
     * @param expected_duration Seconds of output expected, used for progress fractions
     * @param command_factory Creates the encoder command for each attempt
     */
    TranscodeTask(const std::string &id, const Media &media, TargetPtr target, const EncoderOptions &options,
                  const std::string &output_path, double expected_duration, EncoderCommandFactory command_factory);

    /**
     * @brief Run one encode attempt, blocking until it ends
     *
     * Refused with CONFLICT, leaving the task untouched, when a command is
     * already set or the task is neither WAITING nor SUSPENDED. Any file
     * already at the output path is removed first. When the attempt ends the
     * command handle and the cached progress are cleared.
     *
     * @param progress_observer Receives every progress snapshot
     * @param may_start When it returns false the attempt is abandoned with
     * CANCELLED and the task keeps its status
     * @return success when the task reached COMPLETE
     */
    TranscodeResult run(const ProgressCallback &progress_observer = nullptr, const StartGate &may_start = nullptr);

    /**
     * @brief Cancel the task
     *
     * A WORKING task is interrupted and ends CANCELLED once its encoder
     * stops, unless the encoder had already succeeded. A SUSPENDED task
     * discards its aborted attempt. WAITING and TROUBLED tasks move to
     * CANCELLED directly.
     *
     * @return true when live work had to be interrupted or discarded
     */
    bool cancel();

    /**
     * @brief Interrupt a WORKING task; it ends SUSPENDED with its partial output removed
     * @return false when the task is not WORKING
     */
    bool suspend();

    /**
     * @brief Move a TROUBLED task back to WAITING
     * @return false when the task is not TROUBLED
     */
    bool retry();

    void setStatusListener(StatusListener listener);

    const std::string &getId() const { return id_; }
    const Media &getMedia() const { return media_; }
    const TargetPtr &getTarget() const { return target_; }
    const std::string &getOutputPath() const { return output_path_; }
    const EncoderOptions &getOptions() const { return options_; }

    TranscodeTaskStatus getStatus() const;
    std::optional<Progress> getProgress() const;
    TranscodeResult getLastError() const;
    bool hasCommand() const;
    TaskSnapshot snapshot() const;

    std::string toString() const;

    static bool isTransitionAllowed(TranscodeTaskStatus from, TranscodeTaskStatus to);

private:
    bool transitionLocked(TranscodeTaskStatus to);
    std::string toStringLocked() const;
    void notify(TranscodeTaskStatus from, TranscodeTaskStatus to);
    void removeOutput() const;

    const std::string id_;
    const Media media_;
    const TargetPtr target_;
    const EncoderOptions options_;
    const std::string output_path_;
    const double expected_duration_;
    EncoderCommandFactory command_factory_;

    mutable std::mutex mutex_;
    TranscodeTaskStatus status_{TranscodeTaskStatus::WAITING};
    EncoderCommandPtr command_;
    std::optional<Progress> progress_;
    TranscodeResult last_error_;
    bool cancel_requested_{false};
    bool suspend_requested_{false};
    StatusListener listener_;
};
