#pragma once

#include <string>

/**
 * @brief Failure classes reported by the transcode engine
 */
enum class TranscodeError
{
    NONE,
    VALIDATION, // Malformed criteria, target reference or request
    CONFLICT,   // Task already owns a command, or the pair already has a live task
    COMMAND,    // Encoder exited non-zero, failed to spawn or produced no output
    RESOURCE,   // Output directory could not be created or written
    TIMEOUT,    // Bounded wait for a segment expired
    NOT_FOUND,  // Unknown task or missing media source
    CANCELLED   // Run ended because the task was cancelled
};

inline const char *toString(TranscodeError error)
{
    switch (error)
    {
    case TranscodeError::NONE:
        return "NONE";
    case TranscodeError::VALIDATION:
        return "VALIDATION";
    case TranscodeError::CONFLICT:
        return "CONFLICT";
    case TranscodeError::COMMAND:
        return "COMMAND";
    case TranscodeError::RESOURCE:
        return "RESOURCE";
    case TranscodeError::TIMEOUT:
        return "TIMEOUT";
    case TranscodeError::NOT_FOUND:
        return "NOT_FOUND";
    case TranscodeError::CANCELLED:
        return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Outcome of an engine operation
 */
struct TranscodeResult
{
    bool success;
    TranscodeError error;
    std::string error_message;

    TranscodeResult(bool s = true, TranscodeError e = TranscodeError::NONE, const std::string &msg = "")
        : success(s), error(e), error_message(msg) {}

    static TranscodeResult ok() { return TranscodeResult(); }
    static TranscodeResult failure(TranscodeError e, const std::string &msg) { return TranscodeResult(false, e, msg); }

    std::string describe() const
    {
        if (success)
            return "OK";
        return std::string(toString(error)) + ": " + error_message;
    }
};

/**
 * @brief Result of a scheduler dispatch; task_id is set on success and on a CONFLICT
 * with an already live task for the same media and target
 */
struct DispatchResult : public TranscodeResult
{
    std::string task_id;

    DispatchResult() = default;
    DispatchResult(const TranscodeResult &result, const std::string &id = "")
        : TranscodeResult(result), task_id(id) {}
};

/**
 * @brief Result of an HLS segment request; segment_path is set on success
 */
struct SegmentResult : public TranscodeResult
{
    std::string segment_path;

    SegmentResult() = default;
    SegmentResult(const TranscodeResult &result, const std::string &path = "")
        : TranscodeResult(result), segment_path(path) {}
};
