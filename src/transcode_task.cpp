#include "core/transcode_task.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace
{
    using Transitions = std::vector<std::pair<TranscodeTaskStatus, TranscodeTaskStatus>>;
}

std::string toString(TranscodeTaskStatus status)
{
    switch (status)
    {
    case TranscodeTaskStatus::WAITING:
        return "WAITING";
    case TranscodeTaskStatus::WORKING:
        return "WORKING";
    case TranscodeTaskStatus::SUSPENDED:
        return "SUSPENDED";
    case TranscodeTaskStatus::TROUBLED:
        return "TROUBLED";
    case TranscodeTaskStatus::CANCELLED:
        return "CANCELLED";
    case TranscodeTaskStatus::COMPLETE:
        return "COMPLETE";
    }
    return "UNKNOWN";
}

std::string describeOutcome(const TaskSnapshot &snapshot)
{
    std::string text = toString(snapshot.status);
    if (snapshot.status == TranscodeTaskStatus::COMPLETE)
        return text + " -> " + snapshot.output_path;
    if (!snapshot.last_error.success)
        text += ": " + snapshot.last_error.describe();
    return text;
}

TranscodeTask::TranscodeTask(const std::string &id, const Media &media, TargetPtr target, const EncoderOptions &options,
                             const std::string &output_path, double expected_duration,
                             EncoderCommandFactory command_factory)
    : id_(id), media_(media), target_(std::move(target)), options_(options), output_path_(output_path),
      expected_duration_(expected_duration), command_factory_(std::move(command_factory))
{
}

bool TranscodeTask::isTransitionAllowed(TranscodeTaskStatus from, TranscodeTaskStatus to)
{
    using S = TranscodeTaskStatus;
    switch (from)
    {
    case S::WAITING:
        return to == S::WORKING || to == S::CANCELLED;
    case S::WORKING:
        return to == S::COMPLETE || to == S::TROUBLED || to == S::SUSPENDED || to == S::CANCELLED;
    case S::SUSPENDED:
        return to == S::WORKING || to == S::CANCELLED;
    case S::TROUBLED:
        return to == S::WAITING || to == S::CANCELLED;
    case S::CANCELLED:
    case S::COMPLETE:
        return false;
    }
    return false;
}

TranscodeResult TranscodeTask::run(const ProgressCallback &progress_observer, const StartGate &may_start)
{
    Transitions transitions;
    auto flush = [&]()
    {
        for (const auto &[from, to] : transitions)
            notify(from, to);
        transitions.clear();
    };

    EncoderCommandPtr command;
    TranscodeResult start_failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (command_)
        {
            return TranscodeResult::failure(TranscodeError::CONFLICT,
                                            "Task " + id_ + " already has a running encoder command");
        }
        if (status_ != TranscodeTaskStatus::WAITING && status_ != TranscodeTaskStatus::SUSPENDED)
        {
            return TranscodeResult::failure(TranscodeError::CONFLICT,
                                            "Task " + id_ + " cannot run while " + ::toString(status_));
        }
        if (may_start && !may_start())
        {
            Logger::debug("Transcode " + id_ + " was stopped before it started");
            return TranscodeResult::failure(TranscodeError::CANCELLED,
                                            "Task " + id_ + " was stopped before it started");
        }

        auto from = status_;
        transitionLocked(TranscodeTaskStatus::WORKING);
        transitions.emplace_back(from, TranscodeTaskStatus::WORKING);
        cancel_requested_ = false;
        suspend_requested_ = false;
        Logger::info("Starting transcode " + toStringLocked());

        std::error_code ec;
        if (!fs::exists(media_.source_path, ec))
        {
            start_failure = TranscodeResult::failure(TranscodeError::NOT_FOUND,
                                                     "Media source not found: " + media_.source_path);
        }
        else
        {
            fs::path output(output_path_);
            if (output.has_parent_path())
                fs::create_directories(output.parent_path(), ec);
            if (ec)
            {
                start_failure = TranscodeResult::failure(TranscodeError::RESOURCE,
                                                         "Failed to create output directory " +
                                                             output.parent_path().string() + ": " + ec.message());
            }
            else if (fs::exists(output, ec))
            {
                Logger::warn("Transcode " + id_ + " output " + output_path_ + " already exists, removing it");
                removeOutput();
            }
        }

        if (start_failure.success)
        {
            command_ = command_factory_ ? command_factory_(media_.source_path, output_path_, expected_duration_) : nullptr;
            if (!command_)
            {
                start_failure = TranscodeResult::failure(TranscodeError::COMMAND,
                                                         "No encoder command available for task " + id_);
            }
            command = command_;
        }

        if (!start_failure.success)
        {
            last_error_ = start_failure;
            transitionLocked(TranscodeTaskStatus::TROUBLED);
            transitions.emplace_back(TranscodeTaskStatus::WORKING, TranscodeTaskStatus::TROUBLED);
            Logger::error("Transcode " + id_ + " could not start: " + start_failure.error_message);
        }
    }
    flush();

    if (!command)
        return start_failure;

    TranscodeResult result = command->run(options_, [this, &progress_observer](const Progress &progress)
                                          {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (command_)
                progress_ = progress;
        }
        if (progress_observer)
            progress_observer(progress); });

    TranscodeResult outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        command_.reset();
        progress_.reset();

        TranscodeTaskStatus to;
        std::error_code ec;
        if (result.success)
        {
            if (!fs::exists(output_path_, ec))
            {
                outcome = TranscodeResult::failure(TranscodeError::COMMAND,
                                                   "Encoder finished but no output was found at " + output_path_);
                to = TranscodeTaskStatus::TROUBLED;
            }
            else
            {
                if (cancel_requested_)
                    Logger::info("Transcode " + id_ + " completed before the cancellation took effect");
                to = TranscodeTaskStatus::COMPLETE;
            }
        }
        else if (cancel_requested_)
        {
            removeOutput();
            outcome = TranscodeResult::failure(TranscodeError::CANCELLED, "Task " + id_ + " was cancelled");
            to = TranscodeTaskStatus::CANCELLED;
        }
        else if (suspend_requested_)
        {
            removeOutput();
            outcome = TranscodeResult::failure(TranscodeError::CANCELLED, "Task " + id_ + " was suspended");
            to = TranscodeTaskStatus::SUSPENDED;
        }
        else
        {
            outcome = result;
            if (outcome.error == TranscodeError::CANCELLED || outcome.error == TranscodeError::NONE)
                outcome.error = TranscodeError::COMMAND;
            to = TranscodeTaskStatus::TROUBLED;
        }

        if (to == TranscodeTaskStatus::TROUBLED)
            last_error_ = outcome;

        transitionLocked(to);
        transitions.emplace_back(TranscodeTaskStatus::WORKING, to);
        cancel_requested_ = false;
        suspend_requested_ = false;
        Logger::info("Transcode " + id_ + " finished as " + ::toString(to) +
                     (outcome.success ? "" : " (" + outcome.describe() + ")"));
    }
    flush();
    return outcome;
}

bool TranscodeTask::cancel()
{
    Transitions transitions;
    bool interrupted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto from = status_;
        switch (status_)
        {
        case TranscodeTaskStatus::WORKING:
            if (command_)
            {
                cancel_requested_ = true;
                command_->interrupt();
                interrupted = true;
                Logger::info("Cancelling running transcode " + id_);
            }
            break;
        case TranscodeTaskStatus::SUSPENDED:
            removeOutput();
            transitionLocked(TranscodeTaskStatus::CANCELLED);
            transitions.emplace_back(from, TranscodeTaskStatus::CANCELLED);
            interrupted = true;
            break;
        case TranscodeTaskStatus::WAITING:
        case TranscodeTaskStatus::TROUBLED:
            transitionLocked(TranscodeTaskStatus::CANCELLED);
            transitions.emplace_back(from, TranscodeTaskStatus::CANCELLED);
            break;
        case TranscodeTaskStatus::CANCELLED:
        case TranscodeTaskStatus::COMPLETE:
            Logger::debug("Ignoring cancel of finished transcode " + id_);
            break;
        }
    }
    for (const auto &[from, to] : transitions)
        notify(from, to);
    return interrupted;
}

bool TranscodeTask::suspend()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != TranscodeTaskStatus::WORKING || !command_ || cancel_requested_)
        return false;

    suspend_requested_ = true;
    command_->interrupt();
    Logger::info("Suspending transcode " + id_);
    return true;
}

bool TranscodeTask::retry()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != TranscodeTaskStatus::TROUBLED)
            return false;
        transitionLocked(TranscodeTaskStatus::WAITING);
        last_error_ = TranscodeResult::ok();
    }
    notify(TranscodeTaskStatus::TROUBLED, TranscodeTaskStatus::WAITING);
    return true;
}

void TranscodeTask::setStatusListener(StatusListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

TranscodeTaskStatus TranscodeTask::getStatus() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<Progress> TranscodeTask::getProgress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

TranscodeResult TranscodeTask::getLastError() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool TranscodeTask::hasCommand() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return command_ != nullptr;
}

TaskSnapshot TranscodeTask::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    TaskSnapshot snap;
    snap.id = id_;
    snap.media_id = media_.id;
    snap.target_id = target_ ? target_->id : "";
    snap.output_path = output_path_;
    snap.status = status_;
    snap.progress = progress_;
    snap.last_error = last_error_;
    return snap;
}

std::string TranscodeTask::toString() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return toStringLocked();
}

std::string TranscodeTask::toStringLocked() const
{
    return "Task{ID=" + id_ + " MediaID=" + media_.id + " TargetID=" + (target_ ? target_->id : "-") +
           " Status=" + ::toString(status_) + " OutputPath=" + output_path_ + "}";
}

bool TranscodeTask::transitionLocked(TranscodeTaskStatus to)
{
    if (!isTransitionAllowed(status_, to))
    {
        Logger::error("Refusing transition of task " + id_ + " from " + ::toString(status_) + " to " + ::toString(to));
        return false;
    }
    Logger::debug("Task " + id_ + ": " + ::toString(status_) + " -> " + ::toString(to));
    status_ = to;
    return true;
}

void TranscodeTask::notify(TranscodeTaskStatus from, TranscodeTaskStatus to)
{
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (!listener)
        return;

    try
    {
        listener(*this, from, to);
    }
    catch (const std::exception &e)
    {
        Logger::error("Status listener for task " + id_ + " failed: " + std::string(e.what()));
    }
}

void TranscodeTask::removeOutput() const
{
    std::error_code ec;
    if (fs::remove(output_path_, ec))
    {
        Logger::debug("Removed output " + output_path_ + " of task " + id_);
    }
    else if (ec)
    {
        Logger::error("Failed to clean up output " + output_path_ + " of task " + id_ + ": " + ec.message());
    }
}
