#pragma once

#include "core/encoder_command.hpp"
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Shared behaviour and bookkeeping of every FakeEncoderCommand made by one factory
 */
struct FakeEncoderControl
{
    enum class Mode
    {
        SUCCEED,  // Write the output and report success
        FAIL,     // Report a COMMAND failure without output
        NO_OUTPUT, // Report success without writing anything
        BLOCK     // Wait for release() or interrupt()
    };

    std::mutex mutex;
    std::condition_variable cv;
    Mode mode = Mode::SUCCEED;
    bool released = false;
    bool succeed_when_interrupted = false; // Encoder finished just as the interrupt arrived
    std::chrono::milliseconds run_time{0};

    int created = 0;
    int started = 0;
    int finished = 0;
    int interrupts = 0;
    int active = 0;
    int max_active = 0;
    std::vector<std::string> sources;
    std::vector<std::string> outputs;
    std::vector<EncoderOptions> options;

    void setMode(Mode new_mode)
    {
        std::lock_guard<std::mutex> lock(mutex);
        mode = new_mode;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            released = true;
        }
        cv.notify_all();
    }

    bool waitForStarted(int count, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]
                           { return started >= count; });
    }

    bool waitForActive(int count, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [&]
                           { return active == count; });
    }

    int startedCount()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return started;
    }

    int activeCount()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return active;
    }

    int maxActive()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return max_active;
    }

    std::vector<std::string> sourcesSnapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return sources;
    }
};

/**
 * @brief In-process EncoderCommand driven by a FakeEncoderControl
 *
 * Writes the output file (and, for HLS options, the segment file the
 * segment filename pattern names) instead of running an encoder.
 */
class FakeEncoderCommand : public EncoderCommand
{
public:
    FakeEncoderCommand(std::shared_ptr<FakeEncoderControl> control, const std::string &output, double expected_duration)
        : control_(std::move(control)), output_(output), expected_duration_(expected_duration)
    {
    }

    TranscodeResult run(const EncoderOptions &options, const ProgressCallback &on_progress) override
    {
        FakeEncoderControl::Mode mode;
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            control_->started++;
            control_->active++;
            if (control_->active > control_->max_active)
                control_->max_active = control_->active;
            control_->options.push_back(options);
            mode = control_->mode;
        }
        control_->cv.notify_all();

        TranscodeResult result = execute(mode, options, on_progress);

        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            control_->active--;
            control_->finished++;
        }
        control_->cv.notify_all();
        return result;
    }

    void interrupt() override
    {
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            interrupted_ = true;
            control_->interrupts++;
        }
        control_->cv.notify_all();
    }

private:
    TranscodeResult execute(FakeEncoderControl::Mode mode, const EncoderOptions &options,
                            const ProgressCallback &on_progress)
    {
        if (on_progress)
        {
            Progress progress;
            progress.fraction = 0.5;
            progress.processed_seconds = expected_duration_ / 2.0;
            progress.speed = 2.0;
            on_progress(progress);
        }

        if (mode == FakeEncoderControl::Mode::FAIL)
            return TranscodeResult::failure(TranscodeError::COMMAND, "fake encoder exited with status 1");

        {
            std::unique_lock<std::mutex> lock(control_->mutex);
            if (mode == FakeEncoderControl::Mode::BLOCK)
            {
                control_->cv.wait(lock, [&]
                                  { return interrupted_ || control_->released; });
            }
            else if (control_->run_time.count() > 0)
            {
                control_->cv.wait_for(lock, control_->run_time, [&]
                                      { return interrupted_; });
            }

            if (interrupted_ && !control_->succeed_when_interrupted)
                return TranscodeResult::failure(TranscodeError::CANCELLED, "fake encoder interrupted");
        }

        if (mode != FakeEncoderControl::Mode::NO_OUTPUT)
            writeOutputs(options);

        if (on_progress)
        {
            Progress done;
            done.fraction = 1.0;
            done.processed_seconds = expected_duration_;
            done.finished = true;
            on_progress(done);
        }
        return TranscodeResult::ok();
    }

    void writeOutputs(const EncoderOptions &options) const
    {
        std::ofstream(output_) << "fake output";
        if (options.hls_segment_filename)
        {
            std::string segment = *options.hls_segment_filename;
            auto marker = segment.find("%d");
            if (marker != std::string::npos)
                segment.replace(marker, 2, std::to_string(options.start_number.value_or(0)));
            std::ofstream(segment) << "fake segment";
        }
    }

    std::shared_ptr<FakeEncoderControl> control_;
    std::string output_;
    double expected_duration_;
    bool interrupted_ = false; // Guarded by control_->mutex
};

/**
 * @brief Factory handing out FakeEncoderCommands bound to `control`
 */
inline EncoderCommandFactory makeFakeEncoderFactory(std::shared_ptr<FakeEncoderControl> control)
{
    return [control](const std::string &source, const std::string &output, double expected_duration) -> EncoderCommandPtr
    {
        {
            std::lock_guard<std::mutex> lock(control->mutex);
            control->created++;
            control->sources.push_back(source);
            control->outputs.push_back(output);
        }
        return std::make_shared<FakeEncoderCommand>(control, output, expected_duration);
    };
}
