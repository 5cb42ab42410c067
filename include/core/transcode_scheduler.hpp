#pragma once

#include "core/encoder_command.hpp"
#include "core/media.hpp"
#include "core/target.hpp"
#include "core/transcode_result.hpp"
#include "core/transcode_task.hpp"
#include "core/workflow.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief Runs transcode tasks on a bounded pool of worker threads
 *
 * At most `capacity` tasks are WORKING at once. Waiting work is started in
 * dispatch order; a suspended task keeps its queue position. Only one
 * live (non-terminal) task may exist for a media/target pair. Finished
 * tasks stay queryable until dispose() is called.
 */
class TranscodeScheduler
{
public:
    using TaskPtr = std::shared_ptr<TranscodeTask>;
    using ProgressHandler = std::function<void(const std::string &task_id, const Progress &progress)>;
    using CompletionHandler = std::function<void(const TaskSnapshot &snapshot)>;

    /**
     * @param command_factory Creates the encoder command of each attempt
     * @param output_directory Root of the "<media id>/<target id>.<ext>" output tree
     * @param capacity Maximum number of concurrently WORKING tasks, at least 1
     */
    TranscodeScheduler(EncoderCommandFactory command_factory, const std::string &output_directory, int capacity);
    ~TranscodeScheduler();

    TranscodeScheduler(const TranscodeScheduler &) = delete;
    TranscodeScheduler &operator=(const TranscodeScheduler &) = delete;

    void start();

    /**
     * @brief Cancel working tasks and join the workers; waiting tasks are left WAITING
     */
    void shutdown();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Queue a task for the media and target
     * @return task id; CONFLICT carries the id of the live task for the same pair
     */
    DispatchResult dispatch(const Media &media, const TargetPtr &target);

    /**
     * @brief Dispatch every target of the first eligible workflow
     * @return One result per target; empty when no workflow applies
     */
    std::vector<DispatchResult> dispatchWorkflows(const Media &media, const std::vector<WorkflowPtr> &workflows);

    /**
     * @brief Cancel a task
     * @return true when live work was interrupted; false for unknown ids
     */
    bool cancel(const std::string &task_id);

    /**
     * @brief Cancel every non-terminal task of a media item
     * @return Number of tasks affected
     */
    size_t cancelTasksForMedia(const std::string &media_id);

    std::optional<TaskSnapshot> status(const std::string &task_id) const;
    std::vector<TaskSnapshot> listTasks() const;

    /**
     * @brief Hold a task; a WORKING task is interrupted and SUSPENDED
     */
    TranscodeResult suspend(const std::string &task_id);

    /**
     * @brief Release a held task so it can be started again
     */
    TranscodeResult resume(const std::string &task_id);

    /**
     * @brief Requeue a TROUBLED task at the back of the queue
     */
    TranscodeResult retry(const std::string &task_id);

    /**
     * @brief Forget a COMPLETE or CANCELLED task
     */
    TranscodeResult dispose(const std::string &task_id);

    /**
     * @brief Change the concurrency ceiling; excess WORKING tasks are suspended, newest first
     */
    void setCapacity(int capacity);
    int getCapacity() const;
    size_t workingCount() const;

    void setProgressHandler(ProgressHandler handler);
    void setCompletionHandler(CompletionHandler handler);

    /**
     * @brief Block until no task is working or startable
     * @return false on timeout
     */
    bool waitForIdle(std::chrono::milliseconds timeout);

    std::string outputPathFor(const Media &media, const Target &target) const;

private:
    struct Entry
    {
        TaskPtr task;
        uint64_t sequence = 0;
        uint64_t start_order = 0;
        bool running = false;    // Owned by a worker right now
        bool held = false;       // Explicitly suspended, not startable until resumed
        bool suspending = false; // Interrupted for lack of capacity
        // Set to keep a claimed task from starting; read by its worker's start gate
        std::shared_ptr<std::atomic<bool>> stop_before_start = std::make_shared<std::atomic<bool>>(false);
    };

    using PairKey = std::pair<std::string, std::string>;

    void workerLoop(size_t worker_index);
    void ensureWorkersLocked();
    Entry *nextStartableLocked();
    bool isStartableLocked(const Entry &entry) const;
    bool isIdleLocked() const;
    size_t effectiveWorkingLocked() const;
    void enforceCapacityLocked();
    bool stopClaimedLocked(Entry &entry);
    void releaseRegistryLocked(const Entry &entry);
    std::string generateTaskId();
    void notifyCompletion(const TaskSnapshot &snapshot);

    EncoderCommandFactory command_factory_;
    std::string output_directory_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, Entry> tasks_;
    std::map<PairKey, std::string> registry_;
    uint64_t next_sequence_{0};
    uint64_t next_start_order_{0};
    size_t running_count_{0};
    int capacity_;

    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    bool stopping_{false};

    std::mutex handler_mutex_;
    ProgressHandler progress_handler_;
    CompletionHandler completion_handler_;

    std::mutex id_mutex_;
    uint64_t id_counter_{0};
};
