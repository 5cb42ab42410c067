#include "core/transcode_scheduler.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace
{
    bool isValidExtension(const std::string &extension)
    {
        if (extension.empty())
            return false;
        return std::all_of(extension.begin(), extension.end(), [](unsigned char c)
                           { return std::isalnum(c) != 0; });
    }
}

TranscodeScheduler::TranscodeScheduler(EncoderCommandFactory command_factory, const std::string &output_directory,
                                       int capacity)
    : command_factory_(std::move(command_factory)), output_directory_(output_directory),
      capacity_(std::max(1, capacity))
{
}

TranscodeScheduler::~TranscodeScheduler()
{
    shutdown();
}

void TranscodeScheduler::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load())
    {
        Logger::warn("Transcode scheduler is already running");
        return;
    }

    stopping_ = false;
    running_.store(true);
    ensureWorkersLocked();
    Logger::info("Transcode scheduler started with capacity " + std::to_string(capacity_));
}

void TranscodeScheduler::shutdown()
{
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load())
            return;

        Logger::info("Stopping transcode scheduler");
        stopping_ = true;
        for (auto &[id, entry] : tasks_)
        {
            if (entry.running)
                entry.task->cancel();
        }
        workers.swap(workers_);
    }
    cv_.notify_all();

    for (auto &worker : workers)
    {
        if (worker.joinable())
            worker.join();
    }

    running_.store(false);
    Logger::info("Transcode scheduler stopped");
}

DispatchResult TranscodeScheduler::dispatch(const Media &media, const TargetPtr &target)
{
    if (!target)
        return DispatchResult(TranscodeResult::failure(TranscodeError::VALIDATION, "No target given"));
    if (media.id.empty())
        return DispatchResult(TranscodeResult::failure(TranscodeError::VALIDATION, "Media has no id"));
    if (!isValidExtension(target->extension))
    {
        return DispatchResult(TranscodeResult::failure(TranscodeError::VALIDATION,
                                                       "Target " + target->id + " has an invalid extension '" +
                                                           target->extension + "'"));
    }

    std::string output_path = outputPathFor(media, *target);
    std::string task_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PairKey key(media.id, target->id);
        auto existing = registry_.find(key);
        if (existing != registry_.end())
        {
            Logger::debug("Transcode of " + media.id + " to " + target->id + " is already live as " + existing->second);
            return DispatchResult(TranscodeResult::failure(TranscodeError::CONFLICT,
                                                           "A transcode for media " + media.id + " and target " +
                                                               target->id + " already exists"),
                                  existing->second);
        }

        std::error_code ec;
        fs::create_directories(fs::path(output_path).parent_path(), ec);
        if (ec)
        {
            Logger::error("Failed to create output directory for " + output_path + ": " + ec.message());
            return DispatchResult(TranscodeResult::failure(TranscodeError::RESOURCE,
                                                           "Failed to create output directory: " + ec.message()));
        }

        task_id = generateTaskId();
        Entry entry;
        entry.task = std::make_shared<TranscodeTask>(task_id, media, target, target->options, output_path,
                                                     media.duration_seconds, command_factory_);
        entry.sequence = ++next_sequence_;
        tasks_.emplace(task_id, std::move(entry));
        registry_.emplace(key, task_id);
    }
    cv_.notify_all();

    Logger::info("Queued transcode " + task_id + " of " + media.toString() + " to " + target->toString());
    return DispatchResult(TranscodeResult::ok(), task_id);
}

std::vector<DispatchResult> TranscodeScheduler::dispatchWorkflows(const Media &media,
                                                                  const std::vector<WorkflowPtr> &workflows)
{
    std::vector<DispatchResult> results;
    auto workflow = findEligibleWorkflow(media, workflows);
    if (!workflow)
    {
        Logger::info("No workflow applies to " + media.toString());
        return results;
    }

    Logger::info("Media " + media.id + " matched " + workflow->toString());
    for (const auto &target : workflow->getTargets())
    {
        results.push_back(dispatch(media, target));
    }
    return results;
}

bool TranscodeScheduler::cancel(const std::string &task_id)
{
    std::optional<TaskSnapshot> settled;
    bool interrupted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end())
        {
            Logger::warn("Cannot cancel unknown task " + task_id);
            return false;
        }

        Entry &entry = it->second;
        bool was_terminal = isTerminal(entry.task->getStatus());
        interrupted = entry.task->cancel();
        entry.held = false;

        // A running task is settled by its worker once the encoder stops
        if (!was_terminal && !entry.running && isTerminal(entry.task->getStatus()))
        {
            releaseRegistryLocked(entry);
            settled = entry.task->snapshot();
        }
    }
    cv_.notify_all();

    if (settled)
        notifyCompletion(*settled);
    return interrupted;
}

size_t TranscodeScheduler::cancelTasksForMedia(const std::string &media_id)
{
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &[id, entry] : tasks_)
        {
            if (entry.task->getMedia().id == media_id && !isTerminal(entry.task->getStatus()))
                ids.push_back(id);
        }
    }

    for (const auto &id : ids)
        cancel(id);

    if (!ids.empty())
        Logger::info("Cancelled " + std::to_string(ids.size()) + " transcodes of media " + media_id);
    return ids.size();
}

std::optional<TaskSnapshot> TranscodeScheduler::status(const std::string &task_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end())
        return std::nullopt;
    return it->second.task->snapshot();
}

std::vector<TaskSnapshot> TranscodeScheduler::listTasks() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const Entry *> entries;
    for (const auto &[id, entry] : tasks_)
        entries.push_back(&entry);
    std::sort(entries.begin(), entries.end(), [](const Entry *a, const Entry *b)
              { return a->sequence < b->sequence; });

    std::vector<TaskSnapshot> snapshots;
    for (const auto *entry : entries)
        snapshots.push_back(entry->task->snapshot());
    return snapshots;
}

TranscodeResult TranscodeScheduler::suspend(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end())
        return TranscodeResult::failure(TranscodeError::NOT_FOUND, "Unknown task " + task_id);

    Entry &entry = it->second;
    auto current = entry.task->getStatus();
    if (current != TranscodeTaskStatus::WORKING && current != TranscodeTaskStatus::WAITING &&
        current != TranscodeTaskStatus::SUSPENDED)
    {
        return TranscodeResult::failure(TranscodeError::CONFLICT,
                                        "Task " + task_id + " cannot be suspended while " + toString(current));
    }

    // A claimed task may still be WAITING while its worker heads into run()
    if (entry.running && !stopClaimedLocked(entry) && current == TranscodeTaskStatus::WORKING)
        return TranscodeResult::failure(TranscodeError::CONFLICT, "Task " + task_id + " is already stopping");

    entry.held = true;
    Logger::info("Holding transcode " + task_id);
    return TranscodeResult::ok();
}

TranscodeResult TranscodeScheduler::resume(const std::string &task_id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end())
            return TranscodeResult::failure(TranscodeError::NOT_FOUND, "Unknown task " + task_id);
        if (!it->second.held)
            return TranscodeResult::failure(TranscodeError::CONFLICT, "Task " + task_id + " is not suspended");
        it->second.held = false;
    }
    cv_.notify_all();
    Logger::info("Resumed transcode " + task_id);
    return TranscodeResult::ok();
}

TranscodeResult TranscodeScheduler::retry(const std::string &task_id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end())
            return TranscodeResult::failure(TranscodeError::NOT_FOUND, "Unknown task " + task_id);
        if (!it->second.task->retry())
        {
            return TranscodeResult::failure(TranscodeError::CONFLICT,
                                            "Only TROUBLED tasks can be retried, task " + task_id + " is " +
                                                toString(it->second.task->getStatus()));
        }
        it->second.sequence = ++next_sequence_;
        it->second.held = false;
    }
    cv_.notify_all();
    Logger::info("Requeued transcode " + task_id);
    return TranscodeResult::ok();
}

TranscodeResult TranscodeScheduler::dispose(const std::string &task_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end())
        return TranscodeResult::failure(TranscodeError::NOT_FOUND, "Unknown task " + task_id);
    if (it->second.running || !isTerminal(it->second.task->getStatus()))
    {
        return TranscodeResult::failure(TranscodeError::CONFLICT,
                                        "Task " + task_id + " is still live and cannot be disposed");
    }
    tasks_.erase(it);
    Logger::debug("Disposed transcode " + task_id);
    return TranscodeResult::ok();
}

void TranscodeScheduler::setCapacity(int capacity)
{
    if (capacity < 1)
    {
        Logger::warn("Ignoring invalid transcode capacity " + std::to_string(capacity));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capacity == capacity_)
            return;
        Logger::info("Transcode capacity changed from " + std::to_string(capacity_) + " to " + std::to_string(capacity));
        capacity_ = capacity;
        enforceCapacityLocked();
        if (running_.load() && !stopping_)
            ensureWorkersLocked();
    }
    cv_.notify_all();
}

int TranscodeScheduler::getCapacity() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

size_t TranscodeScheduler::workingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto &[id, entry] : tasks_)
    {
        if (entry.task->getStatus() == TranscodeTaskStatus::WORKING)
            ++count;
    }
    return count;
}

void TranscodeScheduler::setProgressHandler(ProgressHandler handler)
{
    std::lock_guard<std::mutex> lock(handler_mutex_);
    progress_handler_ = std::move(handler);
}

void TranscodeScheduler::setCompletionHandler(CompletionHandler handler)
{
    std::lock_guard<std::mutex> lock(handler_mutex_);
    completion_handler_ = std::move(handler);
}

bool TranscodeScheduler::waitForIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]
                        { return isIdleLocked(); });
}

std::string TranscodeScheduler::outputPathFor(const Media &media, const Target &target) const
{
    return (fs::path(output_directory_) / media.id / (target.id + "." + target.extension)).string();
}

void TranscodeScheduler::workerLoop(size_t worker_index)
{
    Logger::debug("Transcode worker " + std::to_string(worker_index) + " started");

    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        cv_.wait(lock, [this]
                 { return stopping_ || (running_count_ < static_cast<size_t>(capacity_) && nextStartableLocked()); });
        if (stopping_)
            break;

        Entry *entry = nextStartableLocked();
        entry->running = true;
        entry->suspending = false;
        entry->start_order = ++next_start_order_;
        entry->stop_before_start->store(false);
        ++running_count_;
        TaskPtr task = entry->task;
        std::string task_id = task->getId();
        auto stop_before_start = entry->stop_before_start;
        lock.unlock();

        TranscodeResult result = task->run([this, task_id](const Progress &progress)
                                           {
            ProgressHandler handler;
            {
                std::lock_guard<std::mutex> handler_lock(handler_mutex_);
                handler = progress_handler_;
            }
            if (handler)
                handler(task_id, progress); },
                                           [stop_before_start]()
                                           { return !stop_before_start->load(); });

        if (!result.success)
            Logger::debug("Transcode " + task_id + " ended: " + result.describe());

        lock.lock();
        std::optional<TaskSnapshot> settled;
        auto it = tasks_.find(task_id);
        if (it != tasks_.end())
        {
            Entry &finished = it->second;
            finished.running = false;
            finished.suspending = false;
            auto final_status = task->getStatus();
            if (isTerminal(final_status))
                releaseRegistryLocked(finished);
            if (isTerminal(final_status) || final_status == TranscodeTaskStatus::TROUBLED)
                settled = task->snapshot();
        }

        // The slot stays taken until the handler returns so waitForIdle() covers it
        if (settled)
        {
            lock.unlock();
            notifyCompletion(*settled);
            lock.lock();
        }
        --running_count_;
        cv_.notify_all();
    }

    Logger::debug("Transcode worker " + std::to_string(worker_index) + " stopped");
}

void TranscodeScheduler::ensureWorkersLocked()
{
    while (workers_.size() < static_cast<size_t>(capacity_))
    {
        size_t index = workers_.size();
        workers_.emplace_back(&TranscodeScheduler::workerLoop, this, index);
    }
}

TranscodeScheduler::Entry *TranscodeScheduler::nextStartableLocked()
{
    Entry *next = nullptr;
    for (auto &[id, entry] : tasks_)
    {
        if (isStartableLocked(entry) && (!next || entry.sequence < next->sequence))
            next = &entry;
    }
    return next;
}

bool TranscodeScheduler::isStartableLocked(const Entry &entry) const
{
    if (entry.running || entry.held)
        return false;
    auto current = entry.task->getStatus();
    return current == TranscodeTaskStatus::WAITING || current == TranscodeTaskStatus::SUSPENDED;
}

bool TranscodeScheduler::isIdleLocked() const
{
    if (running_count_ > 0)
        return false;
    for (const auto &[id, entry] : tasks_)
    {
        if (isStartableLocked(entry))
            return false;
    }
    return true;
}

size_t TranscodeScheduler::effectiveWorkingLocked() const
{
    // Claimed tasks count whether or not their encode has started yet
    size_t count = 0;
    for (const auto &[id, entry] : tasks_)
    {
        if (entry.running && !entry.suspending)
            ++count;
    }
    return count;
}

void TranscodeScheduler::enforceCapacityLocked()
{
    size_t working = effectiveWorkingLocked();
    while (working > static_cast<size_t>(capacity_))
    {
        Entry *newest = nullptr;
        for (auto &[id, entry] : tasks_)
        {
            if (entry.running && !entry.suspending && (!newest || entry.start_order > newest->start_order))
                newest = &entry;
        }
        if (!newest)
            break;

        // Either the encode is interrupted or the start gate turns the worker back
        newest->suspending = true;
        if (stopClaimedLocked(*newest))
            Logger::info("Suspending transcode " + newest->task->getId() + " to fit capacity " + std::to_string(capacity_));
        else
            Logger::info("Holding back transcode " + newest->task->getId() + " to fit capacity " + std::to_string(capacity_));
        --working;
    }
}

bool TranscodeScheduler::stopClaimedLocked(Entry &entry)
{
    entry.stop_before_start->store(true);
    return entry.task->suspend();
}

void TranscodeScheduler::releaseRegistryLocked(const Entry &entry)
{
    const auto &task = entry.task;
    PairKey key(task->getMedia().id, task->getTarget() ? task->getTarget()->id : "");
    auto it = registry_.find(key);
    if (it != registry_.end() && it->second == task->getId())
        registry_.erase(it);
}

std::string TranscodeScheduler::generateTaskId()
{
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::lock_guard<std::mutex> lock(id_mutex_);
    std::ostringstream oss;
    oss << "task_" << std::hex << std::setfill('0') << std::setw(12) << (gen() & 0xffffffffffffULL)
        << "_" << std::dec << ++id_counter_;
    return oss.str();
}

void TranscodeScheduler::notifyCompletion(const TaskSnapshot &snapshot)
{
    CompletionHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = completion_handler_;
    }
    if (!handler)
        return;

    try
    {
        handler(snapshot);
    }
    catch (const std::exception &e)
    {
        Logger::error("Completion handler for task " + snapshot.id + " failed: " + std::string(e.what()));
    }
}
