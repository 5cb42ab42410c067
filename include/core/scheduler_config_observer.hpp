#pragma once

#include "core/config_observer.hpp"

class TranscodeScheduler;

/**
 * @brief Applies "transcode.max_concurrent_tasks" changes to a running scheduler
 *
 * Lowering the value suspends the newest working tasks until the working
 * count fits the new ceiling.
 */
class SchedulerConfigObserver : public ConfigObserver
{
public:
    explicit SchedulerConfigObserver(TranscodeScheduler &scheduler);
    ~SchedulerConfigObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    TranscodeScheduler &scheduler_;
};
