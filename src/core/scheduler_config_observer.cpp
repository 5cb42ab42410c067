#include "core/scheduler_config_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/transcode_scheduler.hpp"
#include "logging/logger.hpp"

SchedulerConfigObserver::SchedulerConfigObserver(TranscodeScheduler &scheduler)
    : scheduler_(scheduler)
{
}

void SchedulerConfigObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("transcode.max_concurrent_tasks"))
        return;

    try
    {
        int capacity = PocoConfigAdapter::getInstance().getMaxConcurrentTasks();
        Logger::info("SchedulerConfigObserver: max concurrent transcodes changed to " + std::to_string(capacity));
        scheduler_.setCapacity(capacity);
    }
    catch (const std::exception &e)
    {
        Logger::error("SchedulerConfigObserver: Error applying transcode capacity: " + std::string(e.what()));
    }
}
