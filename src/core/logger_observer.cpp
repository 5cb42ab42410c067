#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("log_level"))
        return;

    try
    {
        std::string new_log_level = PocoConfigAdapter::getInstance().getLogLevel();
        Logger::setLevel(new_log_level);
    }
    catch (const std::exception &e)
    {
        Logger::error("LoggerObserver: Error updating log level: " + std::string(e.what()));
    }
}
