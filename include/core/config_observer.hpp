#pragma once

#include <algorithm>
#include <string>
#include <vector>

/**
 * @brief Configuration update event
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // Dotted keys that changed, e.g. "stream.preset"
    std::string source;                    // "api" or "file_observer"
    std::string update_id;                 // Unique identifier of the update

    bool touches(const std::string &key) const
    {
        return std::find(changed_keys.begin(), changed_keys.end(), key) != changed_keys.end();
    }
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};
