#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe store of the raw configuration tree
 *
 * Holds a Poco JSONConfiguration seeded with the transcode server defaults.
 * Nested keys are addressed with dots, e.g. "stream.segment_length_seconds".
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    bool load(const std::string &path);
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;
    void update(const nlohmann::json &patch);

    /**
     * @brief Drop every loaded value and go back to the built-in defaults
     */
    void resetToDefaults();

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;
    bool has(const std::string &key) const;

private:
    PocoConfigManager();
    void initializeDefaultConfig();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
