#pragma once

#include "core/poco_config_manager.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Forward declarations
class ConfigObserver;
struct ConfigUpdateEvent;

/**
 * @brief Typed access to the transcode server configuration
 *
 * Delegates storage to PocoConfigManager. Setters persist the change to the
 * currently loaded configuration file and notify subscribed observers.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    ~PocoConfigAdapter();

    nlohmann::json getAll() const;

    // General
    std::string getLogLevel() const;
    std::string getCatalogPath() const;

    // Encoder
    std::string getFfmpegPath() const;
    int getKillGraceMs() const;

    // Transcode scheduling
    std::string getTranscodeOutputDirectory() const;
    int getMaxConcurrentTasks() const;

    // HLS streaming
    std::string getStreamOutputDirectory() const;
    int getSegmentLengthSeconds() const;
    int getStreamMaxWaitMs() const;
    int getStreamPollIntervalMs() const;
    std::string getStreamPreset() const;
    int getStreamMaxConcurrentEncodes() const;

    // Configuration setters with event publishing
    void setLogLevel(const std::string &level);
    void setMaxConcurrentTasks(int max_tasks);
    void setSegmentLengthSeconds(int seconds);
    void setFfmpegPath(const std::string &path);

    /**
     * @brief Apply a JSON patch, persist it and publish the changed keys
     * @param json_config JSON object text; nested objects address dotted keys
     * @return false when the text is not a JSON object or the result fails validation
     */
    bool updateConfig(const std::string &json_config);

    // Configuration file operations
    bool saveConfig(const std::string &file_path = "") const;
    bool loadConfig(const std::string &file_path);
    void resetToDefaults();

    /**
     * @brief Check ranges of the numeric settings
     * @return true when every setting is usable
     */
    bool validateConfig() const;

    // Runtime config file watching
    void startWatching(const std::string &file_path = "config.json", int interval_seconds = 2);
    void stopWatching();

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    void persistChanges(const std::string &changed_key);
    void publishEvent(const ConfigUpdateEvent &event);
    std::string generateUpdateId() const;

    PocoConfigManager &poco_cfg_;

    mutable std::mutex path_mutex_;
    std::string config_file_path_{"config.json"};

    // Observers
    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;

    // File watching internals
    std::atomic<bool> watching_{false};
    std::thread watcher_thread_;
    std::string watched_file_path_;
    int watch_interval_seconds_{2};
    std::filesystem::file_time_type last_write_time_{};
};
