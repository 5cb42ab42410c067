#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <map>

namespace
{
    void flatten(const std::string &prefix, const nlohmann::json &node, std::map<std::string, std::string> &out)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                flatten(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value(), out);
            }
            return;
        }
        out[prefix] = node.is_string() ? node.get<std::string>() : node.dump();
    }

    std::vector<std::string> diffKeys(const nlohmann::json &before, const nlohmann::json &after)
    {
        std::map<std::string, std::string> old_values;
        std::map<std::string, std::string> new_values;
        flatten("", before, old_values);
        flatten("", after, new_values);

        std::vector<std::string> changed;
        for (const auto &[key, value] : new_values)
        {
            auto it = old_values.find(key);
            if (it == old_values.end() || it->second != value)
                changed.push_back(key);
        }
        for (const auto &[key, value] : old_values)
        {
            if (new_values.find(key) == new_values.end())
                changed.push_back(key);
        }
        return changed;
    }
}

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance())
{
    if (poco_cfg_.load("config.json"))
    {
        Logger::info("Configuration loaded from config.json");
    }
    else
    {
        Logger::info("No config.json found, using default configuration");
    }
}

PocoConfigAdapter::~PocoConfigAdapter()
{
    stopWatching();
}

nlohmann::json PocoConfigAdapter::getAll() const
{
    return poco_cfg_.getAll();
}

std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getString("log_level", "INFO");
}

std::string PocoConfigAdapter::getCatalogPath() const
{
    return poco_cfg_.getString("catalog_path", "catalog.json");
}

std::string PocoConfigAdapter::getFfmpegPath() const
{
    return poco_cfg_.getString("encoder.ffmpeg_path", "ffmpeg");
}

int PocoConfigAdapter::getKillGraceMs() const
{
    return poco_cfg_.getInt("encoder.kill_grace_ms", 5000);
}

std::string PocoConfigAdapter::getTranscodeOutputDirectory() const
{
    return poco_cfg_.getString("transcode.output_directory", "transcodes");
}

int PocoConfigAdapter::getMaxConcurrentTasks() const
{
    return poco_cfg_.getInt("transcode.max_concurrent_tasks", 2);
}

std::string PocoConfigAdapter::getStreamOutputDirectory() const
{
    return poco_cfg_.getString("stream.output_directory", "");
}

int PocoConfigAdapter::getSegmentLengthSeconds() const
{
    return poco_cfg_.getInt("stream.segment_length_seconds", 5);
}

int PocoConfigAdapter::getStreamMaxWaitMs() const
{
    return poco_cfg_.getInt("stream.max_wait_ms", 30000);
}

int PocoConfigAdapter::getStreamPollIntervalMs() const
{
    return poco_cfg_.getInt("stream.poll_interval_ms", 1000);
}

std::string PocoConfigAdapter::getStreamPreset() const
{
    return poco_cfg_.getString("stream.preset", "veryfast");
}

int PocoConfigAdapter::getStreamMaxConcurrentEncodes() const
{
    return poco_cfg_.getInt("stream.max_concurrent_encodes", 4);
}

void PocoConfigAdapter::setLogLevel(const std::string &level)
{
    poco_cfg_.update({{"log_level", level}});
    persistChanges("log_level");

    ConfigUpdateEvent event;
    event.changed_keys = {"log_level"};
    event.source = "api";
    event.update_id = generateUpdateId();

    publishEvent(event);
}

void PocoConfigAdapter::setMaxConcurrentTasks(int max_tasks)
{
    if (max_tasks < 1)
    {
        Logger::warn("Ignoring invalid transcode.max_concurrent_tasks: " + std::to_string(max_tasks));
        return;
    }

    poco_cfg_.update({{"transcode", {{"max_concurrent_tasks", max_tasks}}}});
    persistChanges("transcode.max_concurrent_tasks");

    ConfigUpdateEvent event;
    event.changed_keys = {"transcode.max_concurrent_tasks"};
    event.source = "api";
    event.update_id = generateUpdateId();

    publishEvent(event);
}

void PocoConfigAdapter::setSegmentLengthSeconds(int seconds)
{
    if (seconds < 1)
    {
        Logger::warn("Ignoring invalid stream.segment_length_seconds: " + std::to_string(seconds));
        return;
    }

    poco_cfg_.update({{"stream", {{"segment_length_seconds", seconds}}}});
    persistChanges("stream.segment_length_seconds");

    ConfigUpdateEvent event;
    event.changed_keys = {"stream.segment_length_seconds"};
    event.source = "api";
    event.update_id = generateUpdateId();

    publishEvent(event);
}

void PocoConfigAdapter::setFfmpegPath(const std::string &path)
{
    poco_cfg_.update({{"encoder", {{"ffmpeg_path", path}}}});
    persistChanges("encoder.ffmpeg_path");

    ConfigUpdateEvent event;
    event.changed_keys = {"encoder.ffmpeg_path"};
    event.source = "api";
    event.update_id = generateUpdateId();

    publishEvent(event);
}

bool PocoConfigAdapter::updateConfig(const std::string &json_config)
{
    try
    {
        auto patch = nlohmann::json::parse(json_config);
        if (!patch.is_object())
        {
            Logger::error("Configuration update must be a JSON object");
            return false;
        }

        auto before = poco_cfg_.getAll();
        poco_cfg_.update(patch);
        if (!validateConfig())
        {
            Logger::error("Configuration update rejected, restoring previous values");
            poco_cfg_.update(before);
            return false;
        }

        ConfigUpdateEvent event;
        event.changed_keys = diffKeys(before, poco_cfg_.getAll());
        event.source = "api";
        event.update_id = generateUpdateId();
        if (event.changed_keys.empty())
            return true;

        persistChanges("configuration");
        publishEvent(event);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to update config: " + std::string(e.what()));
        return false;
    }
}

bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    if (!poco_cfg_.load(file_path))
    {
        Logger::warn("Could not load configuration from " + file_path);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(path_mutex_);
        config_file_path_ = file_path;
    }
    Logger::info("Loaded configuration from " + file_path);
    if (!validateConfig())
    {
        Logger::warn("Configuration in " + file_path + " contains invalid values, defaults apply where unusable");
    }
    return true;
}

bool PocoConfigAdapter::saveConfig(const std::string &file_path) const
{
    std::string target_path = file_path;
    if (target_path.empty())
    {
        std::lock_guard<std::mutex> lock(path_mutex_);
        target_path = config_file_path_;
    }
    return poco_cfg_.save(target_path);
}

void PocoConfigAdapter::resetToDefaults()
{
    poco_cfg_.resetToDefaults();
    Logger::info("Configuration reset to defaults");
}

bool PocoConfigAdapter::validateConfig() const
{
    bool valid = true;
    if (getMaxConcurrentTasks() < 1)
    {
        Logger::warn("transcode.max_concurrent_tasks must be at least 1");
        valid = false;
    }
    if (getSegmentLengthSeconds() < 1)
    {
        Logger::warn("stream.segment_length_seconds must be at least 1");
        valid = false;
    }
    if (getStreamMaxWaitMs() < 0 || getStreamPollIntervalMs() < 1)
    {
        Logger::warn("stream.max_wait_ms must be non-negative and stream.poll_interval_ms positive");
        valid = false;
    }
    if (getStreamMaxConcurrentEncodes() < 1)
    {
        Logger::warn("stream.max_concurrent_encodes must be at least 1");
        valid = false;
    }
    if (getKillGraceMs() < 0)
    {
        Logger::warn("encoder.kill_grace_ms must be non-negative");
        valid = false;
    }
    if (getFfmpegPath().empty())
    {
        Logger::warn("encoder.ffmpeg_path must not be empty");
        valid = false;
    }
    return valid;
}

void PocoConfigAdapter::startWatching(const std::string &file_path, int interval_seconds)
{
    if (watching_.load())
        return;

    watched_file_path_ = file_path;
    watch_interval_seconds_ = interval_seconds;

    std::error_code ec;
    last_write_time_ = std::filesystem::last_write_time(watched_file_path_, ec);
    if (ec)
    {
        Logger::warn("Configuration file " + watched_file_path_ + " not readable yet: " + ec.message());
        last_write_time_ = std::filesystem::file_time_type{};
    }

    watching_.store(true);
    watcher_thread_ = std::thread([this]()
                                  {
        Logger::info("Starting configuration file watcher for: " + watched_file_path_);
        while (watching_.load()) {
            std::error_code watch_ec;
            auto current = std::filesystem::last_write_time(watched_file_path_, watch_ec);
            if (!watch_ec && current != last_write_time_) {
                Logger::info("Detected change in configuration file. Reloading...");
                auto before = poco_cfg_.getAll();
                if (poco_cfg_.load(watched_file_path_)) {
                    ConfigUpdateEvent event;
                    event.changed_keys = diffKeys(before, poco_cfg_.getAll());
                    event.source = "file_observer";
                    event.update_id = generateUpdateId();
                    if (!event.changed_keys.empty())
                        publishEvent(event);
                } else {
                    Logger::warn("Failed to reload configuration from file");
                }
                last_write_time_ = current;
            }

            // Sleep in short steps so stopWatching() returns promptly
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(watch_interval_seconds_);
            while (watching_.load() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        Logger::info("Configuration file watcher stopped"); });
}

void PocoConfigAdapter::stopWatching()
{
    if (!watching_.exchange(false))
        return;

    if (watcher_thread_.joinable())
        watcher_thread_.join();
}

void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(observer);
    Logger::debug("Configuration observer subscribed");
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::debug("Configuration observer unsubscribed");
}

void PocoConfigAdapter::persistChanges(const std::string &changed_key)
{
    if (!saveConfig())
    {
        Logger::warn("Failed to persist configuration change for " + changed_key);
    }
}

void PocoConfigAdapter::publishEvent(const ConfigUpdateEvent &event)
{
    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    std::string keys;
    for (const auto &key : event.changed_keys)
        keys += (keys.empty() ? "" : ", ") + key;
    Logger::info("Publishing config update " + event.update_id + " from " + event.source + ": " + keys);

    for (auto observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}

std::string PocoConfigAdapter::generateUpdateId() const
{
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return "update_" + std::to_string(millis);
}
