#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    const char *DEFAULT_CONFIG = R"({
        "log_level": "INFO",
        "catalog_path": "catalog.json",
        "encoder": {
            "ffmpeg_path": "ffmpeg",
            "kill_grace_ms": 5000
        },
        "transcode": {
            "output_directory": "transcodes",
            "max_concurrent_tasks": 2
        },
        "stream": {
            "output_directory": "",
            "segment_length_seconds": 5,
            "max_wait_ms": 30000,
            "poll_interval_ms": 1000,
            "preset": "veryfast",
            "max_concurrent_encodes": 4
        }
    })";
}

PocoConfigManager::PocoConfigManager()
{
    initializeDefaultConfig();
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::istringstream in(DEFAULT_CONFIG);
    AutoPtr<JSONConfiguration> defaults = new JSONConfiguration();
    defaults->load(in);
    cfg_ = defaults;
}

void PocoConfigManager::resetToDefaults()
{
    std::lock_guard<std::mutex> lock(mutex_);
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
        return true;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.displayText());
    }
    catch (const std::exception &e)
    {
        Logger::error("Failed to read configuration file " + path + ": " + std::string(e.what()));
    }
    return false;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Configuration key " + key + " is not an integer, using default: " + e.displayText());
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Configuration key " + key + " is not a boolean, using default: " + e.displayText());
        return def;
    }
}

bool PocoConfigManager::has(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}
