#include "core/catalog_loader.hpp"
#include "core/encoder_command.hpp"
#include "core/hls_segmenter.hpp"
#include "core/logger_observer.hpp"
#include "core/media_probe.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/scheduler_config_observer.hpp"
#include "core/shutdown_manager.hpp"
#include "core/transcode_scheduler.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace
{
    // Catalog target whose options are the base of every HLS segment encode
    const char *STREAM_TARGET_ID = "stream";

    struct CommandLine
    {
        std::string config_path;
        std::vector<std::string> ingest_files;
        std::vector<std::string> manifest_files;
        std::vector<std::pair<std::string, int>> segment_requests;
        bool watch_config = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "Transcode Server" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config <path>            Configuration file (default: config.json)" << std::endl;
        std::cout << "  --ingest <file>            Probe a file and transcode it with the first eligible workflow" << std::endl;
        std::cout << "  --manifest <file>          Print the HLS manifest of a file" << std::endl;
        std::cout << "  --segment <file> <index>   Produce one HLS segment of a file" << std::endl;
        std::cout << "  --watch-config             Apply configuration file edits while running" << std::endl;
        std::cout << "  --help, -h                 Show this help message" << std::endl;
    }

    // Returns false when the arguments cannot be used; `exit_now` is set for --help
    bool parseCommandLine(int argc, char *argv[], CommandLine &cmd, bool &exit_now)
    {
        exit_now = false;
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto needs = [&](int count) -> bool
            {
                if (i + count >= argc)
                {
                    std::cerr << "Error: " << arg << " requires " << count << " argument(s)" << std::endl;
                    return false;
                }
                return true;
            };

            if (arg == "--help" || arg == "-h")
            {
                printUsage(argv[0]);
                exit_now = true;
                return true;
            }
            else if (arg == "--config")
            {
                if (!needs(1))
                    return false;
                cmd.config_path = argv[++i];
            }
            else if (arg == "--ingest")
            {
                if (!needs(1))
                    return false;
                cmd.ingest_files.push_back(argv[++i]);
            }
            else if (arg == "--manifest")
            {
                if (!needs(1))
                    return false;
                cmd.manifest_files.push_back(argv[++i]);
            }
            else if (arg == "--segment")
            {
                if (!needs(2))
                    return false;
                std::string file = argv[++i];
                std::string index_text = argv[++i];
                try
                {
                    size_t consumed = 0;
                    int index = std::stoi(index_text, &consumed);
                    if (consumed != index_text.size())
                        throw std::invalid_argument(index_text);
                    cmd.segment_requests.emplace_back(file, index);
                }
                catch (const std::exception &)
                {
                    std::cerr << "Error: invalid segment index '" << index_text << "'" << std::endl;
                    return false;
                }
            }
            else if (arg == "--watch-config")
            {
                cmd.watch_config = true;
            }
            else
            {
                std::cerr << "Error: unknown option " << arg << std::endl;
                printUsage(argv[0]);
                return false;
            }
        }
        return true;
    }

    HlsSegmenter::Settings streamSettings(const PocoConfigAdapter &config)
    {
        HlsSegmenter::Settings settings;
        settings.segment_length_seconds = config.getSegmentLengthSeconds();
        settings.output_directory = config.getStreamOutputDirectory();
        settings.max_wait = std::chrono::milliseconds(config.getStreamMaxWaitMs());
        settings.poll_interval = std::chrono::milliseconds(config.getStreamPollIntervalMs());
        settings.preset = config.getStreamPreset();
        settings.max_concurrent_encodes = config.getStreamMaxConcurrentEncodes();
        return settings;
    }

    bool probeFile(const std::string &file, Media &media)
    {
        auto result = MediaProbe::probe(file, "", media);
        if (!result.success)
        {
            Logger::error("Cannot read " + file + ": " + result.describe());
            return false;
        }
        return true;
    }
}

int main(int argc, char *argv[])
{
    // Initialize coordinated signal handling FIRST
    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.installSignalHandlers();

    CommandLine cmd;
    bool exit_now = false;
    if (!parseCommandLine(argc, argv, cmd, exit_now))
        return 2;
    if (exit_now)
        return 0;

    // Initialize configuration manager
    auto &config_manager = PocoConfigAdapter::getInstance();
    if (!cmd.config_path.empty() && !config_manager.loadConfig(cmd.config_path))
    {
        std::cerr << "Error: cannot load configuration " << cmd.config_path << std::endl;
        return 1;
    }
    if (!config_manager.validateConfig())
    {
        std::cerr << "Error: configuration is invalid" << std::endl;
        return 1;
    }

    // Initialize logger with configured log level
    Logger::init(config_manager.getLogLevel());
    Logger::info("Starting transcode server (PID: " + std::to_string(getpid()) + ")...");

    Catalog catalog;
    auto catalog_result = CatalogLoader::loadFile(config_manager.getCatalogPath(), catalog);
    if (!catalog_result.success)
    {
        Logger::error("Failed to load catalog: " + catalog_result.describe());
        return 1;
    }

    auto command_factory = FfmpegCommand::factory(config_manager.getFfmpegPath(), config_manager.getKillGraceMs());

    auto scheduler = std::make_unique<TranscodeScheduler>(command_factory,
                                                          config_manager.getTranscodeOutputDirectory(),
                                                          config_manager.getMaxConcurrentTasks());
    scheduler->setCompletionHandler([](const TaskSnapshot &snapshot)
                                    {
        if (snapshot.status == TranscodeTaskStatus::COMPLETE)
            Logger::info("Transcode " + snapshot.id + " finished " + describeOutcome(snapshot));
        else
            Logger::warn("Transcode " + snapshot.id + " ended " + describeOutcome(snapshot)); });
    scheduler->setProgressHandler([](const std::string &task_id, const Progress &progress)
                                  {
        if (Logger::isEnabled(Logger::Level::DEBUG))
            Logger::debug("Transcode " + task_id + " " + progress.toString()); });
    scheduler->start();

    auto stream_target = catalog.findTarget(STREAM_TARGET_ID);
    if (!stream_target)
        Logger::info("No '" + std::string(STREAM_TARGET_ID) + "' target in catalog, segments use default encoder options");
    auto segmenter = std::make_unique<HlsSegmenter>(command_factory, stream_target, streamSettings(config_manager));

    // Create and register configuration observers
    auto logger_observer = std::make_unique<LoggerObserver>();
    auto scheduler_config_observer = std::make_unique<SchedulerConfigObserver>(*scheduler);
    config_manager.subscribe(logger_observer.get());
    config_manager.subscribe(scheduler_config_observer.get());

    if (cmd.watch_config)
        config_manager.startWatching(cmd.config_path.empty() ? "config.json" : cmd.config_path);

    // Hooks run newest first: stop config events before tearing down their targets
    shutdown_manager.registerHook("transcode scheduler", [&scheduler]()
                                  { scheduler->shutdown(); });
    shutdown_manager.registerHook("HLS segmenter", [&segmenter]()
                                  { segmenter->cancelAll(); });
    shutdown_manager.registerHook("configuration observers", [&]()
                                  {
        config_manager.stopWatching();
        config_manager.unsubscribe(scheduler_config_observer.get());
        config_manager.unsubscribe(logger_observer.get()); });

    int exit_code = 0;

    for (const auto &file : cmd.manifest_files)
    {
        Media media;
        if (!probeFile(file, media))
        {
            exit_code = 1;
            continue;
        }
        std::cout << segmenter->getManifest(media);
    }

    for (const auto &request : cmd.segment_requests)
    {
        if (shutdown_manager.isShutdownRequested())
            break;
        Media media;
        if (!probeFile(request.first, media))
        {
            exit_code = 1;
            continue;
        }
        auto result = segmenter->getSegment(media, request.second);
        if (result.success)
        {
            std::cout << result.segment_path << std::endl;
        }
        else
        {
            Logger::error("Segment " + std::to_string(request.second) + " of " + request.first +
                          " failed: " + result.describe());
            exit_code = 1;
        }
    }

    size_t dispatched = 0;
    for (const auto &file : cmd.ingest_files)
    {
        Media media;
        if (!probeFile(file, media))
        {
            exit_code = 1;
            continue;
        }
        Logger::info("Ingesting " + media.toString());

        auto results = scheduler->dispatchWorkflows(media, catalog.workflows);
        if (results.empty())
            Logger::info("No workflow applies to " + file);
        for (const auto &result : results)
        {
            if (result.success)
            {
                dispatched++;
            }
            else
            {
                Logger::error("Dispatch failed for " + file + ": " + result.describe());
                exit_code = 1;
            }
        }
    }

    if (dispatched > 0)
    {
        Logger::info("Waiting for " + std::to_string(dispatched) + " transcode task(s)");
        while (!scheduler->waitForIdle(std::chrono::milliseconds(500)))
        {
            if (shutdown_manager.waitForShutdownFor(std::chrono::milliseconds(0)))
                break;
        }

        for (const auto &snapshot : scheduler->listTasks())
        {
            if (snapshot.status != TranscodeTaskStatus::COMPLETE)
                exit_code = 1;
        }
    }
    else if (cmd.ingest_files.empty() && cmd.manifest_files.empty() && cmd.segment_requests.empty())
    {
        Logger::info("No requests given, running until a shutdown signal arrives");
        shutdown_manager.waitForShutdown();
    }

    if (!shutdown_manager.isShutdownRequested())
        shutdown_manager.requestShutdown("Requests processed");

    shutdown_manager.runHooks();
    segmenter.reset();
    scheduler.reset();

    Logger::info("Transcode server stopped (" + shutdown_manager.getReason() + ")");
    return exit_code;
}
