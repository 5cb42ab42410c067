#include "test_base.hpp"
#include "stubs/fake_encoder_command.hpp"
#include "core/config_observer.hpp"
#include "core/logger_observer.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/scheduler_config_observer.hpp"
#include "core/transcode_scheduler.hpp"
#include <atomic>
#include <mutex>

class PocoConfigAdapterTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_path_ = getTestRoot() + "/test_config.json";
        writeConfig(R"({
            "log_level": "DEBUG",
            "catalog_path": "/etc/transcode/catalog.json",
            "encoder": {"ffmpeg_path": "/opt/ffmpeg/bin/ffmpeg", "kill_grace_ms": 1500},
            "transcode": {"output_directory": "/srv/transcodes", "max_concurrent_tasks": 3},
            "stream": {
                "output_directory": "/srv/hls",
                "segment_length_seconds": 6,
                "max_wait_ms": 12000,
                "poll_interval_ms": 250,
                "preset": "ultrafast",
                "max_concurrent_encodes": 2
            }
        })");

        auto &config = PocoConfigAdapter::getInstance();
        config.resetToDefaults();
        ASSERT_TRUE(config.loadConfig(config_path_));
    }

    void TearDown() override
    {
        auto &config = PocoConfigAdapter::getInstance();
        config.stopWatching();
        config.resetToDefaults();
        Logger::setLevel("DEBUG");
        TestBase::TearDown();
    }

    void writeConfig(const std::string &content)
    {
        std::ofstream out(config_path_);
        out << content;
    }

    std::string config_path_;
};

/**
 * @brief Records every event it receives
 */
class RecordingObserver : public ConfigObserver
{
public:
    void onConfigUpdate(const ConfigUpdateEvent &event) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<ConfigUpdateEvent> events() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ConfigUpdateEvent> events_;
};

TEST_F(PocoConfigAdapterTest, ReadsValuesFromLoadedFile)
{
    auto &config = PocoConfigAdapter::getInstance();

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getCatalogPath(), "/etc/transcode/catalog.json");
    EXPECT_EQ(config.getFfmpegPath(), "/opt/ffmpeg/bin/ffmpeg");
    EXPECT_EQ(config.getKillGraceMs(), 1500);
    EXPECT_EQ(config.getTranscodeOutputDirectory(), "/srv/transcodes");
    EXPECT_EQ(config.getMaxConcurrentTasks(), 3);
    EXPECT_EQ(config.getStreamOutputDirectory(), "/srv/hls");
    EXPECT_EQ(config.getSegmentLengthSeconds(), 6);
    EXPECT_EQ(config.getStreamMaxWaitMs(), 12000);
    EXPECT_EQ(config.getStreamPollIntervalMs(), 250);
    EXPECT_EQ(config.getStreamPreset(), "ultrafast");
    EXPECT_EQ(config.getStreamMaxConcurrentEncodes(), 2);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigAdapterTest, DefaultsApplyAfterReset)
{
    auto &config = PocoConfigAdapter::getInstance();
    config.resetToDefaults();

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getCatalogPath(), "catalog.json");
    EXPECT_EQ(config.getFfmpegPath(), "ffmpeg");
    EXPECT_EQ(config.getKillGraceMs(), 5000);
    EXPECT_EQ(config.getTranscodeOutputDirectory(), "transcodes");
    EXPECT_EQ(config.getMaxConcurrentTasks(), 2);
    EXPECT_EQ(config.getStreamOutputDirectory(), "");
    EXPECT_EQ(config.getSegmentLengthSeconds(), 5);
    EXPECT_EQ(config.getStreamMaxWaitMs(), 30000);
    EXPECT_EQ(config.getStreamPollIntervalMs(), 1000);
    EXPECT_EQ(config.getStreamPreset(), "veryfast");
    EXPECT_EQ(config.getStreamMaxConcurrentEncodes(), 4);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigAdapterTest, MissingFileKeepsCurrentValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_FALSE(config.loadConfig(getTestRoot() + "/absent.json"));
    EXPECT_EQ(config.getMaxConcurrentTasks(), 3);
}

TEST_F(PocoConfigAdapterTest, MalformedFileIsRejected)
{
    auto &config = PocoConfigAdapter::getInstance();
    std::string broken = createDummyFile("broken.json", "{ \"log_level\": ");
    EXPECT_FALSE(config.loadConfig(broken));
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
}

TEST_F(PocoConfigAdapterTest, SettersPersistAndPublish)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    config.setMaxConcurrentTasks(5);
    config.setSegmentLengthSeconds(10);
    config.setFfmpegPath("/usr/local/bin/ffmpeg");
    config.unsubscribe(&observer);

    EXPECT_EQ(config.getMaxConcurrentTasks(), 5);
    EXPECT_EQ(config.getSegmentLengthSeconds(), 10);
    EXPECT_EQ(config.getFfmpegPath(), "/usr/local/bin/ffmpeg");

    auto events = observer.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].source, "api");
    EXPECT_TRUE(events[0].touches("transcode.max_concurrent_tasks"));
    EXPECT_TRUE(events[1].touches("stream.segment_length_seconds"));
    EXPECT_TRUE(events[2].touches("encoder.ffmpeg_path"));
    EXPECT_FALSE(events[0].update_id.empty());

    // The loaded file now carries the new values
    config.resetToDefaults();
    ASSERT_TRUE(config.loadConfig(config_path_));
    EXPECT_EQ(config.getMaxConcurrentTasks(), 5);
    EXPECT_EQ(config.getSegmentLengthSeconds(), 10);
}

TEST_F(PocoConfigAdapterTest, InvalidSetterValuesAreIgnored)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    config.setMaxConcurrentTasks(0);
    config.setSegmentLengthSeconds(-2);
    config.unsubscribe(&observer);

    EXPECT_EQ(config.getMaxConcurrentTasks(), 3);
    EXPECT_EQ(config.getSegmentLengthSeconds(), 6);
    EXPECT_TRUE(observer.events().empty());
}

TEST_F(PocoConfigAdapterTest, UpdateConfigPublishesChangedKeysOnly)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    EXPECT_TRUE(config.updateConfig(R"({"stream": {"preset": "medium", "segment_length_seconds": 6}})"));
    config.unsubscribe(&observer);

    EXPECT_EQ(config.getStreamPreset(), "medium");
    auto events = observer.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].changed_keys, std::vector<std::string>{"stream.preset"});
    EXPECT_EQ(events[0].source, "api");
}

TEST_F(PocoConfigAdapterTest, UpdateConfigRollsBackInvalidValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);

    EXPECT_FALSE(config.updateConfig(R"({"transcode": {"max_concurrent_tasks": 0}})"));
    EXPECT_FALSE(config.updateConfig(R"(["not", "an", "object"])"));
    EXPECT_FALSE(config.updateConfig("not json at all"));
    config.unsubscribe(&observer);

    EXPECT_EQ(config.getMaxConcurrentTasks(), 3);
    EXPECT_TRUE(observer.events().empty());
}

TEST_F(PocoConfigAdapterTest, ValidateFlagsUnusableValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    writeConfig(R"({"stream": {"poll_interval_ms": 0}, "encoder": {"kill_grace_ms": -1}})");
    ASSERT_TRUE(config.loadConfig(config_path_));
    EXPECT_FALSE(config.validateConfig());

    writeConfig(R"({"stream": {"max_concurrent_encodes": 0}})");
    ASSERT_TRUE(config.loadConfig(config_path_));
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigAdapterTest, SchedulerObserverAppliesCapacity)
{
    auto &config = PocoConfigAdapter::getInstance();
    auto control = std::make_shared<FakeEncoderControl>();
    TranscodeScheduler scheduler(makeFakeEncoderFactory(control), getOutputDir(), config.getMaxConcurrentTasks());
    SchedulerConfigObserver observer(scheduler);
    config.subscribe(&observer);

    config.setMaxConcurrentTasks(6);
    EXPECT_EQ(scheduler.getCapacity(), 6);

    // Unrelated keys leave the scheduler alone
    config.setSegmentLengthSeconds(4);
    EXPECT_EQ(scheduler.getCapacity(), 6);

    config.unsubscribe(&observer);
    config.setMaxConcurrentTasks(1);
    EXPECT_EQ(scheduler.getCapacity(), 6);
}

TEST_F(PocoConfigAdapterTest, LoggerObserverAppliesLevel)
{
    auto &config = PocoConfigAdapter::getInstance();
    LoggerObserver observer;
    config.subscribe(&observer);

    config.setLogLevel("WARN");
    config.unsubscribe(&observer);

    EXPECT_TRUE(Logger::isEnabled(Logger::Level::WARN));
    EXPECT_FALSE(Logger::isEnabled(Logger::Level::INFO));
}

TEST_F(PocoConfigAdapterTest, FileWatcherPublishesEditedKeys)
{
    auto &config = PocoConfigAdapter::getInstance();
    RecordingObserver observer;
    config.subscribe(&observer);
    config.startWatching(config_path_, 1);

    // Let the watcher record the current timestamp before editing
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    writeConfig(R"({
        "log_level": "DEBUG",
        "catalog_path": "/etc/transcode/catalog.json",
        "encoder": {"ffmpeg_path": "/opt/ffmpeg/bin/ffmpeg", "kill_grace_ms": 1500},
        "transcode": {"output_directory": "/srv/transcodes", "max_concurrent_tasks": 8},
        "stream": {
            "output_directory": "/srv/hls",
            "segment_length_seconds": 6,
            "max_wait_ms": 12000,
            "poll_interval_ms": 250,
            "preset": "ultrafast"
        }
    })");

    bool seen = waitUntil([&]
                          { return !observer.events().empty(); },
                          std::chrono::milliseconds(5000));
    config.stopWatching();
    config.unsubscribe(&observer);

    ASSERT_TRUE(seen);
    auto events = observer.events();
    EXPECT_EQ(events[0].source, "file_observer");
    EXPECT_TRUE(events[0].touches("transcode.max_concurrent_tasks"));
    EXPECT_EQ(config.getMaxConcurrentTasks(), 8);
}
