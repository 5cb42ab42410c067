#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>
#include "core/media.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need scratch source files and an output tree
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");

        std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        test_root_ = std::filesystem::temp_directory_path() /
                     ("transcode_test_" + std::to_string(::getpid()) + "_" + test_name);
        std::filesystem::remove_all(test_root_);

        test_files_dir_ = test_root_ / "media";
        output_dir_ = test_root_ / "output";
        std::filesystem::create_directories(test_files_dir_);
        std::filesystem::create_directories(output_dir_);

        Logger::info("TestBase SetUp completed for test: " + test_name);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_root_, ec);
        if (ec)
            Logger::warn("TestBase could not remove " + test_root_.string() + ": " + ec.message());
    }

    // Helper to create a dummy source file for tests
    std::string createDummyFile(const std::string &filename, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_files_dir_ / filename;
        std::ofstream ofs(file_path);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    // Media item backed by a dummy source file
    Media createMedia(const std::string &id, double duration_seconds = 60.0)
    {
        Media media;
        media.id = id;
        media.title = "Title " + id;
        media.source_path = createDummyFile(id + ".mkv");
        media.duration_seconds = duration_seconds;
        media.width = 1920;
        media.height = 1080;
        media.video_codec = "h264";
        media.audio_codec = "aac";
        media.container = "matroska";
        return media;
    }

    // Poll until `predicate` holds or the timeout expires
    template <typename Predicate>
    static bool waitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }

    std::string getTestFilesDir() const { return test_files_dir_.string(); }
    std::string getOutputDir() const { return output_dir_.string(); }
    std::string getTestRoot() const { return test_root_.string(); }

private:
    std::filesystem::path test_root_;
    std::filesystem::path test_files_dir_;
    std::filesystem::path output_dir_;
};
