#include "test_base.hpp"
#include "stubs/fake_encoder_command.hpp"
#include "core/transcode_task.hpp"
#include <atomic>
#include <future>

class TranscodeTaskTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        control_ = std::make_shared<FakeEncoderControl>();
        media_ = createMedia("m1", 120.0);

        auto target = std::make_shared<Target>();
        target->id = "h264";
        target->label = "H.264";
        target->extension = "mp4";
        target->options.video_codec = "libx264";
        target_ = target;
    }

    std::shared_ptr<TranscodeTask> makeTask(const std::string &id = "task_1")
    {
        output_path_ = getOutputDir() + "/m1/h264.mp4";
        return std::make_shared<TranscodeTask>(id, media_, target_, target_->options, output_path_,
                                               media_.duration_seconds, makeFakeEncoderFactory(control_));
    }

    std::shared_ptr<FakeEncoderControl> control_;
    Media media_;
    TargetPtr target_;
    std::string output_path_;
};

TEST_F(TranscodeTaskTest, SuccessfulRunCompletes)
{
    auto task = makeTask();
    std::vector<Progress> seen;

    auto result = task->run([&](const Progress &p)
                            { seen.push_back(p); });

    ASSERT_TRUE(result.success) << result.describe();
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::COMPLETE);
    EXPECT_TRUE(std::filesystem::exists(output_path_));
    EXPECT_FALSE(task->hasCommand());
    EXPECT_FALSE(task->getProgress().has_value());
    ASSERT_FALSE(seen.empty());
    EXPECT_DOUBLE_EQ(seen.back().fraction, 1.0);
    EXPECT_EQ(control_->options.back().video_codec, std::optional<std::string>("libx264"));
}

TEST_F(TranscodeTaskTest, FailedCommandIsTroubled)
{
    control_->setMode(FakeEncoderControl::Mode::FAIL);
    auto task = makeTask();

    auto result = task->run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, TranscodeError::COMMAND);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::TROUBLED);
    EXPECT_EQ(task->getLastError().error, TranscodeError::COMMAND);
    EXPECT_FALSE(task->hasCommand());
}

TEST_F(TranscodeTaskTest, MissingOutputIsTroubled)
{
    control_->setMode(FakeEncoderControl::Mode::NO_OUTPUT);
    auto task = makeTask();

    auto result = task->run();

    EXPECT_EQ(result.error, TranscodeError::COMMAND);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::TROUBLED);
}

TEST_F(TranscodeTaskTest, MissingSourceIsTroubled)
{
    std::filesystem::remove(media_.source_path);
    auto task = makeTask();

    auto result = task->run();

    EXPECT_EQ(result.error, TranscodeError::NOT_FOUND);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::TROUBLED);
    EXPECT_EQ(control_->created, 0);
}

TEST_F(TranscodeTaskTest, NullFactoryIsTroubled)
{
    auto task = std::make_shared<TranscodeTask>("task_x", media_, target_, target_->options,
                                                getOutputDir() + "/out.mp4", 1.0, nullptr);
    EXPECT_EQ(task->run().error, TranscodeError::COMMAND);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::TROUBLED);
}

TEST_F(TranscodeTaskTest, StaleOutputIsRemovedBeforeRun)
{
    control_->setMode(FakeEncoderControl::Mode::NO_OUTPUT);
    auto task = makeTask();
    std::filesystem::create_directories(std::filesystem::path(output_path_).parent_path());
    std::ofstream(output_path_) << "stale";

    task->run();

    // The stale file does not count as this attempt's output
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::TROUBLED);
    EXPECT_FALSE(std::filesystem::exists(output_path_));
}

TEST_F(TranscodeTaskTest, SecondRunWhileWorkingIsConflict)
{
    control_->setMode(FakeEncoderControl::Mode::BLOCK);
    auto task = makeTask();
    auto running = std::async(std::launch::async, [task]()
                              { return task->run(); });
    ASSERT_TRUE(control_->waitForStarted(1));

    auto second = task->run();
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.error, TranscodeError::CONFLICT);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::WORKING);
    EXPECT_TRUE(task->hasCommand());
    EXPECT_EQ(control_->created, 1);

    control_->release();
    EXPECT_TRUE(running.get().success);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::COMPLETE);
}

TEST_F(TranscodeTaskTest, RunInTerminalOrTroubledStateIsConflict)
{
    auto task = makeTask();
    ASSERT_TRUE(task->run().success);
    EXPECT_EQ(task->run().error, TranscodeError::CONFLICT);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::COMPLETE);

    control_->setMode(FakeEncoderControl::Mode::FAIL);
    auto troubled = makeTask("task_2");
    troubled->run();
    ASSERT_EQ(troubled->getStatus(), TranscodeTaskStatus::TROUBLED);
    EXPECT_EQ(troubled->run().error, TranscodeError::CONFLICT);
}

TEST_F(TranscodeTaskTest, CancelWaitingTask)
{
    auto task = makeTask();
    EXPECT_FALSE(task->cancel());
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::CANCELLED);
    EXPECT_EQ(control_->created, 0);

    // Terminal tasks are untouched
    EXPECT_FALSE(task->cancel());
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::CANCELLED);
}

TEST_F(TranscodeTaskTest, CancelWorkingTaskInterruptsEncoder)
{
    control_->setMode(FakeEncoderControl::Mode::BLOCK);
    auto task = makeTask();
    auto running = std::async(std::launch::async, [task]()
                              { return task->run(); });
    ASSERT_TRUE(control_->waitForStarted(1));
    ASSERT_TRUE(waitUntil([&]
                          { return task->getProgress().has_value(); }));

    EXPECT_TRUE(task->cancel());

    auto result = running.get();
    EXPECT_EQ(result.error, TranscodeError::CANCELLED);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::CANCELLED);
    EXPECT_FALSE(task->hasCommand());
    EXPECT_FALSE(task->getProgress().has_value());
    EXPECT_FALSE(std::filesystem::exists(output_path_));
    EXPECT_EQ(control_->interrupts, 1);
}

TEST_F(TranscodeTaskTest, SuccessWinsOverLateCancel)
{
    control_->setMode(FakeEncoderControl::Mode::BLOCK);
    control_->succeed_when_interrupted = true;
    auto task = makeTask();
    auto running = std::async(std::launch::async, [task]()
                              { return task->run(); });
    ASSERT_TRUE(control_->waitForStarted(1));

    EXPECT_TRUE(task->cancel());

    EXPECT_TRUE(running.get().success);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::COMPLETE);
    EXPECT_TRUE(std::filesystem::exists(output_path_));
}

TEST_F(TranscodeTaskTest, SuspendThenRestartFromBeginning)
{
    control_->setMode(FakeEncoderControl::Mode::BLOCK);
    auto task = makeTask();
    auto running = std::async(std::launch::async, [task]()
                              { return task->run(); });
    ASSERT_TRUE(control_->waitForStarted(1));

    EXPECT_TRUE(task->suspend());
    running.get();
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::SUSPENDED);
    EXPECT_FALSE(task->hasCommand());

    control_->setMode(FakeEncoderControl::Mode::SUCCEED);
    EXPECT_TRUE(task->run().success);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::COMPLETE);
    EXPECT_EQ(control_->created, 2);
}

TEST_F(TranscodeTaskTest, SuspendOnlyAppliesToWorkingTasks)
{
    auto task = makeTask();
    EXPECT_FALSE(task->suspend());
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::WAITING);
}

TEST_F(TranscodeTaskTest, ClosedStartGateLeavesTaskUntouched)
{
    auto task = makeTask();
    int transitions = 0;
    task->setStatusListener([&](const TranscodeTask &, TranscodeTaskStatus, TranscodeTaskStatus)
                            { transitions++; });

    auto result = task->run(nullptr, []
                            { return false; });

    EXPECT_EQ(result.error, TranscodeError::CANCELLED);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::WAITING);
    EXPECT_EQ(transitions, 0);
    EXPECT_EQ(control_->created, 0);
    EXPECT_FALSE(task->hasCommand());

    // An open gate runs the attempt normally
    EXPECT_TRUE(task->run(nullptr, []
                          { return true; })
                    .success);
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::COMPLETE);
}

TEST_F(TranscodeTaskTest, OutcomeDescriptionCarriesLastError)
{
    control_->setMode(FakeEncoderControl::Mode::FAIL);
    auto failed = makeTask("task_failed");
    failed->run();
    EXPECT_EQ(describeOutcome(failed->snapshot()), "TROUBLED: COMMAND: fake encoder exited with status 1");

    control_->setMode(FakeEncoderControl::Mode::SUCCEED);
    auto done = makeTask("task_done");
    ASSERT_TRUE(done->run().success);
    EXPECT_EQ(describeOutcome(done->snapshot()), "COMPLETE -> " + output_path_);

    auto dropped = makeTask("task_dropped");
    dropped->cancel();
    EXPECT_EQ(describeOutcome(dropped->snapshot()), "CANCELLED");
}

TEST_F(TranscodeTaskTest, CancelSuspendedTaskDiscardsAttempt)
{
    control_->setMode(FakeEncoderControl::Mode::BLOCK);
    auto task = makeTask();
    auto running = std::async(std::launch::async, [task]()
                              { return task->run(); });
    ASSERT_TRUE(control_->waitForStarted(1));
    ASSERT_TRUE(task->suspend());
    running.get();
    ASSERT_EQ(task->getStatus(), TranscodeTaskStatus::SUSPENDED);

    EXPECT_TRUE(task->cancel());
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::CANCELLED);
}

TEST_F(TranscodeTaskTest, RetryTroubledTask)
{
    control_->setMode(FakeEncoderControl::Mode::FAIL);
    auto task = makeTask();
    task->run();
    ASSERT_EQ(task->getStatus(), TranscodeTaskStatus::TROUBLED);

    EXPECT_TRUE(task->retry());
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::WAITING);
    EXPECT_TRUE(task->getLastError().success);

    control_->setMode(FakeEncoderControl::Mode::SUCCEED);
    EXPECT_TRUE(task->run().success);
    EXPECT_FALSE(task->retry());
}

TEST_F(TranscodeTaskTest, CancelTroubledTask)
{
    control_->setMode(FakeEncoderControl::Mode::FAIL);
    auto task = makeTask();
    task->run();
    EXPECT_FALSE(task->cancel());
    EXPECT_EQ(task->getStatus(), TranscodeTaskStatus::CANCELLED);
}

TEST_F(TranscodeTaskTest, ListenerSeesEveryTransition)
{
    auto task = makeTask();
    std::vector<std::pair<TranscodeTaskStatus, TranscodeTaskStatus>> seen;
    task->setStatusListener([&](const TranscodeTask &t, TranscodeTaskStatus from, TranscodeTaskStatus to)
                            {
        // The listener runs outside the task lock
        EXPECT_EQ(t.getStatus(), to);
        seen.emplace_back(from, to); });

    ASSERT_TRUE(task->run().success);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, TranscodeTaskStatus::WAITING);
    EXPECT_EQ(seen[0].second, TranscodeTaskStatus::WORKING);
    EXPECT_EQ(seen[1].second, TranscodeTaskStatus::COMPLETE);
}

TEST_F(TranscodeTaskTest, TransitionTable)
{
    using S = TranscodeTaskStatus;
    EXPECT_TRUE(TranscodeTask::isTransitionAllowed(S::WAITING, S::WORKING));
    EXPECT_TRUE(TranscodeTask::isTransitionAllowed(S::SUSPENDED, S::WORKING));
    EXPECT_TRUE(TranscodeTask::isTransitionAllowed(S::TROUBLED, S::WAITING));
    EXPECT_FALSE(TranscodeTask::isTransitionAllowed(S::WAITING, S::COMPLETE));
    EXPECT_FALSE(TranscodeTask::isTransitionAllowed(S::TROUBLED, S::WORKING));
    EXPECT_FALSE(TranscodeTask::isTransitionAllowed(S::COMPLETE, S::WAITING));
    EXPECT_FALSE(TranscodeTask::isTransitionAllowed(S::CANCELLED, S::WAITING));
    EXPECT_TRUE(isTerminal(S::COMPLETE));
    EXPECT_FALSE(isTerminal(S::TROUBLED));
}

TEST_F(TranscodeTaskTest, SnapshotDescribesTask)
{
    auto task = makeTask();
    auto snap = task->snapshot();
    EXPECT_EQ(snap.id, "task_1");
    EXPECT_EQ(snap.media_id, "m1");
    EXPECT_EQ(snap.target_id, "h264");
    EXPECT_EQ(snap.output_path, output_path_);
    EXPECT_EQ(snap.status, TranscodeTaskStatus::WAITING);
    EXPECT_NE(task->toString().find("Status=WAITING"), std::string::npos);
}
