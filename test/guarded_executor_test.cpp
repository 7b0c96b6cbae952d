/**
 * @file guarded_executor_test.cpp
 * @brief Deadlines, abandonment and confirmation gating
 *
 * @date 2025
 */

#include "ctfbox/executor/guarded_executor.hpp"

#include "fake_control_plane.hpp"
#include "test_config.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace ctfbox;
using namespace ctfbox::core;
using namespace std::chrono_literals;

using ctfbox::executor::GuardedExecutor;
using ctfbox::test::FakeControlPlane;

class GuardedExecutorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        fake = std::make_shared<FakeControlPlane>();
        timeouts = test::FastTimeouts();
        executor = std::make_unique<GuardedExecutor>(fake, timeouts);
    }

    void TearDown() override
    {
        fake->ReleaseAll();
    }

    std::shared_ptr<FakeControlPlane> fake;
    TimeoutPolicy timeouts;
    std::unique_ptr<GuardedExecutor> executor;
};


TEST_F(GuardedExecutorTest, FastCommandCompletes)
{
    auto result = executor->Execute("c1", "echo hello");

    ASSERT_TRUE(result.IsCompleted()) << Describe(result);
    EXPECT_EQ("hello\n", result.Output());
    EXPECT_TRUE(result.Succeeded());
    EXPECT_GT(result.generation, 0u);
}


TEST_F(GuardedExecutorTest, ExitCodeIsPreserved)
{
    auto result = executor->Execute("c1", "exit 3");

    ASSERT_TRUE(result.IsCompleted());
    EXPECT_EQ(3, std::get<Completed>(result.outcome).exit_code);
    EXPECT_FALSE(result.Succeeded());
}


TEST_F(GuardedExecutorTest, SlowCommandTimesOutWithinBudget)
{
    auto start = std::chrono::steady_clock::now();
    auto result = executor->Execute("c1", "sleep 100");
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.IsTimedOut()) << Describe(result);
    EXPECT_EQ(TimeoutReason::DEADLINE, std::get<TimedOut>(result.outcome).reason);
    EXPECT_GE(waited, timeouts.action_timeout);
    EXPECT_LT(waited, timeouts.action_timeout + 500ms);
}


TEST_F(GuardedExecutorTest, TimeoutReturnsPartialOutput)
{
    fake->SetExecHandler([](const std::string&, const std::string& command,
                            const runtime::ExecOptions&, const runtime::OutputCallback& on_output)
                             -> std::optional<runtime::RawExecResult> {
        if (command != "stream") {
            return std::nullopt;
        }
        on_output("first line\n");
        std::this_thread::sleep_for(600ms);
        return runtime::RawExecResult{0, "first line\nsecond line\n"};
    });

    auto result = executor->Execute("c1", "stream");

    ASSERT_TRUE(result.IsTimedOut());
    EXPECT_EQ("first line\n", result.Output());
}


TEST_F(GuardedExecutorTest, SilenceTriggersNoOutputTimeout)
{
    timeouts.action_timeout = 800ms;
    timeouts.no_output_timeout = 150ms;
    executor = std::make_unique<GuardedExecutor>(fake, timeouts);

    auto result = executor->Execute("c1", "sleep 100");

    ASSERT_TRUE(result.IsTimedOut());
    EXPECT_EQ(TimeoutReason::NO_OUTPUT, std::get<TimedOut>(result.outcome).reason);
    EXPECT_LT(result.elapsed, 700ms);
}


TEST_F(GuardedExecutorTest, OverrideCannotExceedControlPlaneBudget)
{
    ExecutionRequest request;
    request.command = "sleep 100";
    request.timeout = 60s;

    EXPECT_EQ(timeouts.docker_exec_timeout, executor->BudgetFor(request));

    request.timeout = 100ms;
    EXPECT_EQ(100ms, executor->BudgetFor(request));
}


TEST_F(GuardedExecutorTest, BudgetFollowsCallKind)
{
    ExecutionRequest request;

    request.kind = CallKind::AGENT_COMMAND;
    EXPECT_EQ(timeouts.action_timeout, executor->BudgetFor(request));

    request.kind = CallKind::HEALTH_PROBE;
    EXPECT_EQ(timeouts.health_check_timeout, executor->BudgetFor(request));

    request.kind = CallKind::INTERRUPT;
    EXPECT_EQ(timeouts.health_check_timeout, executor->BudgetFor(request));

    request.kind = CallKind::RESTRICTION;
    EXPECT_EQ(timeouts.docker_exec_timeout, executor->BudgetFor(request));
}


TEST_F(GuardedExecutorTest, TimeoutHoldsContainerUntilConfirmed)
{
    auto timed_out = executor->Execute("c1", "sleep 100");
    ASSERT_TRUE(timed_out.IsTimedOut());
    EXPECT_TRUE(executor->IsAwaitingConfirmation("c1"));

    // Agent calls are refused without dispatch
    auto calls_before = fake->ExecCalls().size();
    auto refused = executor->Execute("c1", "echo hi");
    ASSERT_TRUE(refused.IsFailed());
    EXPECT_EQ(0u, refused.generation);
    EXPECT_EQ(calls_before, fake->ExecCalls().size());

    // Probes still go through
    ExecutionRequest probe;
    probe.command = "pwd";
    probe.kind = CallKind::HEALTH_PROBE;
    EXPECT_TRUE(executor->Execute("c1", probe).Succeeded());

    // Other containers are unaffected
    EXPECT_TRUE(executor->Execute("c2", "echo hi").Succeeded());

    executor->ConfirmResponsive("c1");
    EXPECT_FALSE(executor->IsAwaitingConfirmation("c1"));
    EXPECT_TRUE(executor->Execute("c1", "echo hi").Succeeded());
}


TEST_F(GuardedExecutorTest, ConnectionErrorIsNotATimeout)
{
    fake->SetUnreachable(true);

    auto result = executor->Execute("c1", "echo hi");

    ASSERT_TRUE(result.IsFailed());
    EXPECT_EQ(ErrorKind::CONNECTION_FAILURE, std::get<Failed>(result.outcome).kind);
    EXPECT_LT(result.elapsed, timeouts.action_timeout);
    EXPECT_FALSE(executor->IsAwaitingConfirmation("c1"));
}


TEST_F(GuardedExecutorTest, LateResultIsDiscarded)
{
    fake->SetHanging("c1", true);

    auto result = executor->Execute("c1", "echo late");
    ASSERT_TRUE(result.IsTimedOut());
    EXPECT_EQ(1u, executor->AbandonedWorkers());

    fake->SetHanging("c1", false);
    for (int i = 0; i < 100 && executor->AbandonedWorkers() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(0u, executor->AbandonedWorkers());
}


TEST_F(GuardedExecutorTest, GenerationsIncrease)
{
    auto first = executor->Execute("c1", "echo a");
    auto second = executor->Execute("c1", "echo b");

    EXPECT_LT(first.generation, second.generation);
}


TEST_F(GuardedExecutorTest, ExecCarriesMarkerAndOptions)
{
    ExecutionRequest request;
    request.command = "iptables -w -S OUTPUT";
    request.kind = CallKind::RESTRICTION;
    request.privileged = true;
    request.user = "root";

    auto result = executor->Execute("c1", request);
    ASSERT_TRUE(result.Succeeded());

    auto calls = fake->ExecCalls();
    ASSERT_EQ(1u, calls.size());
    EXPECT_TRUE(calls[0].options.privileged);
    EXPECT_EQ("root", calls[0].options.user);
    EXPECT_EQ(GuardedExecutor::MarkerFor(result.generation), calls[0].options.marker);
}


TEST_F(GuardedExecutorTest, InFlightGenerationIsVisibleDuringTheCall)
{
    std::optional<std::uint64_t> seen;
    std::thread observer([&]() {
        std::this_thread::sleep_for(100ms);
        seen = executor->InFlightGeneration("c1");
    });

    auto result = executor->Execute("c1", "sleep 100");
    observer.join();

    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(result.generation, *seen);
    EXPECT_FALSE(executor->InFlightGeneration("c1").has_value());
}


TEST_F(GuardedExecutorTest, GuardReturnsValue)
{
    auto guarded = executor->Guard("answer", 200ms, []() { return 42; });

    ASSERT_TRUE(guarded);
    EXPECT_EQ(42, *guarded.value);
    EXPECT_FALSE(guarded.timed_out);
}


TEST_F(GuardedExecutorTest, GuardTimesOut)
{
    auto start = std::chrono::steady_clock::now();
    auto guarded = executor->Guard("hang", 50ms, []() {
        std::this_thread::sleep_for(500ms);
        return true;
    });

    EXPECT_FALSE(guarded);
    EXPECT_TRUE(guarded.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 400ms);
}


TEST_F(GuardedExecutorTest, GuardReportsExceptions)
{
    auto connection = executor->Guard("down", 200ms, []() -> bool {
        throw runtime::ControlPlaneError("Cannot connect to the Docker daemon");
    });
    EXPECT_FALSE(connection);
    EXPECT_TRUE(connection.connection_error);

    auto other = executor->Guard("broken", 200ms, []() -> bool {
        throw std::runtime_error("boom");
    });
    EXPECT_FALSE(other);
    EXPECT_FALSE(other.connection_error);
    EXPECT_EQ("boom", other.error);
}


TEST(GuardedExecutorConstruction, RequiresControlPlane)
{
    EXPECT_THROW(GuardedExecutor(nullptr, TimeoutPolicy()), std::invalid_argument);
}


TEST(ExecutionResultTest, Describe)
{
    EXPECT_EQ("completed exit=0", Describe(ExecutionResult::MakeCompleted("", 0)));
    EXPECT_EQ("timed out (no output)",
              Describe(ExecutionResult::MakeTimedOut("", TimeoutReason::NO_OUTPUT)));

    auto failed = ExecutionResult::MakeFailed("daemon down", ErrorKind::CONNECTION_FAILURE);
    EXPECT_NE(std::string::npos, Describe(failed).find("daemon down"));
    EXPECT_TRUE(failed.Output().empty());
}
