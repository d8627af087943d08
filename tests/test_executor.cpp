#include <gtest/gtest.h>
#include <eggshell/core/errors.hpp>
#include <eggshell/core/executor.hpp>

#include "fake_engine.hpp"
#include "test_support.hpp"

using namespace eggshell::core;
using eggshell::engine::LogChunk;
using eggshell::utils::CancellationToken;
using eggshell::utils::OutputStream;
using eggshell::utils::StringSink;
using eggshell_test::FakeContainerEngine;

namespace {

const std::string kProfile = R"({"defaultAction":"SCMP_ACT_ALLOW"})";

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_shared<FakeContainerEngine>();
        out = std::make_shared<StringSink>();
        err = std::make_shared<StringSink>();
        builder.WithDockerfile("FROM alpine\n")
               .WithFiles(std::make_shared<MemoryFileSet>(
                   std::vector<std::pair<std::string, std::string>>{{"main.sh", "echo hi"}}))
               .WithCommand("sh main.sh")
               .WithStdout(out)
               .WithStderr(err);
    }

    ExecutionResult Run(const CancellationToken& token = CancellationToken()) {
        Executor executor(engine, builder.Build());
        return executor.Execute(token);
    }

    std::shared_ptr<FakeContainerEngine> engine;
    std::shared_ptr<StringSink> out;
    std::shared_ptr<StringSink> err;
    ExecutorBuilder builder;
};

} // namespace

// ============================================================================
// Completion
// ============================================================================

TEST_F(ExecutorTest, SuccessfulRunRoutesOutputAndCleansUp) {
    engine->log_chunks = {{OutputStream::STDOUT, "hello\n"},
                          {OutputStream::STDERR, "warning\n"},
                          {OutputStream::STDOUT, "bye\n"}};

    auto result = Run();

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(out->str(), "hello\nbye\n");
    EXPECT_EQ(err->str(), "warning\n");
    EXPECT_EQ(engine->calls, (std::vector<std::string>{"build", "create", "start", "logs",
                                                       "stop", "subscribe", "rm", "rmi"}));
    EXPECT_EQ(engine->subscription_cancels.load(), 1);
}

TEST_F(ExecutorTest, NonZeroExitIsACompletion) {
    engine->exit_code = "1";
    auto result = Run();
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(engine->Count("rm"), 1);
    EXPECT_EQ(engine->Count("rmi"), 1);
}

TEST_F(ExecutorTest, StopFailureIsNotFatal) {
    engine->stop_error = "daemon hiccup";
    auto result = Run();
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(ExecutorTest, CombinedOutputKeepsOrder) {
    auto combined = std::make_shared<StringSink>();
    builder.WithCombinedOutput(combined);
    engine->log_chunks = {{OutputStream::STDOUT, "a"},
                          {OutputStream::STDERR, "b"},
                          {OutputStream::STDOUT, "c"}};
    Run();
    EXPECT_EQ(combined->str(), "abc");
}

TEST_F(ExecutorTest, OutputWithoutSinksIsDiscarded) {
    builder.WithStdout(nullptr).WithStderr(nullptr);
    engine->log_chunks = {{OutputStream::STDOUT, "dropped"}};
    EXPECT_EQ(Run().exit_code, 0);
}

TEST_F(ExecutorTest, IdentifiersAreRandomHex) {
    Executor executor(engine, builder.Build());
    EXPECT_TRUE(executor.image_tag().empty());

    auto result = executor.Execute();

    EXPECT_TRUE(eggshell_test::IsHexString(result.image_tag, 32));
    EXPECT_TRUE(eggshell_test::IsHexString(result.container_id, 32));
    EXPECT_NE(result.image_tag, result.container_id);
    EXPECT_EQ(executor.image_tag(), result.image_tag);
    EXPECT_EQ(engine->built_tag, result.image_tag);
    EXPECT_EQ(engine->last_spec.name, result.container_id);
    EXPECT_EQ(engine->last_spec.image, result.image_tag);
    EXPECT_EQ(engine->last_filter.container, result.container_id);
    EXPECT_EQ(engine->last_filter.image, result.image_tag);
    EXPECT_EQ(engine->last_filter.event, "die");
}

TEST_F(ExecutorTest, ExecutorIsSingleUse) {
    Executor executor(engine, builder.Build());
    executor.Execute();
    EXPECT_THROW(executor.Execute(), std::logic_error);
}

TEST(Executor, RequiresEngine) {
    EXPECT_THROW(Executor(nullptr, ExecutorConfig()), std::invalid_argument);
}

// ============================================================================
// Container specification
// ============================================================================

TEST_F(ExecutorTest, SpecReflectsConfiguration) {
    builder.WithNetworkMode(NetworkMode::NONE)
           .WithRuntime("")
           .WithTimeout(std::chrono::seconds(5))
           .WithSeccompProfile(kProfile)
           .WithCommand("echo hi");

    Executor executor(engine, builder.Build());
    executor.Execute();

    const auto& spec = engine->last_spec;
    EXPECT_EQ(spec.network_mode, "none");
    EXPECT_EQ(spec.runtime, "");
    EXPECT_EQ(spec.stop_timeout, std::chrono::seconds(5));
    EXPECT_EQ(spec.command, (std::vector<std::string>{"sh", "-c", "echo hi"}));
    EXPECT_TRUE(spec.attach_stdout);
    EXPECT_TRUE(spec.attach_stderr);

    ASSERT_TRUE(executor.profile_name().has_value());
    const std::string& profile = *executor.profile_name();
    ASSERT_EQ(spec.security_opts.size(), 1u);
    EXPECT_EQ(spec.security_opts[0], "seccomp=" + profile);
    EXPECT_EQ(spec.context_files.at(profile), kProfile);

    auto entries = eggshell_test::ReadTar(engine->built_context);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "main.sh");
    EXPECT_EQ(entries[1].name, "Dockerfile");
    EXPECT_EQ(entries[2].name, profile);
}

TEST_F(ExecutorTest, DefaultsUseBridgeAndSandboxRuntime) {
    Run();
    EXPECT_EQ(engine->last_spec.network_mode, "bridge");
    EXPECT_EQ(engine->last_spec.runtime, kDefaultRuntime);
    EXPECT_EQ(engine->last_spec.stop_timeout, std::chrono::seconds(300));
    EXPECT_TRUE(engine->last_spec.security_opts.empty());
    EXPECT_TRUE(engine->last_spec.context_files.empty());
}

TEST_F(ExecutorTest, UnconfinedProfilePassesThrough) {
    builder.WithSeccompProfile(kUnconfinedSeccompProfile);
    Run();
    EXPECT_EQ(engine->last_spec.security_opts,
              (std::vector<std::string>{"seccomp=unconfined"}));
    EXPECT_TRUE(engine->last_spec.context_files.empty());
}

TEST_F(ExecutorTest, NoTimeoutWaitsForever) {
    builder.WithTimeout(kNoTimeout);
    Run();
    EXPECT_EQ(engine->last_spec.stop_timeout, std::chrono::seconds(-1));
}

TEST_F(ExecutorTest, EmptyFileSetStillBuilds) {
    builder.WithFiles(nullptr);
    Run();
    auto entries = eggshell_test::ReadTar(engine->built_context);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "Dockerfile");
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(ExecutorTest, TimeoutExitRaisesTimeoutError) {
    engine->exit_code = "137";
    builder.WithCommand("sleep 100");

    try {
        Run();
        FAIL() << "expected TimeoutError";
    } catch (const TimeoutError& e) {
        EXPECT_EQ(e.command(), "sleep 100");
        EXPECT_EQ(e.container_id(), engine->last_spec.name);
        EXPECT_EQ(e.image_tag(), engine->built_tag);
    }
    EXPECT_EQ(engine->Count("rm"), 1);
    EXPECT_EQ(engine->Count("rmi"), 1);
}

TEST_F(ExecutorTest, TimeoutKeepsOutputPrintedBeforeTheKill) {
    engine->exit_code = "137";
    engine->chunk_delay = std::chrono::milliseconds(20);
    std::string expected;
    for (int i = 0; i < 10; ++i) {
        std::string line = std::to_string(i) + "\n";
        engine->log_chunks.push_back({OutputStream::STDOUT, line});
        expected += line;
    }

    EXPECT_THROW(Run(), TimeoutError);
    EXPECT_EQ(out->str(), expected);
    EXPECT_EQ(engine->Count("rm"), 1);
}

TEST_F(ExecutorTest, EventErrorRaisesEngineError) {
    engine->exit_code.reset();
    engine->event_error = "event stream broke";
    try {
        Run();
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_STREQ(e.what(), "event stream broke");
    }
    EXPECT_EQ(engine->Count("rm"), 1);
}

TEST_F(ExecutorTest, StartFailureStopsAndRethrows) {
    engine->start_error = "runtime not found";
    EXPECT_THROW(Run(), EngineError);
    EXPECT_EQ(engine->calls, (std::vector<std::string>{"build", "create", "start", "stop",
                                                       "rm", "rmi"}));
    ASSERT_EQ(engine->stop_graces.size(), 1u);
    EXPECT_EQ(engine->stop_graces[0], std::chrono::seconds(0));
}

TEST_F(ExecutorTest, BuildFailureStillRemovesImage) {
    engine->build_error = "bad Dockerfile";
    EXPECT_THROW(Run(), EngineError);
    EXPECT_EQ(engine->calls, (std::vector<std::string>{"build", "rmi"}));
}

TEST_F(ExecutorTest, CreateFailureRemovesImageOnly) {
    engine->create_error = "name conflict";
    EXPECT_THROW(Run(), EngineError);
    EXPECT_EQ(engine->calls, (std::vector<std::string>{"build", "create", "rmi"}));
}

TEST_F(ExecutorTest, LogFailureCleansUpContainer) {
    engine->logs_error = "cannot attach";
    EXPECT_THROW(Run(), EngineError);
    EXPECT_EQ(engine->Count("rm"), 1);
    EXPECT_EQ(engine->Count("rmi"), 1);
}

TEST_F(ExecutorTest, AssemblyFailureNeverTouchesEngine) {
    builder.WithFiles(std::make_shared<MemoryFileSet>(
        std::vector<std::pair<std::string, std::string>>{{"..", "x"}}));
    EXPECT_THROW(Run(), IoError);
    EXPECT_TRUE(engine->calls.empty());
}

TEST_F(ExecutorTest, CancelledBeforeStartNeverTouchesEngine) {
    CancellationToken token;
    token.Cancel();
    EXPECT_THROW(Run(token), CancelledError);
    EXPECT_TRUE(engine->calls.empty());
}

TEST_F(ExecutorTest, CancelledWhileWaitingForExit) {
    engine->exit_code.reset();
    auto token = CancellationToken::WithTimeout(std::chrono::milliseconds(200));

    EXPECT_THROW(Run(token), CancelledError);
    EXPECT_EQ(engine->Count("subscribe"), 1);
    EXPECT_EQ(engine->subscription_cancels.load(), 1);
    EXPECT_EQ(engine->Count("rm"), 1);
    EXPECT_EQ(engine->Count("rmi"), 1);
}

// ============================================================================
// Preserved containers
// ============================================================================

TEST_F(ExecutorTest, KeepContainerSkipsRemoval) {
    builder.KeepContainer();
    Run();
    EXPECT_EQ(engine->Count("rm"), 0);
    EXPECT_EQ(engine->Count("stop"), 1);
    EXPECT_EQ(engine->Count("rmi"), 1);
}

TEST_F(ExecutorTest, KeptContainerIsStoppedOnFailure) {
    builder.KeepContainer();
    engine->exit_code.reset();
    engine->event_error = "lost";
    EXPECT_THROW(Run(), EngineError);
    EXPECT_EQ(engine->Count("rm"), 0);
    ASSERT_EQ(engine->stop_graces.size(), 2u);
    EXPECT_EQ(engine->stop_graces[1], std::chrono::seconds(0));
}

TEST_F(ExecutorTest, KeptContainerIsNotStoppedAgainAfterTimeout) {
    builder.KeepContainer();
    engine->exit_code = "137";
    EXPECT_THROW(Run(), TimeoutError);
    EXPECT_EQ(engine->Count("rm"), 0);
    ASSERT_EQ(engine->stop_graces.size(), 1u);
    EXPECT_NE(engine->stop_graces[0], std::chrono::seconds(0));
}

TEST_F(ExecutorTest, KeptContainerIsNotStoppedAgainAfterBadExitCode) {
    builder.KeepContainer();
    engine->exit_code = "abc";
    EXPECT_THROW(Run(), EngineError);
    EXPECT_EQ(engine->Count("rm"), 0);
    EXPECT_EQ(engine->stop_graces.size(), 1u);
}
