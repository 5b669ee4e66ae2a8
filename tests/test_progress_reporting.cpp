// EN: Unit tests for reporter selection, legacy callback wiring and ProgressScope
// FR: Tests unitaires pour le choix du rapporteur, le câblage du callback et ProgressScope

#include <gtest/gtest.h>
#include "infrastructure/logging/logger.hpp"
#include "progress/progress_reporting.hpp"
#include "progress_test_utils.hpp"

#include <sstream>
#include <stdexcept>

using namespace AFP;
using namespace AFP::Progress;
using namespace AFP::Progress::Testing;
using namespace std::chrono_literals;

class ProgressReportingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setOutputStream(&log_stream_);
        Logger::getInstance().setLogLevel(LogLevel::DEBUG);
    }

    void TearDown() override {
        Logger::getInstance().setOutputStream(nullptr);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    ReportingOptions options(bool progress, bool verbose, bool interactive) {
        ReportingOptions opts;
        opts.progress = progress;
        opts.verbose = verbose;
        opts.interactive = interactive;
        opts.output_stream = &bar_stream_;
        return opts;
    }

    std::ostringstream log_stream_;
    std::ostringstream bar_stream_;
};

TEST_F(ProgressReportingTest, SelectsReporterFromFlags) {
    EXPECT_EQ(selectReporter(options(false, false, true), true), ReporterKind::NONE);
    EXPECT_EQ(selectReporter(options(false, false, false), false), ReporterKind::NONE);
    EXPECT_EQ(selectReporter(options(true, false, true), true), ReporterKind::TERMINAL_BAR);
    EXPECT_EQ(selectReporter(options(true, false, false), false), ReporterKind::THROTTLED_LOG);
    EXPECT_EQ(selectReporter(options(false, true, true), true), ReporterKind::TERMINAL_BAR);
    EXPECT_EQ(selectReporter(options(false, true, false), false), ReporterKind::THROTTLED_LOG);
}

TEST_F(ProgressReportingTest, AttachesNothingWithoutFlags) {
    ProgressEmitter emitter(10);
    EXPECT_EQ(attachReporter(emitter, options(false, false, true)), nullptr);
    EXPECT_EQ(emitter.getConsumerCount(), 0u);
}

TEST_F(ProgressReportingTest, AttachesTerminalBarWhenInteractive) {
    ProgressSettings settings;
    settings.bar_width = 12;
    settings.title = std::string("Converting");

    ProgressEmitter emitter(10);
    auto consumer = attachReporter(emitter, options(true, false, true), settings);

    auto bar_consumer = std::dynamic_pointer_cast<TerminalBarConsumer>(consumer);
    ASSERT_NE(bar_consumer, nullptr);
    EXPECT_EQ(emitter.getConsumerCount(), 1u);

    emitter.update(5);
    ASSERT_TRUE(bar_consumer->isBarOpen());
    EXPECT_EQ(bar_consumer->getBar()->getTitle(), "Converting");
    EXPECT_NE(bar_stream_.str().find("[######------]"), std::string::npos);
}

TEST_F(ProgressReportingTest, AttachesLoggerWhenNotInteractive) {
    ProgressSettings settings;
    settings.log_interval = 1234ms;

    ProgressEmitter emitter(10, std::string("Pages"));
    auto consumer = attachReporter(emitter, options(false, true, false), settings);

    auto logging_consumer = std::dynamic_pointer_cast<ThrottledLoggingConsumer>(consumer);
    ASSERT_NE(logging_consumer, nullptr);
    EXPECT_EQ(logging_consumer->getLogInterval(), 1234ms);

    emitter.update(3);
    EXPECT_NE(log_stream_.str().find("Pages: 3/10 (30.0%)"), std::string::npos);
    EXPECT_TRUE(bar_stream_.str().empty());
}

TEST_F(ProgressReportingTest, AdaptsLegacyCallback) {
    std::vector<int64_t> seen;
    ProgressEmitter emitter(4);
    auto consumer = adaptLegacyCallback(emitter, [&seen](int64_t current, std::optional<int64_t>) {
        seen.push_back(current);
    });

    ASSERT_NE(consumer, nullptr);
    emitter.update(1);
    emitter.update(2);
    EXPECT_EQ(seen, (std::vector<int64_t>{1, 3}));
}

TEST_F(ProgressReportingTest, EmptyLegacyCallbackAttachesNothing) {
    ProgressEmitter emitter(4);
    EXPECT_EQ(adaptLegacyCallback(emitter, LegacyProgressCallback{}), nullptr);
    EXPECT_EQ(emitter.getConsumerCount(), 0u);
}

// ---------------------------------------------------------------------------
// EN: ProgressScope
// FR: ProgressScope
// ---------------------------------------------------------------------------

TEST_F(ProgressReportingTest, ScopeCompletesOnEarlyExit) {
    auto recorder = std::make_shared<RecordingConsumer>();
    ProgressEmitter emitter(10);
    emitter.addConsumer(recorder);

    try {
        ProgressScope scope(emitter);
        scope.emitter().update(3);
        throw std::runtime_error("page 4 is corrupt");
    } catch (const std::runtime_error&) {
    }

    EXPECT_TRUE(emitter.isCompleted());
    EXPECT_EQ(recorder->completions.size(), 1u);
}

TEST_F(ProgressReportingTest, ScopeDoesNotCompleteTwice) {
    auto recorder = std::make_shared<RecordingConsumer>();
    ProgressEmitter emitter(10);
    emitter.addConsumer(recorder);

    {
        ProgressScope scope(emitter);
        emitter.update(10);
        emitter.complete();
    }

    EXPECT_EQ(recorder->completions.size(), 1u);
}

TEST_F(ProgressReportingTest, ScopeClosesTerminalBar) {
    ProgressEmitter emitter(10);
    auto consumer = std::dynamic_pointer_cast<TerminalBarConsumer>(
        attachReporter(emitter, options(true, false, true)));
    ASSERT_NE(consumer, nullptr);

    {
        ProgressScope scope(emitter);
        emitter.update(2);
        EXPECT_TRUE(consumer->isBarOpen());
    }

    EXPECT_FALSE(consumer->isBarOpen());
    EXPECT_EQ(bar_stream_.str().back(), '\n');
}

TEST_F(ProgressReportingTest, ScopeSurvivesConsumerThrowingAnything) {
    class FailingOnCompleteConsumer : public ProgressConsumer {
    public:
        void onProgress(const ProgressUpdate&) override {}
        void onComplete(const ProgressState&) override { throw 42; }
    };

    ProgressEmitter emitter(10);
    emitter.addConsumer(std::make_shared<FailingOnCompleteConsumer>());

    EXPECT_NO_THROW({
        ProgressScope scope(emitter);
        emitter.update(4);
    });
    EXPECT_TRUE(emitter.isCompleted());
    EXPECT_EQ(emitter.getConsumerErrorCount(), 1u);
}

TEST_F(ProgressReportingTest, ScopeFailReportsError) {
    auto recorder = std::make_shared<RecordingConsumer>();
    ProgressEmitter emitter(10);
    emitter.addConsumer(recorder);

    {
        ProgressScope scope(emitter);
        scope.fail("disk full");
    }

    ASSERT_EQ(recorder->updates.size(), 2u);
    EXPECT_EQ(recorder->updates[0].getType(), UpdateType::ERROR);
    EXPECT_EQ(recorder->updates[0].getState().getMetadata().at("error"), "disk full");
    EXPECT_EQ(recorder->updates[1].getType(), UpdateType::COMPLETED);
}
