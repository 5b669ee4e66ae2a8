// EN: Unit tests for built-in consumers - callback adapter, throttled logging and terminal bar
// FR: Tests unitaires des consommateurs intégrés - adaptateur de callback, logging limité et barre terminal

#include <gtest/gtest.h>
#include "infrastructure/logging/logger.hpp"
#include "progress/progress_consumers.hpp"
#include "progress/progress_emitter.hpp"
#include "progress/progress_errors.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace AFP;
using namespace AFP::Progress;
using namespace std::chrono_literals;

namespace {

size_t countLines(const std::string& text) {
    return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
}

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

class ProgressConsumersTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setOutputStream(&log_stream_);
        Logger::getInstance().setLogLevel(LogLevel::DEBUG);
    }

    void TearDown() override {
        Logger::getInstance().setOutputStream(nullptr);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    std::ostringstream log_stream_;
};

// ---------------------------------------------------------------------------
// EN: CallbackAdapterConsumer
// FR: CallbackAdapterConsumer
// ---------------------------------------------------------------------------

TEST_F(ProgressConsumersTest, CallbackReceivesCurrentAndTotal) {
    std::vector<std::pair<int64_t, std::optional<int64_t>>> calls;
    auto adapter = std::make_shared<CallbackAdapterConsumer>(
        [&calls](int64_t current, std::optional<int64_t> total) { calls.emplace_back(current, total); });

    ProgressEmitter emitter(100);
    emitter.addConsumer(adapter);
    emitter.update(50);

    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].first, 50);
    EXPECT_EQ(calls[0].second, 100);
}

TEST_F(ProgressConsumersTest, CallbackReceivesNoTotalWhenIndeterminate) {
    std::vector<std::optional<int64_t>> totals;
    CallbackAdapterConsumer adapter([&totals](int64_t, std::optional<int64_t> total) { totals.push_back(total); });

    adapter.onProgress(ProgressUpdate(ProgressState(3, std::nullopt), 1, UpdateType::PROGRESS));
    ASSERT_EQ(totals.size(), 1u);
    EXPECT_FALSE(totals[0].has_value());
}

TEST_F(ProgressConsumersTest, CallbackInvokedOnCompleteToo) {
    int calls = 0;
    auto adapter = std::make_shared<CallbackAdapterConsumer>([&calls](int64_t, std::optional<int64_t>) { ++calls; });

    ProgressEmitter emitter(10);
    emitter.addConsumer(adapter);
    emitter.complete();

    // EN: Once for the COMPLETED update, once for onComplete
    // FR: Une fois pour la mise à jour COMPLETED, une fois pour onComplete
    EXPECT_EQ(calls, 2);
}

TEST_F(ProgressConsumersTest, CallbackFailureIsLoggedNotRethrown) {
    CallbackAdapterConsumer adapter([](int64_t, std::optional<int64_t>) {
        throw std::runtime_error("legacy sink closed");
    });

    EXPECT_NO_THROW(adapter.onProgress(ProgressUpdate(ProgressState(1, 10), 1, UpdateType::STARTED)));
    EXPECT_NO_THROW(adapter.onComplete(ProgressState(10, 10)));

    const std::string logs = log_stream_.str();
    EXPECT_EQ(countOccurrences(logs, "legacy sink closed"), 2u);
    EXPECT_NE(logs.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(logs.find("progress_callback"), std::string::npos);
}

TEST_F(ProgressConsumersTest, NonStandardCallbackFailureIsLoggedNotRethrown) {
    CallbackAdapterConsumer adapter([](int64_t, std::optional<int64_t>) {
        throw std::string("legacy");
    });

    EXPECT_NO_THROW(adapter.onProgress(ProgressUpdate(ProgressState(1, 10), 1, UpdateType::STARTED)));
    EXPECT_NE(log_stream_.str().find("Legacy progress callback failed: unknown exception"), std::string::npos);
}

TEST_F(ProgressConsumersTest, CallbackFailureDoesNotReachEmitterErrorCount) {
    ProgressEmitter emitter(10);
    emitter.addConsumer(std::make_shared<CallbackAdapterConsumer>([](int64_t, std::optional<int64_t>) {
        throw std::runtime_error("boom");
    }));
    emitter.update(1);
    EXPECT_EQ(emitter.getConsumerErrorCount(), 0u);
}

TEST_F(ProgressConsumersTest, EmptyCallbackIsRejected) {
    EXPECT_THROW(CallbackAdapterConsumer(LegacyProgressCallback{}), InvalidEmitterArgument);
}

// ---------------------------------------------------------------------------
// EN: ThrottledLoggingConsumer
// FR: ThrottledLoggingConsumer
// ---------------------------------------------------------------------------

TEST_F(ProgressConsumersTest, FormatsDeterminateMessage) {
    ProgressState state(45, 100, std::string("Pages"));
    EXPECT_EQ(ThrottledLoggingConsumer::formatProgressMessage(state), "Pages: 45/100 (45.0%)");
    EXPECT_EQ(ThrottledLoggingConsumer::formatCompletionMessage(ProgressState(100, 100, std::string("Pages"))),
              "Pages: complete (100/100)");
}

TEST_F(ProgressConsumersTest, FormatsIndeterminateMessageWithDefaultLabel) {
    ProgressState state(12, std::nullopt);
    EXPECT_EQ(ThrottledLoggingConsumer::formatProgressMessage(state), "Processing: 12 items");
    EXPECT_EQ(ThrottledLoggingConsumer::formatCompletionMessage(state), "Processing: complete (12 items)");
}

TEST_F(ProgressConsumersTest, ZeroTotalMessageHasNoPercentage) {
    ProgressState state(0, 0, std::string("Empty"));
    EXPECT_EQ(ThrottledLoggingConsumer::formatProgressMessage(state), "Empty: 0/0");
    EXPECT_EQ(ThrottledLoggingConsumer::formatCompletionMessage(state), "Empty: complete (0/0)");
}

TEST_F(ProgressConsumersTest, ThrottledLoggerEmitsOneLinePlusCompletion) {
    auto consumer = std::make_shared<ThrottledLoggingConsumer>(Logger::getInstance(), LogLevel::INFO, 5000ms);
    ProgressEmitter emitter(100, std::string("Pages"));
    emitter.addConsumer(consumer);

    for (int i = 0; i < 10; ++i) {
        emitter.update(1);
    }
    emitter.complete();

    const std::string logs = log_stream_.str();
    EXPECT_EQ(countLines(logs), 2u);
    EXPECT_NE(logs.find("Pages: 1/100 (1.0%)"), std::string::npos);
    EXPECT_NE(logs.find("Pages: complete (100/100)"), std::string::npos);
}

TEST_F(ProgressConsumersTest, ThrottledLoggerZeroIntervalLogsEveryUpdate) {
    ThrottledLoggingConsumer consumer(Logger::getInstance(), LogLevel::INFO, 0ms);
    for (int64_t i = 1; i <= 3; ++i) {
        consumer.onProgress(ProgressUpdate(ProgressState(i, 3), 1, UpdateType::PROGRESS));
    }
    EXPECT_EQ(countLines(log_stream_.str()), 3u);
}

TEST_F(ProgressConsumersTest, ThrottledLoggerUsesConfiguredLevelAndModule) {
    ThrottledLoggingConsumer consumer(Logger::getInstance(), LogLevel::DEBUG, 0ms, "ocr");
    consumer.onProgress(ProgressUpdate(ProgressState(1, 2).withMetadata("file", "a.pdf"), 1, UpdateType::STARTED));

    const std::string logs = log_stream_.str();
    EXPECT_NE(logs.find("\"level\":\"DEBUG\""), std::string::npos);
    EXPECT_NE(logs.find("\"module\":\"ocr\""), std::string::npos);
    EXPECT_NE(logs.find("\"update_type\":\"started\""), std::string::npos);
    EXPECT_NE(logs.find("\"file\":\"a.pdf\""), std::string::npos);
}

TEST_F(ProgressConsumersTest, ThrottledLoggerRespectsLoggerThreshold) {
    Logger::getInstance().setLogLevel(LogLevel::WARN);
    ThrottledLoggingConsumer consumer(Logger::getInstance(), LogLevel::INFO, 0ms);
    consumer.onProgress(ProgressUpdate(ProgressState(1, 2), 1, UpdateType::STARTED));
    consumer.onComplete(ProgressState(2, 2));
    EXPECT_TRUE(log_stream_.str().empty());
}

TEST_F(ProgressConsumersTest, ThrottledLoggerRejectsNegativeInterval) {
    EXPECT_THROW(ThrottledLoggingConsumer(Logger::getInstance(), LogLevel::INFO, -1ms), InvalidEmitterArgument);
}

// ---------------------------------------------------------------------------
// EN: TerminalBarConsumer
// FR: TerminalBarConsumer
// ---------------------------------------------------------------------------

class TerminalBarConsumerTest : public ProgressConsumersTest {
protected:
    TerminalBarOptions options() {
        TerminalBarOptions opts;
        opts.output_stream = &bar_stream_;
        opts.bar_width = 10;
        return opts;
    }

    std::ostringstream bar_stream_;
};

TEST_F(TerminalBarConsumerTest, OpensLazilyAndClosesOnComplete) {
    auto consumer = std::make_shared<TerminalBarConsumer>(options());
    EXPECT_FALSE(consumer->isBarOpen());

    ProgressEmitter emitter(4, std::string("Pages"));
    emitter.addConsumer(consumer);
    emitter.update(1);

    ASSERT_TRUE(consumer->isBarOpen());
    EXPECT_EQ(consumer->getBar()->getPosition(), 1);
    EXPECT_EQ(consumer->getBar()->getTitle(), "Pages");

    emitter.complete();
    EXPECT_FALSE(consumer->isBarOpen());
    EXPECT_EQ(consumer->getBarsOpened(), 1u);

    const std::string written = bar_stream_.str();
    EXPECT_NE(written.find("4/4"), std::string::npos);
    EXPECT_EQ(written.back(), '\n');
}

TEST_F(TerminalBarConsumerTest, ReopensOncePerDistinctTotal) {
    auto consumer = std::make_shared<TerminalBarConsumer>(options());
    ProgressEmitter emitter(std::nullopt);
    emitter.addConsumer(consumer);

    emitter.update(1);
    emitter.update(1);
    emitter.updateTotal(10);
    emitter.update(1);
    emitter.updateTotal(20);
    emitter.update(1);

    EXPECT_EQ(consumer->getBarsOpened(), 3u);
    ASSERT_TRUE(consumer->isBarOpen());
    EXPECT_EQ(consumer->getBar()->getTotal(), 20);
    EXPECT_EQ(consumer->getBar()->getPosition(), 4);
}

TEST_F(TerminalBarConsumerTest, CatchesUpOnThrottledUpdates) {
    auto consumer = std::make_shared<TerminalBarConsumer>(options());
    ProgressEmitter emitter(100, std::nullopt, 10000ms);
    emitter.addConsumer(consumer);

    emitter.update(1);
    for (int i = 0; i < 40; ++i) {
        emitter.update(1);
    }
    emitter.update(1, true);
    EXPECT_EQ(consumer->getBar()->getPosition(), 42);
}

TEST_F(TerminalBarConsumerTest, TitleOverridesLabel) {
    auto opts = options();
    opts.title = std::string("Converting");
    auto consumer = std::make_shared<TerminalBarConsumer>(opts);

    consumer->onProgress(ProgressUpdate(ProgressState(1, 3, std::string("Pages")), 1, UpdateType::STARTED));
    EXPECT_EQ(consumer->getBar()->getTitle(), "Converting");

    // EN: The label moves to the trailing text
    // FR: Le label passe dans le texte de fin
    const std::string line = consumer->getBar()->renderLine();
    EXPECT_EQ(line.rfind("Converting ", 0), 0u);
    EXPECT_NE(line.find("1/3 Pages"), std::string::npos);
}

TEST_F(TerminalBarConsumerTest, LabelIsNotRepeatedAsText) {
    auto consumer = std::make_shared<TerminalBarConsumer>(options());
    consumer->onProgress(ProgressUpdate(ProgressState(1, 4, std::string("Pages")), 1, UpdateType::STARTED));

    const std::string line = consumer->getBar()->renderLine();
    EXPECT_EQ(countOccurrences(line, "Pages"), 1u);
    EXPECT_EQ(line.substr(line.size() - 3), "1/4");
}

TEST_F(TerminalBarConsumerTest, CompleteWithoutOpenBarIsNoop) {
    TerminalBarConsumer consumer(options());
    consumer.onComplete(ProgressState(3, 3));
    EXPECT_TRUE(bar_stream_.str().empty());
    EXPECT_EQ(consumer.getBarsOpened(), 0u);
}

TEST_F(TerminalBarConsumerTest, DestructorReleasesOpenBar) {
    {
        TerminalBarConsumer consumer(options());
        consumer.onProgress(ProgressUpdate(ProgressState(1, 3), 1, UpdateType::STARTED));
        ASSERT_TRUE(consumer.isBarOpen());
    }
    EXPECT_EQ(bar_stream_.str().back(), '\n');
    EXPECT_EQ(countLines(bar_stream_.str()), 1u);
}

TEST_F(TerminalBarConsumerTest, IndeterminateCompleteKeepsCount) {
    auto consumer = std::make_shared<TerminalBarConsumer>(options());
    ProgressEmitter emitter(std::nullopt, std::string("Images"));
    emitter.addConsumer(consumer);
    emitter.update(3);
    emitter.complete();

    EXPECT_FALSE(consumer->isBarOpen());
    EXPECT_NE(bar_stream_.str().find("3 items"), std::string::npos);
}
