#include <gtest/gtest.h>
#include <common/logging.hpp>
#include <process/message_sink.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <utility>

using namespace lasercut;

namespace {

using Received = std::vector<std::pair<std::string, bool>>;

MessageCallback collect_into(Received& received) {
    return [&received](const std::string& text, bool is_debug_only) {
        received.emplace_back(text, is_debug_only);
    };
}

}  // namespace

// ============== CallbackSink ==============

TEST(CallbackSinkTest, DebugMessagesHiddenByDefault) {
    Received received;
    CallbackSink sink(collect_into(received), false);
    sink.write({"details", true});
    sink.write({"Warning! something", false});

    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].first, "Warning! something");
    EXPECT_FALSE(received[0].second);
}

TEST(CallbackSinkTest, DebugModeForwardsEverything) {
    Received received;
    CallbackSink sink(collect_into(received), true);
    sink.write({"details", true});
    sink.write({"always", false});

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], std::make_pair(std::string("details"), true));
    EXPECT_EQ(received[1], std::make_pair(std::string("always"), false));
}

TEST(CallbackSinkTest, MissingCallbackDropsMessages) {
    CallbackSink sink(nullptr, true);
    EXPECT_NO_THROW(sink.write({"nobody listens", false}));
}

// ============== RecordingSink ==============

TEST(RecordingSinkTest, RecordsEverythingInOrder) {
    Received received;
    CallbackSink callback(collect_into(received), false);
    RecordingSink recording(callback);

    recording.write({"one", true});
    recording.write({"two", false});
    recording.write({"three", true});

    ASSERT_EQ(recording.messages().size(), 3u);
    EXPECT_EQ(recording.messages()[0], (ProcessMessage{"one", true}));
    EXPECT_EQ(recording.messages()[2], (ProcessMessage{"three", true}));
    EXPECT_EQ(received.size(), 1u);

    std::vector<ProcessMessage> taken = recording.take_messages();
    EXPECT_EQ(taken.size(), 3u);
    EXPECT_TRUE(recording.messages().empty());
}

// ============== MessageLog ==============

TEST(MessageLogTest, DebugAndAlwaysSetVisibility) {
    Received received;
    CallbackSink callback(collect_into(received), true);
    RecordingSink recording(callback);
    MessageLog log(recording);

    log.debug("[FACE] detail");
    log.always("Parsing STEP file contents...");

    ASSERT_EQ(recording.messages().size(), 2u);
    EXPECT_TRUE(recording.messages()[0].is_debug_only);
    EXPECT_FALSE(recording.messages()[1].is_debug_only);
    EXPECT_EQ(received[1].first, "Parsing STEP file contents...");
}

TEST(MessageLogTest, LogLevelNames) {
    EXPECT_EQ(logging::level_from_name("debug"), spdlog::level::debug);
    EXPECT_EQ(logging::level_from_name("error"), spdlog::level::err);
    EXPECT_EQ(logging::level_from_name("off"), spdlog::level::off);
    EXPECT_FALSE(logging::level_from_name("loud").has_value());
    EXPECT_FALSE(logging::level_from_name("DEBUG").has_value());
}

TEST(MessageLogTest, VisibleMessagesAreNotRepeatedOnTheLogger) {
    auto logger = logging::get_logger();
    std::ostringstream captured;
    auto capture = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured, true);
    capture->set_pattern("%l %v");
    auto previous_level = logger->level();
    logger->sinks().push_back(capture);

    Received received;
    CallbackSink callback(collect_into(received), false);
    MessageLog log(callback);

    logger->set_level(spdlog::level::info);
    log.always("Warning! No thin solids found");
    std::string at_info = captured.str();

    logger->set_level(spdlog::level::debug);
    log.always("Warning! No thin solids found");
    std::string at_debug = captured.str();

    logger->sinks().pop_back();
    logger->set_level(previous_level);

    EXPECT_EQ(received.size(), 2u);
    EXPECT_TRUE(at_info.empty());
    EXPECT_NE(at_debug.find("debug [message] Warning! No thin solids found"), std::string::npos);
}
