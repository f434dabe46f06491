#include <gtest/gtest.h>
#include "veil/sink/console_sink.hpp"
#include "veil/sink/callback_sink.hpp"
#include "veil/layout/json_layout.hpp"
#include "veil/layout/masking_layout.hpp"
#include <string>
#include <vector>

namespace {
    veil::LogEntry makeEntry(const std::string &message) {
        veil::LogEntry entry;
        entry.level = veil::LogLevel::INFO;
        entry.message = message;
        entry.templateStr = message;
        entry.timestamp = std::chrono::system_clock::now();
        return entry;
    }
}

TEST(ConsoleSinkTest, StdOutReceivesLine) {
    veil::ConsoleSink sink;
    testing::internal::CaptureStdout();
    sink.write(makeEntry("to stdout"));
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("[INFO] to stdout\n"), std::string::npos);
}

TEST(ConsoleSinkTest, StdErrReceivesLine) {
    veil::ConsoleSink sink(veil::ConsoleStream::StdErr);
    testing::internal::CaptureStderr();
    sink.write(makeEntry("to stderr"));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[INFO] to stderr"), std::string::npos);
}

TEST(ConsoleSinkTest, MaskingLayoutOnConsole) {
    auto engine = std::make_shared<veil::MaskingEngine>();
    veil::EngineConfig config;
    config.addField(veil::SensitiveFieldConfig("senha"));
    engine->configure(config);

    veil::ConsoleSink sink;
    sink.setLayout(veil::detail::make_unique<veil::MaskingLayout>(nullptr, engine));
    testing::internal::CaptureStdout();
    sink.write(makeEntry("login senha=hunter2"));
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("login senha=***"), std::string::npos);
    EXPECT_EQ(out.find("hunter2"), std::string::npos);
}

TEST(CallbackSinkTest, EntryCallback) {
    std::vector<std::string> messages;
    veil::CallbackSink sink(veil::CallbackSink::EntryCallback([&messages](const veil::LogEntry &e) {
        messages.push_back(e.message);
    }));
    sink.write(makeEntry("one"));
    sink.write(makeEntry("two"));

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1], "two");
}

TEST(CallbackSinkTest, StringCallbackWithCustomLayout) {
    std::vector<std::string> lines;
    veil::CallbackSink sink(veil::CallbackSink::StringCallback([&lines](const std::string &line) {
        lines.push_back(line);
    }), veil::detail::make_unique<veil::JsonLayout>());
    sink.write(makeEntry("hello"));

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].front(), '{');
    EXPECT_NE(lines[0].find("\"message\":\"hello\""), std::string::npos);
}

TEST(CallbackSinkTest, EmptyCallbackIsIgnored) {
    veil::CallbackSink sink{veil::CallbackSink::EntryCallback()};
    EXPECT_NO_THROW(sink.write(makeEntry("x")));
}
