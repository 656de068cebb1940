// tests/test_layer2_service/test_sinks.cpp
/**
 * @file test_sinks.cpp
 * @brief Sink formatting, FileSink and SinkConfig construction, without the Logger facade.
 */
#include <cstdio>
#include <regex>

#include "ct_service.hpp"
#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include <fmt/color.h>
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using namespace calltrace::utils;
using namespace calltrace::tests::helper;
using ::testing::HasSubstr;
using ::testing::Not;
namespace fs = std::filesystem;

namespace
{

LogMessage make_msg(int level, std::string_view host, std::string_view body)
{
    LogMessage msg;
    msg.timestamp = std::chrono::system_clock::now();
    msg.process_id = 1;
    msg.thread_id = 1;
    msg.level = level;
    msg.host_label = host;
    msg.body.append(body.data(), body.data() + body.size());
    return msg;
}

class SinkTest : public ::testing::Test
{
  protected:
    void SetUp() override { dir_ = make_temp_log_dir("sinks"); }
    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    fs::path dir_;
};

} // namespace

TEST_F(SinkTest, PlainLineFormat)
{
    const auto line = Sink::format_logmsg(make_msg(20, "x86_64-42", "[add]: Adds 2 and 3"));
    EXPECT_TRUE(std::regex_match(
        line, std::regex(R"(x86_64-42: \d{2}/\d{2} \d{2}:\d{2}:\d{2} \| INFO \| \[add\]: Adds 2 and 3\n)")))
        << line;
}

TEST_F(SinkTest, LevelNames)
{
    EXPECT_STREQ(Sink::level_to_string_internal(10), "DEBUG");
    EXPECT_STREQ(Sink::level_to_string_internal(30), "WARNING");
    EXPECT_STREQ(Sink::level_to_string_internal(50), "CRITICAL");
    EXPECT_STREQ(Sink::level_to_string_internal(7), "UNK");
}

TEST_F(SinkTest, ColoredConsoleKeepsTextAndPadsLevel)
{
    const auto colored = ConsoleSink::format_colored(make_msg(20, "arm64", "[login]: Log in\ndetail"));
    EXPECT_THAT(colored, HasSubstr("\x1b["));
    EXPECT_THAT(colored, HasSubstr("INFO "));
    EXPECT_THAT(colored, HasSubstr("[login]"));
    EXPECT_THAT(colored, HasSubstr("\ndetail\n"));

    const auto warning = ConsoleSink::format_colored(make_msg(30, "arm64", "careful"));
    EXPECT_THAT(warning, HasSubstr("| WARNING | careful\n"));
}

TEST_F(SinkTest, ColoredConsoleStylesEachLevel)
{
    const auto styled = [](fmt::terminal_color color, const char *name)
    { return fmt::format(fmt::emphasis::bold | fmt::fg(color), "{:<5}", name); };
    const auto line_for = [](Logger::Level lvl)
    { return ConsoleSink::format_colored(make_msg(static_cast<int>(lvl), "arm64", "x")); };

    EXPECT_THAT(line_for(Logger::Level::L_DEBUG),
                HasSubstr(styled(fmt::terminal_color::bright_blue, "DEBUG")));
    EXPECT_THAT(line_for(Logger::Level::L_INFO),
                HasSubstr(styled(fmt::terminal_color::bright_white, "INFO")));
    EXPECT_THAT(line_for(Logger::Level::L_ERROR),
                HasSubstr(styled(fmt::terminal_color::red, "ERROR")));
    EXPECT_THAT(line_for(Logger::Level::L_CRITICAL), HasSubstr("| CRITICAL | x\n"));
}

TEST_F(SinkTest, ConsoleSinkWritesPlainLinesWithoutColor)
{
    std::FILE *tmp = std::tmpfile();
    ASSERT_NE(tmp, nullptr);
    {
        ConsoleSink sink(/*use_color=*/false, tmp);
        sink.write(make_msg(40, "arm64", "disk full"));
        sink.flush();
    }
    std::rewind(tmp);
    char buf[256] = {};
    const auto n = std::fread(buf, 1, sizeof(buf) - 1, tmp);
    std::fclose(tmp);
    const std::string out(buf, n);
    EXPECT_THAT(out, HasSubstr("| ERROR | disk full\n"));
    EXPECT_THAT(out, Not(HasSubstr("\x1b[")));
}

TEST_F(SinkTest, FileSinkTruncatesOnOpen)
{
    const auto path = dir_ / "f.log";
    {
        FileSink sink(path, /*truncate=*/true);
        sink.write(make_msg(20, "h", "first run"));
        sink.flush();
    }
    {
        FileSink sink(path, /*truncate=*/true);
        EXPECT_EQ(sink.description(), "File: " + path.string());
        sink.write(make_msg(20, "h", "second run"));
        sink.flush();
    }
    std::string contents;
    ASSERT_TRUE(read_file_contents(path.string(), contents));
    EXPECT_THAT(contents, Not(HasSubstr("first run")));
    EXPECT_EQ(count_lines(contents, "second run"), 1u);
}

TEST_F(SinkTest, FileSinkAppendsWithoutTruncate)
{
    const auto path = dir_ / "a.log";
    for (const char *body : {"one", "two"})
    {
        FileSink sink(path, /*truncate=*/false);
        sink.write(make_msg(20, "h", body));
        sink.flush();
    }
    std::string contents;
    ASSERT_TRUE(read_file_contents(path.string(), contents));
    EXPECT_EQ(count_lines(contents, " | INFO | "), 2u);
}

TEST_F(SinkTest, FileSinkReportsUnopenablePath)
{
    EXPECT_THROW(FileSink(dir_ / "no_such_dir" / "x.log", true), std::runtime_error);
}

TEST_F(SinkTest, HostLabelAppendsLastOctet)
{
    EXPECT_EQ(SinkConfig::make_host_label("x86_64", "192.168.10.23"), "x86_64-23");
    EXPECT_EQ(SinkConfig::make_host_label("x86_64", ""), "x86_64");
    EXPECT_EQ(SinkConfig::make_host_label("x86_64", "not-an-ip"), "x86_64");
}

TEST_F(SinkTest, SinkConfigRoutesByLevel)
{
    auto cfg = make_worker_config(dir_);
    cfg.log_level = "INFO";
    cfg.sys_arch = "testarch";
    cfg.host_ip = "10.0.0.5";

    std::string debug_text, error_text;
    {
        SinkConfig sinks(cfg);
        EXPECT_EQ(sinks.root_level(), 20);
        EXPECT_EQ(sinks.host_label(), "testarch-5");
        EXPECT_EQ(sinks.log_dir(), dir_ / "logs");
        EXPECT_EQ(sinks.descriptions().size(), 3u);

        sinks.dispatch(10, "below root");
        sinks.dispatch(20, "routine");
        sinks.dispatch(40, "broken");
        sinks.flush();

        ASSERT_TRUE(read_file_contents(sinks.debug_log_path().string(), debug_text));
        ASSERT_TRUE(read_file_contents(sinks.error_log_path().string(), error_text));
    }
    EXPECT_THAT(debug_text, Not(HasSubstr("below root")));
    EXPECT_THAT(debug_text, HasSubstr("testarch-5: "));
    EXPECT_EQ(count_lines(debug_text, "routine"), 1u);
    EXPECT_EQ(count_lines(debug_text, "broken"), 1u);
    EXPECT_THAT(error_text, Not(HasSubstr("routine")));
    EXPECT_EQ(count_lines(error_text, "| ERROR | broken"), 1u);
}

TEST_F(SinkTest, SinkConfigRejectsUnknownLevel)
{
    auto cfg = make_worker_config(dir_);
    cfg.log_level = "VERBOSE";
    EXPECT_THROW(SinkConfig sinks(cfg), std::invalid_argument);
}
