#include <gtest/gtest.h>
#include <arith/log.hpp>
#include <arith/repl.hpp>

#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

arith::ReplConfig quiet() {
    arith::ReplConfig cfg;
    cfg.prompt = "";
    return cfg;
}

TEST(Repl, PrintsResultsAndErrorsUntilExit) {
    std::istringstream in("2 + 3 * 4\n7 / 2\n1 + a\nEXIT\n9\n");
    std::ostringstream out;
    arith::Repl repl(quiet());

    EXPECT_EQ(repl.run(in, out), 1u);
    EXPECT_EQ(out.str(),
              "14\n"
              "3.5\n"
              "error: Unexpected character 'a' at position 4\n"
              "Exiting.\n");
    EXPECT_EQ(repl.stats().evaluated, 3u);
    EXPECT_EQ(repl.stats().failed, 1u);
}

TEST(Repl, ErrorsDoNotStopTheSession) {
    std::istringstream in("(1 + 2\n1 / 0\n10 - 2 - 3\n");
    std::ostringstream out;
    arith::Repl repl(quiet());

    EXPECT_EQ(repl.run(in, out), 2u);
    EXPECT_EQ(out.str(),
              "error: Expected ')' but found end of input\n"
              "error: Division by zero\n"
              "5\n"
              "\n");
}

TEST(Repl, BlankLinesAreSkipped) {
    std::istringstream in("\n   \n  exit  \n");
    std::ostringstream out;
    arith::Repl repl(quiet());
    EXPECT_EQ(repl.run(in, out), 0u);
    EXPECT_EQ(out.str(), "Exiting.\n");
    EXPECT_EQ(repl.stats().evaluated, 0u);
}

TEST(Repl, WritesPromptBeforeEachLine) {
    std::istringstream in("1\nexit\n");
    std::ostringstream out;
    arith::ReplConfig cfg;
    cfg.prompt = "> ";
    arith::Repl repl(cfg);
    repl.run(in, out);
    EXPECT_EQ(out.str(), "> 1\n> Exiting.\n");
}

TEST(Repl, ShowTreeDumpsBeforeTheResult) {
    arith::ReplConfig cfg = quiet();
    cfg.show_tree = true;
    arith::Repl repl(cfg);
    std::ostringstream out;
    EXPECT_TRUE(repl.handle_line("4 / 8", out));
    EXPECT_EQ(out.str(),
              "BinOp:\n"
              "  left:\n"
              "    Num(4)\n"
              "  op: SLASH\n"
              "  right:\n"
              "    Num(8)\n"
              "0.5\n");
}

TEST(Repl, FormatResult) {
    EXPECT_EQ(arith::format_result(arith::Value{arith::Integer{14}}), "14");
    EXPECT_EQ(arith::format_result(arith::Value{arith::Integer{-1}}), "-1");
    EXPECT_EQ(arith::format_result(arith::Value{arith::Integer{9223372036854775807}}), "9223372036854775807");
    EXPECT_EQ(arith::format_result(arith::Value{3.5}), "3.5");
    EXPECT_EQ(arith::format_result(arith::Value{2.0}), "2");
    EXPECT_EQ(arith::format_result(arith::Value{1e15}), "1000000000000000");
    EXPECT_EQ(arith::format_result(arith::Value{1e20}), "1e+20");
    EXPECT_EQ(arith::format_result(arith::Value{1.0 / 3.0}), "0.3333333333333333");
}

TEST(Repl, LargeIntegersPrintExactly) {
    std::istringstream in("9007199254740993\n1000000000000000\n1000000000000000 / 1\n");
    std::ostringstream out;
    arith::Repl repl(quiet());
    repl.run(in, out);
    EXPECT_EQ(out.str(), "9007199254740993\n1000000000000000\n1000000000000000\n\n");
}

TEST(Repl, DeepInputIsReportedNotFatal) {
    std::istringstream in(std::string(100000, '(') + "1" + std::string(100000, ')') + "\n2 * 3\n");
    std::ostringstream out;
    arith::Repl repl(quiet());
    EXPECT_EQ(repl.run(in, out), 1u);
    EXPECT_EQ(out.str(), "error: Expression nested too deeply\n6\n\n");
}

TEST(Repl, FailuresAreLogged) {
    std::ostringstream log;
    auto& logger = arith::Logger::instance();
    logger.set_sink(log);
    logger.set_level(arith::LogLevel::Debug);

    arith::Repl repl(quiet());
    std::ostringstream out;
    repl.handle_line("6 / 3", out);
    repl.handle_line("1/0", out);

    logger.set_sink(std::clog);
    logger.set_level(arith::LogLevel::Warn);

    EXPECT_EQ(log.str(),
              "[arith] debug: '6 / 3' = 2\n"
              "[arith] warn: '1/0' failed: Division by zero\n");
}

TEST(Config, Defaults) {
    auto cfg = arith::ReplConfig::from_env(std::map<std::string, std::string>{});
    EXPECT_EQ(cfg.prompt, "> ");
    EXPECT_FALSE(cfg.show_tree);
    EXPECT_EQ(cfg.log_level, arith::LogLevel::Warn);
}

TEST(Config, EnvironmentOverrides) {
    auto cfg = arith::ReplConfig::from_env({
        {"ARITH_PROMPT", "calc> "},
        {"ARITH_SHOW_TREE", "Yes"},
        {"ARITH_LOG_LEVEL", " DEBUG "},
    });
    EXPECT_EQ(cfg.prompt, "calc> ");
    EXPECT_TRUE(cfg.show_tree);
    EXPECT_EQ(cfg.log_level, arith::LogLevel::Debug);

    const std::map<std::string, std::string> off{{"ARITH_SHOW_TREE", "0"}};
    EXPECT_FALSE(arith::ReplConfig::from_env(off).show_tree);
}

TEST(Config, UnknownLogLevel) {
    const std::map<std::string, std::string> loud{{"ARITH_LOG_LEVEL", "loud"}};
    EXPECT_THROW(arith::ReplConfig::from_env(loud), std::invalid_argument);
    EXPECT_EQ(arith::parse_log_level("Off"), arith::LogLevel::Off);
    EXPECT_EQ(arith::parse_log_level("error"), arith::LogLevel::Error);
}

} // namespace
