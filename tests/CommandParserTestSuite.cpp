#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "CommandParser.hpp"
#include "LedgerEngine.hpp"

/**
 * @brief Accessor Wrapper
 * Inherits from CommandParser to expose protected helpers for unit testing.
 */
class CommandParserTester : public CommandParser {
public:
    using CommandParser::CommandParser;
    using CommandParser::get_token;
    using CommandParser::trim;
};

class CommandParserTestSuite : public ::testing::Test {
protected:
    std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> queue;
    OutputHandler handler;
    LedgerEngine engine;
    CommandParserTester parser;

    CommandParserTestSuite()
        : queue(std::make_shared<ThreadSafeQueue<OutputEnvelope>>()),
          handler(queue),
          engine(handler),
          parser(handler) {}

    std::vector<std::string> drain(MsgType type) {
        std::vector<std::string> lines;
        while (auto env = queue->try_pop()) {
            if (env->type == type) lines.emplace_back(env->view());
        }
        return lines;
    }

    void expectRejected(const std::string& raw, const std::string& fragment) {
        auto cmd = parser.parse(raw);
        EXPECT_FALSE(cmd.has_value()) << raw;
        auto errors = drain(MsgType::Error);
        ASSERT_EQ(errors.size(), 1u) << raw;
        EXPECT_NE(errors[0].find(fragment), std::string::npos) << errors[0];
    }
};

// --- SECTION 1: Tokenizer Helpers ---

TEST_F(CommandParserTestSuite, TokenizerSlicing) {
    std::string_view data = "B,lemon,max";
    EXPECT_EQ(parser.get_token(data), "B");
    EXPECT_EQ(parser.get_token(data), "lemon");
    EXPECT_EQ(parser.get_token(data), "max");
    EXPECT_TRUE(data.empty());
    EXPECT_EQ(parser.get_token(data), "");
}

TEST_F(CommandParserTestSuite, TokenizerTrimming) {
    std::string_view data = "  Q  , coffee ,  x10 ";
    EXPECT_EQ(parser.get_token(data), "Q");
    EXPECT_EQ(parser.get_token(data), "coffee");
    EXPECT_EQ(parser.get_token(data), "x10");
    EXPECT_EQ(parser.trim("\t lemon \r"), "lemon");
}

// --- SECTION 2: Accepted Commands ---

TEST_F(CommandParserTestSuite, ParseDepositWithFriendlyAmount) {
    auto cmd = parser.parse("D, 12.5k");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->type, CommandType::DEPOSIT);
    EXPECT_DOUBLE_EQ(cmd->amount, 12500.0);

    // Thousands separators survive the comma tokenizer.
    auto grouped = parser.parse("D, 1,250");
    ASSERT_TRUE(grouped.has_value());
    EXPECT_DOUBLE_EQ(grouped->amount, 1250.0);
}

TEST_F(CommandParserTestSuite, ParseQuoteAndBuy) {
    auto quote = parser.parse("Q, lemon");
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->type, CommandType::QUOTE);
    EXPECT_EQ(quote->ventureId, "lemon");
    EXPECT_FALSE(quote->mode.has_value());

    auto buy = parser.parse("b, bank, x100");
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy->type, CommandType::BUY);
    EXPECT_EQ(buy->ventureId, "bank");
    EXPECT_EQ(buy->mode, BuyMode::X100);
}

TEST_F(CommandParserTestSuite, ParseSettings) {
    auto mode = parser.parse("M, max");
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(mode->type, CommandType::SET_MODE);
    EXPECT_EQ(mode->mode, BuyMode::MAX);

    auto notation = parser.parse("N, sci");
    ASSERT_TRUE(notation.has_value());
    EXPECT_EQ(notation->type, CommandType::SET_NOTATION);
    EXPECT_EQ(notation->notation, NotationMode::SCIENTIFIC);
}

TEST_F(CommandParserTestSuite, ParseBareCommands) {
    EXPECT_EQ(parser.parse("P")->type, CommandType::PORTFOLIO);
    EXPECT_EQ(parser.parse("S")->type, CommandType::SAVE);
    EXPECT_EQ(parser.parse("F")->type, CommandType::RESET);
    EXPECT_EQ(parser.parse("I")->type, CommandType::INCOME);
    EXPECT_EQ(parser.parse("R")->type, CommandType::PRESTIGE);
}

TEST_F(CommandParserTestSuite, ParseHireAndAdvance) {
    auto hire = parser.parse("h, truck");
    ASSERT_TRUE(hire.has_value());
    EXPECT_EQ(hire->type, CommandType::HIRE);
    EXPECT_EQ(hire->ventureId, "truck");

    auto tick = parser.parse("T, 1.5k");
    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(tick->type, CommandType::ADVANCE);
    EXPECT_DOUBLE_EQ(tick->amount, 1500.0);
}

TEST_F(CommandParserTestSuite, ParseLoadKeepsWholeDocument) {
    const std::string doc = R"({"v": 1, "money": {"mantissa": 1.5, "exponent": 3}})";
    auto cmd = parser.parse("L, " + doc);
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->type, CommandType::LOAD);
    EXPECT_EQ(cmd->payload, doc);
}

TEST_F(CommandParserTestSuite, BlankLinesAreIgnoredSilently) {
    EXPECT_FALSE(parser.parse("").has_value());
    EXPECT_FALSE(parser.parse("   ").has_value());
    EXPECT_TRUE(queue->empty());
}

// --- SECTION 3: Rejections ---

TEST_F(CommandParserTestSuite, RejectsUnknownCommands) {
    expectRejected("X, lemon", "Unknown command 'X'");
    expectRejected("BUY, lemon", "Unknown command 'BUY'");
}

TEST_F(CommandParserTestSuite, RejectsBadVentures) {
    expectRejected("Q", "Missing venture");
    expectRejected("B, casino", "Unknown venture 'casino'");
}

TEST_F(CommandParserTestSuite, RejectsBadManagerTargets) {
    expectRejected("H", "Missing venture");
    expectRejected("H, casino", "Unknown venture 'casino'");
}

TEST_F(CommandParserTestSuite, RejectsBadDurations) {
    expectRejected("T", "Invalid duration");
    expectRejected("T, 0", "Invalid duration '0'");
    expectRejected("T, -10", "Invalid duration");
    expectRejected("T, soon", "Invalid duration 'soon'");
}

TEST_F(CommandParserTestSuite, RejectsBadModesAndNotations) {
    expectRejected("B, lemon, x5", "Invalid buy mode 'x5'");
    expectRejected("M", "Invalid buy mode");
    expectRejected("N, roman", "Invalid notation 'roman'");
}

TEST_F(CommandParserTestSuite, RejectsBadAmounts) {
    expectRejected("D, lots", "Invalid amount 'lots'");
    expectRejected("D, 0", "Invalid amount");
    expectRejected("D, -5", "Invalid amount");
    expectRejected("D", "Invalid amount");
}

TEST_F(CommandParserTestSuite, RejectsMissingDocument) {
    expectRejected("L", "Missing save document");
}

TEST_F(CommandParserTestSuite, RejectsExtraFields) {
    expectRejected("Q, lemon, x1, extra", "Extra fields");
    expectRejected("P, now", "Extra fields");
}

// --- SECTION 4: Dispatch ---

TEST_F(CommandParserTestSuite, ParseAndExecuteDrivesEngine) {
    EXPECT_TRUE(parser.parseAndExecute("B, lemon", engine));
    EXPECT_EQ(engine.owned("lemon"), 1);

    EXPECT_FALSE(parser.parseAndExecute("B, casino", engine));
    EXPECT_EQ(engine.owned("lemon"), 1);
}
