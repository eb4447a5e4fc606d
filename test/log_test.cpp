#include <gtest/gtest.h>

#include "escapio_encoders.hpp"
#include "escapio_log.hpp"

#include <string>
#include <vector>

using Severity = boost::log::trivial::severity_level;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        escapio::log.setHandler([this](Severity level, std::string &&message) {
            levels.push_back(level);
            messages.push_back(std::move(message));
        });
    }

    void TearDown() override
    {
        escapio::log.setHandler({});
        escapio::log.setLevel(Severity::debug);
    }

    std::vector<Severity>    levels;
    std::vector<std::string> messages;
};

TEST_F(LogTest, TracesMalformedInput)
{
    escapio::log.setLevel(Severity::trace);
    EXPECT_EQ(escapio::jsEscape("ab\xFF"), "ab\\uFFFD");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(levels[0], Severity::trace);
    EXPECT_NE(messages[0].find("offset 2"), std::string::npos) << messages[0];
}

TEST_F(LogTest, FiltersByLevel)
{
    escapio::log.setLevel(Severity::warning);
    escapio::cssEscape("\xFF\xFE");
    ESCAPIO_DEBUG("not shown");
    EXPECT_TRUE(messages.empty());

    ESCAPIO_ERROR("shown " << 42);
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "shown 42");
    EXPECT_EQ(levels[0], Severity::error);
}

TEST_F(LogTest, ValidInputIsQuiet)
{
    escapio::log.setLevel(Severity::trace);
    escapio::htmlAttrEscape("Привет <b>");
    EXPECT_TRUE(messages.empty());
}

TEST(LogDefaultsTest, GlobalLoggerDefined)
{
    EXPECT_EQ(escapio::log.level(), Severity::debug);
}
