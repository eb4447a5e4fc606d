#include <gtest/gtest.h>

#include "escapio_encoders.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/locale/utf.hpp>

#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

using namespace escapio;
using namespace std::string_view_literals;

namespace {

using Encoder = std::function<std::string(std::string_view)>;

struct EncoderCase {
    const char      *name;
    Encoder          encode;
    std::string_view extraChars; // allowed in output besides [A-Za-z0-9]
};

const std::vector<EncoderCase> &safeCharsetEncoders()
{
    static const std::vector<EncoderCase> encoders {
        { "htmlAttrEscape", htmlAttrEscape, ",.-_&#;" },
        { "cssEscape", cssEscape, "\\ " },
        { "jsEscape", jsEscape, ",._\\" },
        { "urlParamEscape", urlParamEscape, "-_.+%" },
    };
    return encoders;
}

std::vector<std::string> sampleInputs()
{
    std::vector<std::string> inputs { "",
                                      "plain",
                                      "<script>alert('xss')</script>",
                                      "\" onmouseover=alert(1) x=\"",
                                      "</style><script>",
                                      "\\'; alert(1); //",
                                      "a&b=c d",
                                      "Привет Мир",
                                      "こんにちは世界",
                                      "\xF0\x9F\x98\x80\xF0\x9F\x92\xA9",
                                      "\xE2\x80\xA8\xE2\x80\xA9",
                                      "\xC0\xAF\xE0\x80\xAF\xED\xA0\x80\xF4\x90\x80\x80",
                                      "\xC3",
                                      "\x80\xBF\xFE\xFF" };
    std::string controls;
    for (int c = 0; c < 0x20; ++c) {
        controls += char(c);
    }
    inputs.push_back(controls);
    for (int b = 0; b < 256; ++b) {
        inputs.emplace_back(1, char(b));
    }
    // a spread of code points over the whole Unicode range
    std::string unicode;
    for (char32_t cp = 0x80; cp <= 0x10FFFF; cp += 0x3F1) {
        if (boost::locale::utf::is_valid_codepoint(cp)) {
            boost::locale::utf::utf_traits<char>::encode(cp, std::back_inserter(unicode));
        }
    }
    inputs.push_back(unicode);
    return inputs;
}

bool isAsciiAlnum(char c) { return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }

std::string formDecode(std::string_view encoded)
{
    std::string result;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '+') {
            result += ' ';
        } else if (encoded[i] == '%' && i + 2 < encoded.size()) {
            boost::algorithm::unhex(encoded.begin() + i + 1, encoded.begin() + i + 3, std::back_inserter(result));
            i += 2;
        } else {
            result += encoded[i];
        }
    }
    return result;
}

} // namespace

TEST(EncoderPropertiesTest, TotalAndNeverShorter)
{
    const std::vector<std::pair<const char *, Encoder>> encoders {
        { "htmlEscape", htmlEscape },   { "htmlAttrEscape", htmlAttrEscape }, { "cssEscape", cssEscape },
        { "jsEscape", jsEscape },       { "urlParamEscape", urlParamEscape },
    };
    for (auto const &input : sampleInputs()) {
        for (auto const &[name, encode] : encoders) {
            std::string output;
            EXPECT_NO_THROW(output = encode(input)) << name;
            EXPECT_GE(output.size(), input.size()) << name << " shortened input of " << input.size() << " bytes";
        }
    }
}

TEST(EncoderPropertiesTest, OutputCharset)
{
    for (auto const &input : sampleInputs()) {
        for (auto const &encoder : safeCharsetEncoders()) {
            auto output = encoder.encode(input);
            for (char c : output) {
                EXPECT_TRUE(isAsciiAlnum(c) || encoder.extraChars.find(c) != std::string_view::npos)
                    << encoder.name << " produced byte " << (int(c) & 0xFF);
            }
        }
    }
}

TEST(EncoderPropertiesTest, HtmlEscapeLeavesNoMarkup)
{
    for (auto const &input : sampleInputs()) {
        auto output = htmlEscape(input);
        EXPECT_EQ(output.find_first_of("<>\"'/"), std::string::npos);
    }
}

TEST(EncoderPropertiesTest, HtmlEscapeKeepsAlphanumericsAndSpaces)
{
    std::string input;
    for (char c = '0'; c <= '9'; ++c)
        input += c;
    input += ' ';
    for (char c = 'A'; c <= 'Z'; ++c)
        input += c;
    input += ' ';
    for (char c = 'a'; c <= 'z'; ++c)
        input += c;
    EXPECT_EQ(htmlEscape(input), input);
}

TEST(EncoderPropertiesTest, UrlParamRoundTrip)
{
    for (auto const &input : sampleInputs()) {
        EXPECT_EQ(formDecode(urlParamEscape(input)), input);
    }
}

TEST(EncoderPropertiesTest, Deterministic)
{
    auto const input = "x\xFF<\xF0\x9F\x98\x80>\0y"sv;
    EXPECT_EQ(htmlEscape(input), htmlEscape(input));
    EXPECT_EQ(htmlAttrEscape(input), htmlAttrEscape(input));
    EXPECT_EQ(cssEscape(input), cssEscape(input));
    EXPECT_EQ(jsEscape(input), jsEscape(input));
    EXPECT_EQ(urlParamEscape(input), urlParamEscape(input));
}
