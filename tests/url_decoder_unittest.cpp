#include "url_decoder.hpp"

#include <gtest/gtest.h>

namespace urlfeat {
namespace {

TEST(UrlDecoderTest, DecodesHtmlAmpersands) {
    EXPECT_EQ("http://e.webring.com/hub?sid=&ring=hentff98&id=&",
              decode_url("http://e.webring.com/hub?sid=&amp;ring=hentff98&amp;id=&amp"));
}

TEST(UrlDecoderTest, DecodesPercentEscapes) {
    EXPECT_EQ("http://www.asstr.org/janice and kirk's",
              decode_url("http://www.asstr.org/janice%20and%20kirk%27s"));
}

TEST(UrlDecoderTest, PercentDecodeKeepsInvalidEscapes) {
    EXPECT_EQ("100%", percent_decode("100%"));
    EXPECT_EQ("%zz", percent_decode("%zz"));
    EXPECT_EQ("a\\b", percent_decode("a%5Cb"));
    EXPECT_EQ("a\\b", percent_decode("a%5cb"));
}

TEST(UrlDecoderTest, PercentDecodingRunsOnce) {
    EXPECT_EQ("%41", percent_decode("%2541"));
}

TEST(UrlDecoderTest, UnescapesNamedAndNumericReferences) {
    EXPECT_EQ("<b>", html_unescape("&lt;b&gt;"));
    EXPECT_EQ("\"q\"", html_unescape("&quot;q&quot;"));
    EXPECT_EQ("A", html_unescape("&#65;"));
    EXPECT_EQ("A", html_unescape("&#x41;"));
    EXPECT_EQ("\xE2\x82\xAC", html_unescape("&euro;"));
}

TEST(UrlDecoderTest, UnescapesLegacyEntityPrefixes) {
    EXPECT_EQ("&x", html_unescape("&ampx"));
    EXPECT_EQ("a&b", html_unescape("a&amp;b"));
}

TEST(UrlDecoderTest, LeavesUnknownReferencesAlone) {
    EXPECT_EQ("a&zzz;b", html_unescape("a&zzz;b"));
    EXPECT_EQ("tail&", html_unescape("tail&"));
    EXPECT_EQ("&#;", html_unescape("&#;"));
}

TEST(UrlDecoderTest, MapsWindows1252NumericReferences) {
    EXPECT_EQ("\xE2\x82\xAC", html_unescape("&#128;"));
    EXPECT_EQ("\xEF\xBF\xBD", html_unescape("&#0;"));
}

TEST(UrlDecoderTest, UnescapesStructuralNamedReferences) {
    EXPECT_EQ("http://a.com/x?y=1", decode_url("http://a.com/x&quest;y=1"));
    EXPECT_EQ("http://a.com/path", decode_url("http://a.com&sol;path"));
    EXPECT_EQ(":.=#%+_", html_unescape("&colon;&period;&equals;&num;&percnt;&plus;&lowbar;"));
}

TEST(UrlDecoderTest, UnescapesFullHtml5Table) {
    EXPECT_EQ("\xE2\x88\x89", html_unescape("&notin;"));
    EXPECT_EQ("\xE2\x88\xB3", html_unescape("&CounterClockwiseContourIntegral;"));
    // Two code points
    EXPECT_EQ("\xE2\x89\x82\xCC\xB8", html_unescape("&NotEqualTilde;"));
    // Longest legacy prefix when the full name is unknown
    EXPECT_EQ("\xC2\xACit;", html_unescape("&notit;"));
}

TEST(UrlDecoderTest, KeepsUndefinedWindows1252ReferencesAsIs) {
    EXPECT_EQ("\xC2\x81", html_unescape("&#x81;"));
    EXPECT_EQ("\xC2\x9D", html_unescape("&#157;"));
    EXPECT_EQ("", html_unescape("&#x7F;"));
}

TEST(UrlDecoderTest, InvalidUtf8BecomesReplacementCharacter) {
    EXPECT_EQ("\xEF\xBF\xBD", percent_decode("%FF"));
    EXPECT_EQ(16u, decode_url("http://a.com/%FF").size());
    EXPECT_EQ("caf\xC3\xA9", percent_decode("caf%C3%A9"));
    // Truncated sequence is one replacement, an overlong lead byte is not
    EXPECT_EQ("\xEF\xBF\xBDx", percent_decode("%E2%82x"));
    EXPECT_EQ("\xEF\xBF\xBD\xEF\xBF\xBD", percent_decode("%C0%80"));
}

TEST(UrlDecoderTest, PlainUrlIsUnchanged) {
    const std::string url = "https://www.example.com/path?arg=val";
    EXPECT_EQ(url, decode_url(url));
}

}
}
