#include "walrus/cmd/parse.hpp"

#include <gtest/gtest.h>

#include <string>

#include "walrus/error.hpp"

namespace walrus::cmd::test {

using net::Frame;

TEST(ParseTest, RejectsNonArrayFrame) {
    EXPECT_THROW((void)Parse(Frame::simple("PING")), ParseError);
    EXPECT_THROW((void)Parse(Frame::null()), ParseError);
}

TEST(ParseTest, ReadsElementsInOrder) {
    Parse parse(Frame::array({Frame::bulk("set"), Frame::simple("key"), Frame::integer(5)}));
    EXPECT_EQ(parse.remaining(), 3);
    EXPECT_EQ(parse.next_string(), "set");
    EXPECT_EQ(parse.next_bytes(), "key");
    EXPECT_EQ(parse.next_int(), 5);
    EXPECT_NO_THROW(parse.finish());
}

TEST(ParseTest, RunningOutThrowsEndOfStream) {
    Parse parse(Frame::array({Frame::bulk("get")}));
    (void)parse.next_string();
    EXPECT_THROW((void)parse.next_string(), EndOfStream);
}

TEST(ParseTest, EndOfStreamIsAParseError) {
    Parse parse(Frame::array({}));
    try {
        (void)parse.next_bytes();
        FAIL() << "expected EndOfStream";
    } catch (const ParseError& e) {
        EXPECT_STREQ(e.what(), "protocol error; unexpected end of stream");
    }
}

TEST(ParseTest, NumbersParseFromText) {
    Parse parse(Frame::array({Frame::bulk("1000"), Frame::simple("7")}));
    EXPECT_EQ(parse.next_int(), 1000);
    EXPECT_EQ(parse.next_int(), 7);
}

TEST(ParseTest, InvalidNumberThrows) {
    for (const char* text : {"", "abc", "-1", "12x", "99999999999999999999"}) {
        Parse parse(Frame::array({Frame::bulk(text)}));
        EXPECT_THROW((void)parse.next_int(), ParseError) << text;
    }
}

TEST(ParseTest, WrongElementTypeThrows) {
    Parse parse(Frame::array({Frame::integer(1), Frame::null(), Frame::error("x")}));
    EXPECT_THROW((void)parse.next_string(), ParseError);
    EXPECT_THROW((void)parse.next_bytes(), ParseError);
    EXPECT_THROW((void)parse.next_int(), ParseError);
}

TEST(ParseTest, StringRequiresUtf8ButBytesDoNot) {
    std::string invalid = "\xff\xfe";
    Parse strings(Frame::array({Frame::bulk(invalid)}));
    EXPECT_THROW((void)strings.next_string(), ParseError);

    Parse bytes(Frame::array({Frame::bulk(invalid)}));
    EXPECT_EQ(bytes.next_bytes(), invalid);

    Parse multibyte(Frame::array({Frame::bulk("caf\xc3\xa9")}));
    EXPECT_EQ(multibyte.next_string(), "caf\xc3\xa9");
}

TEST(ParseTest, TruncatedUtf8SequenceIsInvalid) {
    Parse parse(Frame::array({Frame::bulk("ab\xc3")}));
    EXPECT_THROW((void)parse.next_string(), ParseError);
}

TEST(ParseTest, NextArrayTakesTheRest) {
    Parse parse(Frame::array(
        {Frame::bulk("list"), Frame::bulk("a"), Frame::simple("b"), Frame::integer(3)}));
    (void)parse.next_string();

    auto values = parse.next_array();
    ASSERT_EQ(values.size(), 3);
    EXPECT_EQ(values[0], core::Data::bytes("a"));
    EXPECT_EQ(values[1], core::Data::string("b"));
    EXPECT_EQ(values[2], core::Data::integer(3));
    EXPECT_EQ(parse.remaining(), 0);
    EXPECT_NO_THROW(parse.finish());
}

TEST(ParseTest, NextArrayRejectsNull) {
    Parse parse(Frame::array({Frame::bulk("a"), Frame::null()}));
    EXPECT_THROW((void)parse.next_array(), ParseError);
}

TEST(ParseTest, FinishWithLeftoversThrows) {
    Parse parse(Frame::array({Frame::bulk("get"), Frame::bulk("k"), Frame::bulk("extra")}));
    (void)parse.next_string();
    (void)parse.next_string();
    try {
        parse.finish();
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_STREQ(e.what(), "protocol error; expected end of frame, but there was more");
    }
}

}  // namespace walrus::cmd::test
