#include "walrus/cmd/command.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "walrus/error.hpp"
#include "walrus/util/clock.hpp"

namespace walrus::cmd::test {

using net::Frame;
using util::Duration;
using util::MockClock;

namespace {

Frame request(const std::vector<std::string>& args) {
    net::FrameArrayBuilder builder;
    for (const auto& arg : args) {
        builder.push_bulk(arg);
    }
    return std::move(builder).build();
}

}  // namespace

class CommandTest : public ::testing::Test {
   protected:
    void SetUp() override {
        clock_ = std::make_shared<MockClock>();
        core::DbOptions opts;
        opts.clock = clock_;
        guard_ = std::make_unique<core::DbGuard>(opts);
        db_ = guard_->db();
    }

    Frame run(const std::vector<std::string>& args) {
        return Command::from_frame(request(args)).apply(db_);
    }

    std::shared_ptr<MockClock> clock_;
    std::unique_ptr<core::DbGuard> guard_;
    core::Db db_;
};

TEST_F(CommandTest, NamesAreCaseInsensitive) {
    EXPECT_EQ(Command::from_frame(request({"PING"})).name(), "ping");
    EXPECT_EQ(Command::from_frame(request({"GeT", "k"})).name(), "get");
    EXPECT_EQ(Command::from_frame(request({"sEt", "k", "v"})).name(), "set");
    EXPECT_EQ(Command::from_frame(request({"RPUSH", "k", "a"})).name(), "rpush");
}

TEST_F(CommandTest, PingRepliesPongOrEchoes) {
    EXPECT_EQ(run({"ping"}), Frame::simple("PONG"));
    EXPECT_EQ(run({"ping", "hello"}), Frame::bulk("hello"));
}

TEST_F(CommandTest, PingWithTooManyArgumentsIsParseError) {
    EXPECT_THROW((void)Command::from_frame(request({"ping", "a", "b"})), ParseError);
}

TEST_F(CommandTest, GetMissingKeyIsNull) {
    EXPECT_EQ(run({"get", "nope"}), Frame::null());
}

TEST_F(CommandTest, SetThenGet) {
    EXPECT_EQ(run({"set", "foo", "bar"}), Frame::simple("OK"));
    EXPECT_EQ(run({"get", "foo"}), Frame::bulk("bar"));
}

TEST_F(CommandTest, SetOverwrites) {
    (void)run({"set", "foo", "one"});
    (void)run({"set", "foo", "two"});
    EXPECT_EQ(run({"get", "foo"}), Frame::bulk("two"));
}

TEST_F(CommandTest, SetParsesExpirationOptions) {
    auto ex = Command::from_frame(request({"set", "k", "v", "EX", "10"}));
    ASSERT_NE(ex.get_if<Set>(), nullptr);
    EXPECT_EQ(ex.get_if<Set>()->expire, Duration(10000));

    auto px = Command::from_frame(request({"set", "k", "v", "px", "250"}));
    ASSERT_NE(px.get_if<Set>(), nullptr);
    EXPECT_EQ(px.get_if<Set>()->expire, Duration(250));

    auto none = Command::from_frame(request({"set", "k", "v"}));
    ASSERT_NE(none.get_if<Set>(), nullptr);
    EXPECT_FALSE(none.get_if<Set>()->expire.has_value());
}

TEST_F(CommandTest, SetWithExpirationExpires) {
    (void)run({"set", "session", "abc", "PX", "1000"});
    EXPECT_EQ(run({"get", "session"}), Frame::bulk("abc"));

    clock_->advance(Duration(999));
    EXPECT_EQ(run({"get", "session"}), Frame::bulk("abc"));

    clock_->advance(Duration(1));
    EXPECT_EQ(run({"get", "session"}), Frame::null());
}

TEST_F(CommandTest, SetUnknownOptionIsCommandError) {
    try {
        (void)Command::from_frame(request({"set", "k", "v", "KEEPTTL"}));
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_STREQ(e.what(), "only supports expiration option");
    }
}

TEST_F(CommandTest, SetHugeExpirationIsCommandError) {
    EXPECT_THROW((void)Command::from_frame(request({"set", "k", "v", "EX", "18446744073709551615"})),
                 CommandError);
}

TEST_F(CommandTest, SetMissingValueIsParseError) {
    EXPECT_THROW((void)Command::from_frame(request({"set", "k"})), EndOfStream);
    EXPECT_THROW((void)Command::from_frame(request({"set", "k", "v", "EX"})), EndOfStream);
    EXPECT_THROW((void)Command::from_frame(request({"set", "k", "v", "EX", "soon"})), ParseError);
    EXPECT_THROW((void)Command::from_frame(request({"set", "k", "v", "EX", "1", "x"})),
                 ParseError);
}

TEST_F(CommandTest, RPushCreatesAndAppends) {
    EXPECT_EQ(run({"rpush", "list", "a", "b"}), Frame::integer(2));
    EXPECT_EQ(run({"rpush", "list", "c"}), Frame::integer(3));

    auto stored = db_.get("list");
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->is(core::DataKind::List));
    const auto& items = stored->as_list();
    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items[0], core::Data::bytes("a"));
    EXPECT_EQ(items[2], core::Data::bytes("c"));
}

TEST_F(CommandTest, RPushWithoutItemsIsParseError) {
    try {
        (void)Command::from_frame(request({"rpush", "list"}));
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_STREQ(e.what(), "wrong number of arguments for 'rpush' command");
    }
}

TEST_F(CommandTest, RPushOnStringKeyLeavesItAlone) {
    (void)run({"set", "k", "v"});
    EXPECT_EQ(run({"rpush", "k", "x"}), Frame::integer(0));
    EXPECT_EQ(run({"get", "k"}), Frame::bulk("v"));
}

TEST_F(CommandTest, GetOnListIsWrongKindError) {
    (void)run({"rpush", "list", "a"});
    EXPECT_EQ(run({"get", "list"}),
              Frame::error("operation against a key holding the wrong kind of value"));
}

TEST_F(CommandTest, UnknownCommandReportsLowercasedName) {
    auto cmd = Command::from_frame(request({"FLUSHALL", "now"}));
    ASSERT_NE(cmd.get_if<Unknown>(), nullptr);
    EXPECT_EQ(cmd.apply(db_), Frame::error("unknown command flushall"));
}

TEST_F(CommandTest, UnknownCommandNameWithLineBreaksStaysOneLine) {
    auto cmd = Command::from_frame(request({"bad\r\nname"}));
    EXPECT_EQ(cmd.apply(db_), Frame::error("unknown command bad  name"));
}

TEST_F(CommandTest, IntoFrameRebuildsTheRequest) {
    EXPECT_EQ(Ping{}.into_frame(), request({"ping"}));
    EXPECT_EQ(Ping{std::string("hi")}.into_frame(), request({"ping", "hi"}));
    EXPECT_EQ(Get{"k"}.into_frame(), request({"get", "k"}));
    EXPECT_EQ((Set{"k", "v", std::nullopt}.into_frame()), request({"set", "k", "v"}));
    EXPECT_EQ((Set{"k", "v", Duration(1500)}.into_frame()),
              request({"set", "k", "v", "px", "1500"}));
    EXPECT_EQ((RPush{"k", {core::Data::bytes("a"), core::Data::bytes("b")}}.into_frame()),
              request({"rpush", "k", "a", "b"}));
}

TEST_F(CommandTest, IntoFrameParsesBackToSameCommand) {
    Set original{"key", "value", Duration(42)};
    auto parsed = Command::from_frame(original.into_frame());
    const auto* set = parsed.get_if<Set>();
    ASSERT_NE(set, nullptr);
    EXPECT_EQ(set->key, "key");
    EXPECT_EQ(set->value, "value");
    EXPECT_EQ(set->expire, Duration(42));
}

TEST_F(CommandTest, NonArrayRequestIsParseError) {
    EXPECT_THROW((void)Command::from_frame(Frame::simple("PING")), ParseError);
}

}  // namespace walrus::cmd::test
