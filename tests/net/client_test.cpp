#include "walrus/net/client.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "walrus/core/db.hpp"
#include "walrus/net/server.hpp"

namespace walrus::net::test {

class ClientTest : public ::testing::Test {
   protected:
    void SetUp() override {
        guard_ = std::make_unique<core::DbGuard>();
        ServerOptions server_opts;
        server_opts.port = 0;
        server_ = std::make_unique<Server>(guard_->db(), server_opts);
        server_->start();

        ClientOptions client_opts;
        client_opts.port = server_->port();
        client_opts.timeout_seconds = 5;
        client_ = std::make_unique<Client>(client_opts);
        client_->connect();
    }

    void TearDown() override {
        client_.reset();
        server_->stop();
        server_.reset();
        guard_.reset();
    }

    std::unique_ptr<core::DbGuard> guard_;
    std::unique_ptr<Server> server_;
    std::unique_ptr<Client> client_;
};

TEST_F(ClientTest, Connected) {
    EXPECT_TRUE(client_->connected());
    client_->disconnect();
    EXPECT_FALSE(client_->connected());
}

TEST_F(ClientTest, Ping) {
    EXPECT_EQ(client_->ping(), "PONG");
    EXPECT_EQ(client_->ping(std::string("echo me")), "echo me");
}

TEST_F(ClientTest, SetAndGet) {
    client_->set("key1", "value1");
    EXPECT_EQ(client_->get("key1"), "value1");
    EXPECT_FALSE(client_->get("missing").has_value());
}

TEST_F(ClientTest, BinarySafeValues) {
    std::string value("a\r\nb\0c", 6);
    client_->set("bin", value);
    EXPECT_EQ(client_->get("bin"), value);
}

TEST_F(ClientTest, SetWithTtl) {
    client_->set("temp", "value", util::Duration(100));
    EXPECT_EQ(client_->get("temp"), "value");

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(client_->get("temp").has_value());
}

TEST_F(ClientTest, RPush) {
    EXPECT_EQ(client_->rpush("list", {"a", "b"}), 2);
    EXPECT_EQ(client_->rpush("list", {"c"}), 3);
}

TEST_F(ClientTest, ErrorReplyThrowsWithServerText) {
    (void)client_->rpush("list", {"a"});
    try {
        (void)client_->get("list");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "operation against a key holding the wrong kind of value");
    }
    // an error reply does not drop the connection
    EXPECT_TRUE(client_->connected());
    EXPECT_EQ(client_->ping(), "PONG");
}

TEST_F(ClientTest, RawRequest) {
    auto reply = client_->request(Frame::array({Frame::bulk("nosuch")}));
    EXPECT_EQ(reply, Frame::error("unknown command nosuch"));
}

TEST_F(ClientTest, ServerGoneThrowsAndDisconnects) {
    server_->stop();
    EXPECT_THROW((void)client_->ping(), std::runtime_error);
    EXPECT_FALSE(client_->connected());
}

TEST_F(ClientTest, NotConnectedThrows) {
    client_->disconnect();
    EXPECT_THROW((void)client_->get("k"), std::runtime_error);
}

TEST(ClientConnectTest, RefusedConnectionThrows) {
    ClientOptions opts;
    opts.port = 1;  // nothing listens there
    Client client(opts);
    EXPECT_THROW(client.connect(), std::runtime_error);
    EXPECT_FALSE(client.connected());
}

TEST(ClientConnectTest, InvalidAddressThrows) {
    ClientOptions opts;
    opts.host = "not-an-ip";
    Client client(opts);
    EXPECT_THROW(client.connect(), std::runtime_error);
}

}  // namespace walrus::net::test
