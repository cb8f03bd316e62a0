#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include "memcache/net/client/client.hpp"
#include "memcache/net/errors.hpp"
#include "../../support/fake_server.hpp"

namespace memcache::net::client::test {

using memcache::test::FakeServer;
using memcache::test::FakeServerOptions;

// real sockets against an in-process server on an ephemeral port
class ClientServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        start(FakeServerOptions{});
    }

    void TearDown() override {
        client_.reset();
        server_->stop();
    }

    void start(const FakeServerOptions& server_opts) {
        if (server_) {
            server_->stop();
        }
        server_ = std::make_unique<FakeServer>(server_opts);
        server_->start();

        ClientOptions client_opts;
        client_opts.port = server_->port();
        client_opts.connect_timeout = util::Duration(2000);
        client_opts.timeout = util::Duration(5000);
        client_opts.no_delay = true;
        client_ = std::make_unique<Client>(client_opts);
    }

    std::unique_ptr<FakeServer> server_;
    std::unique_ptr<Client> client_;
};

TEST_F(ClientServerTest, SetAndGet) {
    EXPECT_EQ(client_->set("key1", "value1", util::Seconds(0), false), Outcome::Stored);
    EXPECT_EQ(client_->get("key1"), "value1");
    EXPECT_FALSE(client_->get("nonexistent").has_value());
}

TEST_F(ClientServerTest, NoreplyStoresAreVisible) {
    client_->set("key1", "value1");
    client_->set("key1", "value2");
    EXPECT_EQ(client_->get("key1"), "value2");

    auto log = server_->command_log();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0], "set key1 0 0 6 noreply");
    EXPECT_EQ(log[2], "get key1");
}

TEST_F(ClientServerTest, AddReplace) {
    EXPECT_EQ(client_->replace("k", "v", util::Seconds(0), false), Outcome::NotStored);
    EXPECT_EQ(client_->add("k", "v", util::Seconds(0), false), Outcome::Stored);
    EXPECT_EQ(client_->add("k", "w", util::Seconds(0), false), Outcome::NotStored);
    EXPECT_EQ(client_->replace("k", "w", util::Seconds(0), false), Outcome::Stored);
    EXPECT_EQ(client_->get("k"), "w");
}

TEST_F(ClientServerTest, AppendPrepend) {
    EXPECT_EQ(client_->append("k", "x", util::Seconds(0), false), Outcome::NotStored);
    client_->set("k", "mid");
    EXPECT_EQ(client_->append("k", "-end", util::Seconds(0), false), Outcome::Stored);
    EXPECT_EQ(client_->prepend("k", "start-", util::Seconds(0), false), Outcome::Stored);
    EXPECT_EQ(client_->get("k"), "start-mid-end");
}

TEST_F(ClientServerTest, CasCycle) {
    EXPECT_EQ(client_->cas("k", "v", 1), Outcome::NotFound);

    client_->set("k", "v1");
    auto first = client_->gets("k");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->value, "v1");

    EXPECT_EQ(client_->cas("k", "v2", first->cas), Outcome::Stored);
    // the token moved on with the write
    EXPECT_EQ(client_->cas("k", "v3", first->cas), Outcome::Exists);
    EXPECT_EQ(client_->get("k"), "v2");
}

TEST_F(ClientServerTest, GetMany) {
    client_->set_many({{"a", "1"}, {"c", "3"}});

    auto result = client_->get_many({"a", "b", "c"});
    EXPECT_EQ(result.size(), 2u);
    EXPECT_EQ(result.at("a"), "1");
    EXPECT_EQ(result.at("c"), "3");

    auto with_cas = client_->gets_many({"a", "c"});
    EXPECT_EQ(with_cas.size(), 2u);
    EXPECT_NE(with_cas.at("a").cas, with_cas.at("c").cas);
}

TEST_F(ClientServerTest, BinaryValue) {
    std::string value("line1\r\nline2\0tail", 17);
    client_->set("bin", value);
    EXPECT_EQ(client_->get("bin"), value);
}

TEST_F(ClientServerTest, LargeValue) {
    std::string value(256 * 1024, 'x');
    client_->set("big", value);
    auto result = client_->get("big");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), value.size());
}

TEST_F(ClientServerTest, Counters) {
    auto missing = client_->incr("n", 1);
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(std::get<Outcome>(*missing), Outcome::NotFound);

    client_->set("n", "5");
    EXPECT_EQ(std::get<uint64_t>(*client_->incr("n", 2)), 7u);
    EXPECT_EQ(std::get<uint64_t>(*client_->decr("n", 100)), 0u);
}

TEST_F(ClientServerTest, NonNumericCounterIsClientError) {
    client_->set("s", "abc");
    try {
        (void)client_->incr("s", 1);
        FAIL() << "expected ClientError";
    } catch (const MemcacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ClientError);
    }
    EXPECT_FALSE(client_->connected());
    EXPECT_EQ(client_->get("s"), "abc");
}

TEST_F(ClientServerTest, RemoveTouchFlush) {
    client_->set_many({{"a", "1"}, {"b", "2"}, {"c", "3"}});
    EXPECT_EQ(client_->remove("a", false), Outcome::Deleted);
    EXPECT_EQ(client_->remove("a", false), Outcome::NotFound);
    EXPECT_EQ(client_->touch("b", util::Seconds(60), false), Outcome::Touched);
    EXPECT_EQ(client_->touch("a", util::Seconds(60), false), Outcome::NotFound);

    client_->remove_many({"b"});
    EXPECT_FALSE(client_->get("b").has_value());

    EXPECT_EQ(client_->flush_all(util::Seconds(0), false), Outcome::Ok);
    EXPECT_FALSE(client_->get("c").has_value());
}

TEST_F(ClientServerTest, Stats) {
    client_->set("a", "1");
    auto stats = client_->stats();
    EXPECT_EQ(stats.at("curr_items"), "1");
    EXPECT_EQ(stats.count("version"), 1u);
    EXPECT_EQ(stats.count("pid"), 1u);
}

TEST_F(ClientServerTest, InjectedErrorsCloseAndReconnect) {
    EXPECT_EQ(client_->set("k", "v", util::Seconds(0), false), Outcome::Stored);
    EXPECT_EQ(server_->connections_accepted(), 1u);

    server_->inject_reply("SERVER_ERROR out of memory\r\n");
    try {
        (void)client_->get("k");
        FAIL() << "expected ServerError";
    } catch (const MemcacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ServerError);
        EXPECT_STREQ(e.what(), "out of memory");
    }
    EXPECT_FALSE(client_->connected());

    EXPECT_EQ(client_->get("k"), "v");
    EXPECT_EQ(server_->connections_accepted(), 2u);
}

TEST_F(ClientServerTest, UnknownCommandReply) {
    server_->inject_reply("ERROR\r\n");
    try {
        client_->set("k", "v", util::Seconds(0), false);
        FAIL() << "expected UnknownCommand";
    } catch (const MemcacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownCommand);
    }
    EXPECT_FALSE(client_->connected());
}

TEST_F(ClientServerTest, DroppedConnectionIsUnexpectedClose) {
    server_->drop_next_request();
    try {
        (void)client_->get("k");
        FAIL() << "expected UnexpectedClose";
    } catch (const MemcacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnexpectedClose);
    }
    EXPECT_FALSE(client_->connected());
    EXPECT_FALSE(client_->get("k").has_value());
}

TEST_F(ClientServerTest, IgnoreExcOnDroppedConnection) {
    ClientOptions options;
    options.port = server_->port();
    options.timeout = util::Duration(5000);
    options.ignore_exc = true;
    Client client(options);

    EXPECT_EQ(client.set("k", "v", util::Seconds(0), false), Outcome::Stored);
    server_->drop_next_request();
    EXPECT_FALSE(client.get("k").has_value());
    EXPECT_EQ(client.get("k"), "v");
}

TEST_F(ClientServerTest, ConnectRefused) {
    uint16_t port = server_->port();
    client_.reset();
    server_->stop();

    ClientOptions options;
    options.port = port;
    options.connect_timeout = util::Duration(1000);
    Client client(options);
    try {
        client.connect();
        FAIL() << "expected Transport";
    } catch (const MemcacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Transport);
    }
    EXPECT_FALSE(client.connected());
}

TEST_F(ClientServerTest, ReadTimeoutIsTransportAndReconnects) {
    ClientOptions options;
    options.port = server_->port();
    options.connect_timeout = util::Duration(1000);
    options.timeout = util::Duration(200);
    options.no_delay = true;
    Client client(options);

    EXPECT_EQ(client.set("k", "v", util::Seconds(0), false), Outcome::Stored);
    server_->stall_next_request();

    auto started = std::chrono::steady_clock::now();
    try {
        (void)client.get("k");
        FAIL() << "expected a timeout";
    } catch (const MemcacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Transport);
        EXPECT_TRUE(e.timed_out());
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    EXPECT_GE(waited.count(), 150);
    EXPECT_FALSE(client.connected());

    EXPECT_EQ(client.get("k"), "v");
    EXPECT_TRUE(client.connected());
    EXPECT_EQ(server_->connections_accepted(), 2u);
}

TEST_F(ClientServerTest, IgnoreExcOnReadTimeout) {
    ClientOptions options;
    options.port = server_->port();
    options.timeout = util::Duration(200);
    options.ignore_exc = true;
    Client client(options);

    EXPECT_EQ(client.set("k", "v", util::Seconds(0), false), Outcome::Stored);
    server_->stall_next_request();
    EXPECT_FALSE(client.get("k").has_value());
    EXPECT_FALSE(client.connected());
    EXPECT_EQ(client.get("k"), "v");
}

TEST_F(ClientServerTest, QuitThenReconnect) {
    EXPECT_EQ(client_->set("k", "v", util::Seconds(0), false), Outcome::Stored);
    client_->quit();
    EXPECT_FALSE(client_->connected());

    EXPECT_EQ(client_->get("k"), "v");
    EXPECT_EQ(server_->connections_accepted(), 2u);
}

TEST_F(ClientServerTest, ByteAtATimeReplies) {
    FakeServerOptions opts;
    opts.write_chunk = 1;
    start(opts);

    client_->set_many({{"a", "alpha"}, {"b", "beta\r\nbeta"}});
    auto result = client_->get_many({"a", "b", "z"});
    EXPECT_EQ(result.size(), 2u);
    EXPECT_EQ(result.at("a"), "alpha");
    EXPECT_EQ(result.at("b"), "beta\r\nbeta");

    client_->set("n", "41");
    EXPECT_EQ(std::get<uint64_t>(*client_->incr("n", 1)), 42u);
    EXPECT_EQ(client_->stats().count("version"), 1u);
}

}  // namespace memcache::net::client::test
