#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include "config.hpp"
#include "judge/authenticator.hpp"
#include "judge/session_registry.hpp"
#include "server/bridge_server.hpp"
#include "server/zlib_connection.hpp"
#include "test/mocks.hpp"

using namespace std;
using namespace nlohmann;
using namespace bridge;
using namespace bridge::server;
using namespace bridge::test;
namespace asio = boost::asio;
using asio::ip::tcp;

/**
 * @brief 通过真实的 TCP 连接模拟评测机
 */
struct tcp_judge {
    explicit tcp_judge(unsigned short port) {
        socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
    }

    void send(const json &packet) {
        string payload = zlib_connection::compress(packet.dump());
        uint32_t size = payload.size();
        unsigned char header[4] = {
            static_cast<unsigned char>(size >> 24),
            static_cast<unsigned char>(size >> 16),
            static_cast<unsigned char>(size >> 8),
            static_cast<unsigned char>(size)};
        asio::write(socket, asio::buffer(header));
        asio::write(socket, asio::buffer(payload));
    }

    json receive() {
        unsigned char header[4];
        asio::read(socket, asio::buffer(header));
        size_t size = (size_t(header[0]) << 24) | (size_t(header[1]) << 16) | (size_t(header[2]) << 8) | size_t(header[3]);
        string payload(size, '\0');
        asio::read(socket, asio::buffer(payload.data(), size));
        return json::parse(zlib_connection::decompress(payload, MAX_PACKET_SIZE));
    }

    /**
     * @brief 跳过心跳包，等待名称为 name 的数据包
     */
    json receive(const string &name) {
        while (true) {
            json packet = receive();
            if (packet["name"] == name) return packet;
        }
    }

    asio::io_context io;
    tcp::socket socket{io};
};

class BridgeServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = make_unique<bridge_server>(listen_address{"127.0.0.1", 0},
                                            judge_services{auth, store, sink, scheduler, registry});
        server_thread = thread([this] { server->run(); });
    }

    void TearDown() override {
        server->stop();
        if (server_thread.joinable()) server_thread.join();
    }

    key_authenticator auth{{{"judge-1", "secret-1"}}};
    ::testing::NiceMock<mock_submission_store> store;
    recording_sink sink;
    ::testing::NiceMock<mock_scheduler> scheduler;
    session_registry registry;

    unique_ptr<bridge_server> server;
    thread server_thread;
};

TEST_F(BridgeServerTest, AcceptsJudge) {
    tcp_judge judge(server->port());
    judge.send({{"name", "handshake"}, {"id", "judge-1"}, {"key", "secret-1"},
                {"problems", {"aplusb"}}, {"executors", {{"CPP17", {"g++", "9.3"}}}}});
    judge.receive("handshake-success");
    EXPECT_TRUE(eventually([&] { return registry.find("judge-1") != nullptr; }));

    judge.send({{"name", "ping"}, {"when", 1.5}});
    json response = judge.receive("ping-response");
    EXPECT_EQ(response["when"], 1.5);

    judge.socket.close();
    EXPECT_TRUE(eventually([&] { return registry.find("judge-1") == nullptr; }));
}

TEST_F(BridgeServerTest, StopAsksJudgesToDisconnect) {
    tcp_judge judge(server->port());
    judge.send({{"name", "handshake"}, {"id", "judge-1"}, {"key", "secret-1"},
                {"problems", json::array()}, {"executors", json::object()}});
    judge.receive("handshake-success");

    server->stop();
    judge.receive("disconnect");
    judge.socket.close();

    server_thread.join();
    EXPECT_FALSE(registry.find("judge-1"));
}
