#include <gtest/gtest.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <memory>
#include <thread>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "server/zlib_connection.hpp"

using namespace std;
using namespace bridge;
using namespace bridge::server;
namespace asio = boost::asio;
using asio::ip::tcp;

/**
 * @brief 在本地回环地址上建立一对连接，server 端由 zlib_connection 包装，client 端直接读写原始字节
 */
class ZlibConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        client.connect(acceptor.local_endpoint());
        tcp::socket accepted(io);
        acceptor.accept(accepted);
        conn = make_unique<zlib_connection>(move(accepted));
        conn->set_timeout(chrono::seconds(2));
    }

    void client_send(const string &payload) {
        uint32_t size = payload.size();
        unsigned char header[4] = {
            static_cast<unsigned char>(size >> 24),
            static_cast<unsigned char>(size >> 16),
            static_cast<unsigned char>(size >> 8),
            static_cast<unsigned char>(size)};
        asio::write(client, asio::buffer(header));
        asio::write(client, asio::buffer(payload));
    }

    string client_receive() {
        unsigned char header[4];
        asio::read(client, asio::buffer(header));
        size_t size = (size_t(header[0]) << 24) | (size_t(header[1]) << 16) | (size_t(header[2]) << 8) | size_t(header[3]);
        string payload(size, '\0');
        asio::read(client, asio::buffer(payload.data(), size));
        return zlib_connection::decompress(payload, MAX_PACKET_SIZE);
    }

    asio::io_context io;
    tcp::socket client{io};
    unique_ptr<zlib_connection> conn;
};

TEST_F(ZlibConnectionTest, CompressionRoundTrip) {
    string data(100000, 'x');
    string compressed = zlib_connection::compress(data);
    EXPECT_LT(compressed.size(), data.size());
    EXPECT_EQ(zlib_connection::decompress(compressed, data.size()), data);
}

TEST_F(ZlibConnectionTest, DecompressRejectsGarbage) {
    EXPECT_THROW(zlib_connection::decompress("definitely not zlib", 1024), network_error);

    string compressed = zlib_connection::compress("hello world");
    EXPECT_THROW(zlib_connection::decompress(compressed.substr(0, compressed.size() / 2), 1024), network_error);
}

TEST_F(ZlibConnectionTest, DecompressRejectsBomb) {
    string compressed = zlib_connection::compress(string(1 << 20, '\0'));
    EXPECT_THROW(zlib_connection::decompress(compressed, 1024), network_error);
}

TEST_F(ZlibConnectionTest, ReadsFramedPacket) {
    client_send(zlib_connection::compress(R"({"name":"ping","when":1})"));

    string packet;
    ASSERT_EQ(conn->read_packet(packet), read_result::PACKET);
    EXPECT_EQ(packet, R"({"name":"ping","when":1})");
}

TEST_F(ZlibConnectionTest, SendsFramedPacket) {
    conn->send_packet(R"({"name":"handshake-success"})");
    EXPECT_EQ(client_receive(), R"({"name":"handshake-success"})");
}

TEST_F(ZlibConnectionTest, ReadTimesOut) {
    conn->set_timeout(chrono::milliseconds(50));
    string packet;
    EXPECT_EQ(conn->read_packet(packet), read_result::TIMEOUT);
}

TEST_F(ZlibConnectionTest, PeerCloseEndsRead) {
    client.close();
    string packet;
    EXPECT_EQ(conn->read_packet(packet), read_result::CLOSED);
}

TEST_F(ZlibConnectionTest, OversizedPacketClosesConnection) {
    uint32_t size = MAX_PACKET_SIZE + 1;
    unsigned char header[4] = {
        static_cast<unsigned char>(size >> 24),
        static_cast<unsigned char>(size >> 16),
        static_cast<unsigned char>(size >> 8),
        static_cast<unsigned char>(size)};
    asio::write(client, asio::buffer(header));

    string packet;
    EXPECT_EQ(conn->read_packet(packet), read_result::CLOSED);
    EXPECT_THROW(conn->send_packet("{}"), network_error);
}

TEST_F(ZlibConnectionTest, CorruptedPacketClosesConnection) {
    client_send("definitely not zlib");
    string packet;
    EXPECT_EQ(conn->read_packet(packet), read_result::CLOSED);
}

TEST_F(ZlibConnectionTest, CloseWakesBlockedReader) {
    conn->set_timeout(chrono::seconds(10));
    read_result result = read_result::PACKET;
    thread reader([&] {
        string packet;
        result = conn->read_packet(packet);
    });
    this_thread::sleep_for(chrono::milliseconds(50));
    conn->close();
    reader.join();
    EXPECT_EQ(result, read_result::CLOSED);

    // 重复关闭
    conn->close();
    EXPECT_THROW(conn->send_packet("{}"), network_error);
}

TEST_F(ZlibConnectionTest, RemoteAddress) {
    EXPECT_EQ(conn->remote_address().rfind("127.0.0.1:", 0), 0u);
}
