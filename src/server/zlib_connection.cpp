#include "server/zlib_connection.hpp"
#include <glog/logging.h>
#include <poll.h>
#include <sys/socket.h>
#include <zlib.h>
#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <array>
#include <cerrno>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"

namespace bridge::server {
using namespace std;
namespace asio = boost::asio;

zlib_connection::zlib_connection(asio::ip::tcp::socket &&s)
    : socket(move(s)), timeout_ms(HANDSHAKE_TIMEOUT.count()) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec)
        address = "<unknown>";
    else
        address = endpoint.address().to_string() + ":" + to_string(endpoint.port());
}

zlib_connection::~zlib_connection() {
    boost::system::error_code ec;
    socket.close(ec);
}

void zlib_connection::set_timeout(chrono::milliseconds timeout) {
    timeout_ms = timeout.count();
}

string zlib_connection::remote_address() const {
    return address;
}

void zlib_connection::close() {
    if (closed.exchange(true)) return;
    // 直接调用 shutdown 而不是 asio 的接口，因为另一个线程可能正阻塞在 read_some 上
    ::shutdown(socket.native_handle(), SHUT_RDWR);
}

read_result zlib_connection::read_exact(char *buffer, size_t size) {
    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms.load());
    size_t done = 0;
    while (done < size) {
        if (closed) return read_result::CLOSED;

        auto remaining = chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now());
        if (remaining.count() <= 0) return read_result::TIMEOUT;

        pollfd pfd{socket.native_handle(), POLLIN, 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            PLOG(WARNING) << "Unable to poll connection " << address;
            return read_result::CLOSED;
        }
        if (ret == 0) return read_result::TIMEOUT;

        boost::system::error_code ec;
        size_t n = socket.read_some(asio::buffer(buffer + done, size - done), ec);
        if (ec) {
            if (ec != asio::error::eof && !closed)
                LOG(WARNING) << "Error reading from " << address << ": " << ec.message();
            return read_result::CLOSED;
        }
        done += n;
    }
    return read_result::PACKET;
}

read_result zlib_connection::read_packet(string &packet) {
    unsigned char header[4];
    read_result result = read_exact(reinterpret_cast<char *>(header), sizeof(header));
    if (result != read_result::PACKET) return result;

    size_t size = (size_t(header[0]) << 24) | (size_t(header[1]) << 16) | (size_t(header[2]) << 8) | size_t(header[3]);
    if (size > MAX_PACKET_SIZE) {
        LOG(WARNING) << "Disconnecting " << address << " due to too-large message size: " << size;
        close();
        return read_result::CLOSED;
    }

    string payload(size, '\0');
    result = read_exact(payload.data(), size);
    if (result != read_result::PACKET) return result;

    try {
        packet = decompress(payload, MAX_PACKET_SIZE);
    } catch (network_error &e) {
        LOG(WARNING) << "Disconnecting " << address << " due to corrupted packet: " << e.what();
        close();
        return read_result::CLOSED;
    }
    return read_result::PACKET;
}

void zlib_connection::send_packet(const string &packet) {
    string payload = compress(packet);
    uint32_t size = payload.size();
    unsigned char header[4] = {
        static_cast<unsigned char>(size >> 24),
        static_cast<unsigned char>(size >> 16),
        static_cast<unsigned char>(size >> 8),
        static_cast<unsigned char>(size)};

    scoped_lock guard(write_mut);
    if (closed) throw network_error("Connection to " + address + " is closed");

    boost::system::error_code ec;
    array<asio::const_buffer, 2> buffers = {asio::buffer(header), asio::buffer(payload)};
    asio::write(socket, buffers, ec);
    if (ec) throw network_error("Unable to send packet to " + address + ": " + ec.message());
}

string zlib_connection::compress(const string &data) {
    uLongf size = compressBound(data.size());
    string result(size, '\0');
    int ret = ::compress(reinterpret_cast<Bytef *>(result.data()), &size,
                         reinterpret_cast<const Bytef *>(data.data()), data.size());
    if (ret != Z_OK) throw internal_error("zlib compress failed with code " + to_string(ret));
    result.resize(size);
    return result;
}

string zlib_connection::decompress(const string &data, size_t max_size) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK)
        throw internal_error("zlib inflateInit failed");
    defer { inflateEnd(&stream); };

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    stream.avail_in = data.size();

    string result;
    char buffer[16384];
    int ret;
    do {
        stream.next_out = reinterpret_cast<Bytef *>(buffer);
        stream.avail_out = sizeof(buffer);
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END)
            throw network_error("invalid zlib stream, inflate returned " + to_string(ret));
        result.append(buffer, sizeof(buffer) - stream.avail_out);
        if (result.size() > max_size)
            throw network_error("decompressed packet exceeds " + to_string(max_size) + " bytes");
    } while (ret != Z_STREAM_END);
    return result;
}

}  // namespace bridge::server
