#pragma once

#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <mutex>
#include "server/connection.hpp"

namespace bridge::server {

/**
 * @brief 基于 TCP 的评测机连接
 * 每个数据包由 4 字节大端序的长度和 zlib 压缩后的数据组成。
 * 读取使用 poll 实现超时，close 通过 shutdown 唤醒阻塞中的读取。
 */
struct zlib_connection : public connection {
    explicit zlib_connection(boost::asio::ip::tcp::socket &&socket);
    ~zlib_connection() override;

    read_result read_packet(std::string &packet) override;

    void send_packet(const std::string &packet) override;

    void set_timeout(std::chrono::milliseconds timeout) override;

    void close() override;

    std::string remote_address() const override;

    /**
     * @brief 使用 zlib 压缩数据
     */
    static std::string compress(const std::string &data);

    /**
     * @brief 解压 zlib 数据
     * @param max_size 解压后的最大长度，用于防止压缩炸弹
     * @throw network_error 数据不是合法的 zlib 数据流或者解压后过长
     */
    static std::string decompress(const std::string &data, std::size_t max_size);

private:
    read_result read_exact(char *buffer, std::size_t size);

    boost::asio::ip::tcp::socket socket;
    std::string address;
    std::atomic<bool> closed{false};
    std::atomic<std::chrono::milliseconds::rep> timeout_ms;
    std::mutex write_mut;
};

}  // namespace bridge::server
