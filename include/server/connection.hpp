#pragma once

#include <chrono>
#include <string>

namespace bridge::server {

/**
 * @brief read_packet 的结果
 */
enum class read_result {
    /**
     * @brief 成功读取到一个完整的数据包
     */
    PACKET,

    /**
     * @brief 在超时时间内没有收到任何数据
     */
    TIMEOUT,

    /**
     * @brief 连接已经关闭，包括对方关闭、本地调用 close 以及数据流无法继续解析的情况
     */
    CLOSED
};

/**
 * @brief 表示一个与评测机的双向连接
 * 负责数据包的分帧和压缩，会话只处理解压后的文本数据包。
 * read_packet 只会被会话的消息循环线程调用，其他函数可以被任意线程调用。
 */
struct connection {
    virtual ~connection();

    /**
     * @brief 阻塞读取一个数据包
     * @param packet 保存读取到的数据包
     * @return 读取结果，超时时间通过 set_timeout 设置
     */
    virtual read_result read_packet(std::string &packet) = 0;

    /**
     * @brief 发送一个数据包，线程安全
     * @throw network_error 连接已经断开
     */
    virtual void send_packet(const std::string &packet) = 0;

    /**
     * @brief 设置无响应超时时间
     */
    virtual void set_timeout(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 关闭连接，不发送任何数据
     * 可以被多次调用，调用后阻塞的 read_packet 将返回 CLOSED
     */
    virtual void close() = 0;

    /**
     * @brief 对方的地址，用于日志
     */
    virtual std::string remote_address() const = 0;
};

}  // namespace bridge::server
