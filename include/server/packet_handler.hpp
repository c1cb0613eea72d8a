#pragma once

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include "server/connection.hpp"

namespace bridge::server {

/**
 * @brief 处理一个连接上的数据包的消息循环
 * 子类通过重写 on_* 回调实现具体的协议。
 * handle 在连接所属的线程上运行，直到连接关闭为止。
 */
struct packet_handler {
    explicit packet_handler(std::unique_ptr<connection> &&conn);
    virtual ~packet_handler();

    /**
     * @brief 运行消息循环，阻塞到连接关闭为止
     * 无论连接因为何种原因结束，on_disconnect 都会被调用一次
     */
    void handle();

    /**
     * @brief 消息循环是否已经结束
     */
    bool finished() const;

    /**
     * @brief 对方的地址
     */
    std::string address() const;

protected:
    virtual void on_connect();

    /**
     * @brief 收到一个数据包
     * @param data 解压后的数据包文本
     */
    virtual void on_packet(const std::string &data) = 0;

    /**
     * @brief 在超时时间内没有收到数据包，on_timeout 返回后连接会被关闭
     */
    virtual void on_timeout();

    virtual void on_disconnect();

    /**
     * @brief 发送一个 JSON 消息
     * @throw network_error 连接已经断开
     */
    void send(const nlohmann::json &packet);

    /**
     * @brief 强制关闭连接，不发送任何数据
     */
    void close();

    void set_timeout(std::chrono::milliseconds timeout);

private:
    std::unique_ptr<connection> conn;
    std::atomic<bool> done{false};
};

}  // namespace bridge::server
