#pragma once

#include <chrono>
#include <mutex>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "server/config.hpp"

namespace bridge::server {

/**
 * @brief 与消息队列交互的类
 */
struct rabbitmq {
    /**
     * @param amqp 消息队列配置
     * @param write 为真时只发送消息，否则监听队列
     */
    rabbitmq(const amqp &amqp, bool write);

    /**
     * @brief 从队列中获取一条消息，连接断开时会尝试重连
     * @param timeout 等待时间（毫秒），-1 表示一直等待
     * @return 是否在超时前获取到消息
     */
    bool fetch(AmqpClient::Envelope::ptr_t &envelope, int timeout = -1);

    void ack(const AmqpClient::Envelope::ptr_t &envelope);

    /**
     * @brief 发送一条消息，连接断开时会尝试重连
     */
    void report(const std::string &message);

private:
    void connect();

    AmqpClient::Channel::ptr_t channel;
    amqp queue;
    bool write;
    std::mutex mut;
};

}  // namespace bridge::server
