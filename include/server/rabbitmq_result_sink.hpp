#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "server/rabbitmq.hpp"
#include "server/result_sink.hpp"

namespace bridge::server {

/**
 * @brief 将评测结果事件发送到消息队列
 * notify_result 只将事件放入队列，由单独的发送线程按顺序发送，
 * 消息队列不可用时不会阻塞评测机会话。发送失败的事件只记录日志。
 *
 * 消息格式：{"judge": 评测机名称, "submission": 提交编号, "event": 事件}
 */
struct rabbitmq_result_sink : public result_sink {
    explicit rabbitmq_result_sink(const amqp &queue);
    ~rabbitmq_result_sink() override;

    void notify_result(const std::string &judge, const std::string &submission_id, const nlohmann::json &event) override;

    /**
     * @brief 发送完队列中剩余的事件后停止发送线程
     */
    void stop();

private:
    void publish_loop();

    rabbitmq mq;
    concurrent_queue<std::string> messages;
    std::atomic<bool> stopping{false};
    std::thread publisher;
};

}  // namespace bridge::server
