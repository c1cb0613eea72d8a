#pragma once

#include <atomic>
#include <nlohmann/json.hpp>
#include <thread>
#include "server/config.hpp"
#include "server/judge_queue.hpp"

namespace bridge::server {

/**
 * @brief 从消息队列中获取新提交和取消请求，交给 judge_queue
 *
 * 消息格式：
 * {"action": "submit", "submission-id": ..., "problem-id": ..., "language": ..., "source": ..., "judge-id": ...}
 * {"action": "abort", "submission-id": ...}
 */
struct submission_source {
    submission_source(const amqp &queue, judge_queue &judges);
    ~submission_source();

    /**
     * @brief 启动消费消息的线程
     */
    void start();

    /**
     * @brief 停止消费消息的线程，可以重复调用
     */
    void stop();

    /**
     * @brief 处理一条消息
     * @throw std::invalid_argument 消息格式不正确
     */
    static void dispatch(judge_queue &judges, const nlohmann::json &message);

private:
    void consume_loop();

    amqp queue;
    judge_queue &judges;
    std::atomic<bool> stopping{false};
    std::thread consumer;
};

}  // namespace bridge::server
