#pragma once

#include <memory>
#include <string>

namespace bridge {
struct judge_handler;
}

namespace bridge::server {

/**
 * @brief 评测机会话向调度器发出的通知
 * 所有回调都在评测机会话的线程上执行，调用时会话没有持有任何锁，
 * 调度器可以在回调中直接向会话分配新的提交。
 */
struct scheduler {
    virtual ~scheduler();

    /**
     * @brief 评测机完成握手，可以开始接收提交
     */
    virtual void session_ready(const std::shared_ptr<judge_handler> &judge) = 0;

    /**
     * @brief 评测机完成了一个提交，回到空闲状态
     */
    virtual void session_idle(const std::shared_ptr<judge_handler> &judge) = 0;

    /**
     * @brief 评测机在评测过程中断开连接，提交需要重新分配
     */
    virtual void submission_lost(const std::string &submission_id) = 0;

    /**
     * @brief 评测机报告评测提交时发生内部错误
     */
    virtual void submission_failed(const std::string &submission_id, const std::string &message) = 0;
};

}  // namespace bridge::server
