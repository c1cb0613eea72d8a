#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "server/scheduler.hpp"

namespace bridge {
struct session_registry;
}

namespace bridge::server {

/**
 * @brief 等待分配给评测机的提交
 */
struct pending_submission {
    std::string submission_id;
    std::string problem_id;
    std::string language;
    std::string source;

    /**
     * @brief 指定评测该提交的评测机，为空表示任意评测机
     */
    std::optional<std::string> judge_id;
};

/**
 * @brief 先进先出的提交调度器
 * 每当有提交入队或者评测机变为空闲时，尝试将队首的提交分配给能评测它的、负载最低的空闲评测机。
 * 暂时没有评测机能评测的提交会留在队列中，不会阻塞后面的提交。
 */
struct judge_queue : public scheduler {
    explicit judge_queue(session_registry &registry);

    /**
     * @brief 提交入队并尝试分配
     */
    void enqueue(pending_submission submission);

    /**
     * @brief 取消一个提交
     * 如果提交还在队列中则直接移除，如果已经分配给评测机则要求评测机终止评测
     * @return 是否找到了该提交
     */
    bool abort(const std::string &submission_id);

    /**
     * @brief 等待分配的提交数，包括正在尝试分配但还没有评测机接收的提交
     */
    std::size_t size() const;

    void session_ready(const std::shared_ptr<judge_handler> &judge) override;
    void session_idle(const std::shared_ptr<judge_handler> &judge) override;
    void submission_lost(const std::string &submission_id) override;
    void submission_failed(const std::string &submission_id, const std::string &message) override;

private:
    /**
     * @brief 将队列中的提交分配给空闲的评测机，调用时不能持有 mut
     * 同一时间只有一个线程在分配，其他线程的分配请求交给该线程重新执行一轮。
     * 向评测机发送提交时不持有 mut，其他评测机会话的回调不会因为读取提交数据而阻塞。
     */
    void dispatch();

    enum class dispatch_result {
        assigned,  // 评测机已接收
        dropped,   // 提交数据不可用，丢弃
        pending    // 没有评测机能接收，留在队列中
    };

    /**
     * @brief 尝试将一个提交分配给评测机，调用时不能持有 mut
     * @param sessions 当前所有评测机会话
     */
    dispatch_result try_dispatch(const pending_submission &submission, const std::vector<std::shared_ptr<judge_handler>> &sessions);

    /**
     * @brief 根据一轮分配的结果更新队列，返回分配期间被取消、需要通知评测机终止的提交
     */
    std::vector<std::string> settle(std::deque<pending_submission> &batch, const std::vector<dispatch_result> &results);

    session_registry &registry;

    std::deque<pending_submission> queue;

    struct running_submission {
        pending_submission submission;
        const judge_handler *judge;
    };

    /**
     * @brief 已经分配的提交，以提交编号为键，用于评测机断开后重新入队
     */
    std::map<std::string, running_submission> running;

    /**
     * @brief 正在分配的提交，分配期间发生的取消、丢失和完成事件先记录在这里
     */
    struct in_flight_submission {
        const judge_handler *judge = nullptr;
        bool settled = false;
        bool aborted = false;
        bool lost = false;
        bool finished = false;
    };

    std::map<std::string, in_flight_submission> in_flight;

    bool dispatching = false;
    bool dispatch_requested = false;

    mutable std::mutex mut;
};

}  // namespace bridge::server
