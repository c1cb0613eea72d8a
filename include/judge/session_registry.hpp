#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bridge {
namespace server {
struct scheduler;
}

struct judge_handler;

/**
 * @brief 已经通过认证的评测机会话表，以评测机名称为键
 * 注册表不持有会话，会话的生命周期由其连接线程管理。
 */
struct session_registry {
    /**
     * @brief 设置接收 session_ready 通知的调度器，必须在开始接受连接之前调用
     */
    void set_scheduler(server::scheduler *scheduler);

    /**
     * @brief 注册一个会话
     * 如果已经存在同名的评测机，旧的会话将被替换并强制断开
     */
    void register_session(const std::shared_ptr<judge_handler> &judge);

    /**
     * @brief 移除一个会话
     * 如果该名称已经被新的会话占用，则不做任何事
     */
    void unregister_session(const judge_handler &judge);

    std::shared_ptr<judge_handler> find(const std::string &name) const;

    /**
     * @brief 查找正在评测某个提交的会话
     */
    std::shared_ptr<judge_handler> find_by_submission(const std::string &submission_id) const;

    /**
     * @brief 所有仍然存活的会话
     */
    std::vector<std::shared_ptr<judge_handler>> snapshot() const;

private:
    mutable std::mutex mut;
    std::map<std::string, std::weak_ptr<judge_handler>> sessions;
    server::scheduler *scheduler = nullptr;
};

}  // namespace bridge
