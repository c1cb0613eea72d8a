#pragma once

#include <chrono>
#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <vector>
#include "server/config.hpp"

namespace bridge::server {

/**
 * @brief 表示一个 Redis 连接
 */
struct redis_conn {
    /**
     * @brief 根据 Redis 配置初始化 Redis 服务器连接
     */
    void init(const redis &redis_config) noexcept;

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接。
     * 所有重试的总时间不超过 DEPENDENCY_TIMEOUT，超时或重试次数过多则抛出 network_error。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并将操作的 future 放入 replies
     * @return 与 replies 顺序一致的操作结果
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连，超过 deadline 仍未连上则抛出 network_error
     * @param force 真时强制重连
     */
    void reconnect(std::chrono::steady_clock::time_point deadline, bool force = false);

private:
    redis redis_config;
    cpp_redis::client redis_client;
    std::mutex mut;
};

}  // namespace bridge::server
