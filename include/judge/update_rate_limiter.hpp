#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace bridge {

/**
 * @brief 限制转发测试点结果的频率
 * 一个提交可能有上千个很快的测试点，逐个转发会压垮下游的消费者。
 * 每个时间窗口内最多转发 limit 个测试点事件，超出的事件不会丢弃，
 * 而是把 cases 合并到一个待发送的事件中，在下一个窗口或者 flush 时一次性转发。
 */
struct update_rate_limiter {
    using clock = std::chrono::steady_clock;

    update_rate_limiter(std::size_t limit, std::chrono::milliseconds window);

    /**
     * @brief 提交一个测试点事件
     * @param event 测试点事件，必须包含 cases 数组
     * @param now 当前时间
     * @return 现在应当转发的事件，按顺序转发
     */
    std::vector<nlohmann::json> offer(nlohmann::json event, clock::time_point now);

    /**
     * @brief 取出被合并的待发送事件，不受频率限制
     * 在转发非测试点事件（特别是评测结束事件）之前调用，确保最后的测试点结果不会丢失
     */
    std::optional<nlohmann::json> flush();

    /**
     * @brief 开始新的提交时清空计数和待发送事件
     */
    void reset();

    /**
     * @brief 当前窗口内已经转发的事件数
     */
    std::size_t updates() const;

private:
    std::size_t limit;
    std::chrono::milliseconds window;

    std::size_t counter = 0;
    std::optional<clock::time_point> last_reset;
    std::optional<nlohmann::json> pending;
};

}  // namespace bridge
