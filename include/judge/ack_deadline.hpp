#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace bridge {

/**
 * @brief 等待评测机确认收到提交的计时器
 * 超时回调和 disarm 通过同一个原子变量竞争，保证两者中只有一个生效：
 * disarm 返回 true 时回调一定不会被执行；回调已经执行时 disarm 返回 false。
 */
struct ack_deadline {
    ~ack_deadline();

    /**
     * @brief 启动计时器
     * 如果之前的计时器还在运行，会先取消并等待之前的计时线程结束
     * @param timeout 超时时间
     * @param on_expired 超时回调，在计时线程上执行
     */
    void arm(std::chrono::milliseconds timeout, std::function<void()> on_expired);

    /**
     * @brief 取消计时器
     * @return 是否在超时前成功取消
     */
    bool disarm();

    /**
     * @brief 取消计时器并等待计时线程结束，可以重复调用
     */
    void stop();

    bool armed() const;

private:
    enum state : int { IDLE, ARMED, CANCELLED, FIRED };

    void join_timer();

    std::atomic<int> token{IDLE};
    std::thread timer_thread;
    std::mutex thread_mut;
    std::mutex mut;
    std::condition_variable cv;
};

}  // namespace bridge
