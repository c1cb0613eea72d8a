#pragma once

#include <atomic>
#include <boost/circular_buffer.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace bridge {

/**
 * @brief 评测机的心跳监控
 * 握手成功后启动一个线程，每隔 PING_INTERVAL 发送一次心跳包。
 * 评测机的回复由会话的消息循环转交给 record，计算延迟和时钟偏差的滑动平均值。
 *
 * 监控只用于观测，收不到心跳回复不会导致断开连接，断开连接由传输层的超时负责。
 * 只有最近 window 个发出的心跳包可以被回复，每个心跳包只能回复一次。
 * record 只会被消息循环线程调用；latency、time_delta、load 可以被任意线程读取。
 */
struct health_monitor {
    /**
     * @param window 滑动平均的采样数
     */
    explicit health_monitor(std::size_t window);
    ~health_monitor();

    /**
     * @brief 启动心跳线程
     * @param send_ping 发送心跳包，参数为发送时间戳（秒）
     * @param on_fatal 发送心跳包失败时调用，应当强制断开连接
     */
    void start(std::function<void(double)> send_ping, std::function<void()> on_fatal);

    /**
     * @brief 停止心跳线程并等待线程退出，可以重复调用
     */
    void stop();

    /**
     * @brief 登记一个已发出的心跳包，心跳线程发送前会自动调用
     * @param when 心跳包中的时间戳
     */
    void ping_sent(double when);

    /**
     * @brief 记录一次心跳回复
     * @param sent 心跳包的发送时间，必须是登记过且还没有被回复的时间戳
     * @param received 收到回复的时间
     * @param worker_time 评测机回复时的本地时间
     * @param load 评测机上报的负载
     * @return 数据是否合法，不合法的数据不会被记录
     */
    bool record(double sent, double received, double worker_time, double load);

    /**
     * @brief 平均往返延迟（秒），还没有采样时为空
     */
    std::optional<double> latency() const;

    /**
     * @brief 平均时钟偏差（秒），正数表示 bridge 的时钟比评测机快
     */
    std::optional<double> time_delta() const;

    /**
     * @brief 评测机最近一次上报的负载，上报前为极大值
     */
    double load() const;

    /**
     * @brief 当前采样数，不会超过窗口大小
     */
    std::size_t samples() const;

private:
    void ping_loop(std::function<void(double)> send_ping, std::function<void()> on_fatal);

    boost::circular_buffer<double> outstanding_pings;
    std::mutex ping_mut;

    boost::circular_buffer<double> ping_average;
    boost::circular_buffer<double> time_deltas;

    std::atomic<double> latency_estimate;
    std::atomic<double> time_delta_estimate;
    std::atomic<double> load_value;
    std::atomic<std::size_t> sample_count{0};

    std::thread ping_thread;
    std::mutex stop_mut;
    std::condition_variable stop_cv;
    bool stopping = false;
};

}  // namespace bridge
