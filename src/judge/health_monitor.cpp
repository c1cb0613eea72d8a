#include "judge/health_monitor.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include "common/utils.hpp"
#include "config.hpp"

namespace bridge {
using namespace std;

static constexpr double NO_SAMPLE = numeric_limits<double>::quiet_NaN();

// 评测机上报负载前，认为其负载极高，调度器不会优先选择它
static constexpr double MAX_LOAD = 1e100;

static double mean(const boost::circular_buffer<double> &samples) {
    return accumulate(samples.begin(), samples.end(), 0.0) / samples.size();
}

health_monitor::health_monitor(size_t window)
    : outstanding_pings(window), ping_average(window), time_deltas(window),
      latency_estimate(NO_SAMPLE), time_delta_estimate(NO_SAMPLE), load_value(MAX_LOAD) {}

health_monitor::~health_monitor() {
    stop();
}

void health_monitor::start(function<void(double)> send_ping, function<void()> on_fatal) {
    {
        scoped_lock guard(stop_mut);
        if (ping_thread.joinable() || stopping) return;
    }
    ping_thread = thread([this, send_ping = move(send_ping), on_fatal = move(on_fatal)] {
        ping_loop(send_ping, on_fatal);
    });
}

void health_monitor::ping_loop(function<void(double)> send_ping, function<void()> on_fatal) {
    try {
        while (true) {
            double now = unix_time();
            ping_sent(now);
            send_ping(now);

            unique_lock lock(stop_mut);
            if (stop_cv.wait_for(lock, PING_INTERVAL, [this] { return stopping; }))
                break;
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Ping error: " << e.what();
        on_fatal();
    }
}

void health_monitor::stop() {
    {
        scoped_lock guard(stop_mut);
        stopping = true;
    }
    stop_cv.notify_all();
    if (ping_thread.joinable() && ping_thread.get_id() != this_thread::get_id())
        ping_thread.join();
}

void health_monitor::ping_sent(double when) {
    scoped_lock guard(ping_mut);
    outstanding_pings.push_back(when);
}

bool health_monitor::record(double sent, double received, double worker_time, double load) {
    {
        scoped_lock guard(ping_mut);
        auto it = find(outstanding_pings.begin(), outstanding_pings.end(), sent);
        if (it == outstanding_pings.end()) return false;
        outstanding_pings.erase(it);
    }

    double latency = received - sent;
    if (!isfinite(latency) || latency < 0 || !isfinite(worker_time) || !isfinite(load))
        return false;

    ping_average.push_back(latency);
    time_deltas.push_back((received + sent) / 2 - worker_time);

    latency_estimate = mean(ping_average);
    time_delta_estimate = mean(time_deltas);
    load_value = load;
    sample_count = ping_average.size();
    return true;
}

optional<double> health_monitor::latency() const {
    double value = latency_estimate;
    if (isnan(value)) return nullopt;
    return value;
}

optional<double> health_monitor::time_delta() const {
    double value = time_delta_estimate;
    if (isnan(value)) return nullopt;
    return value;
}

double health_monitor::load() const {
    return load_value;
}

size_t health_monitor::samples() const {
    return sample_count;
}

}  // namespace bridge
