#include "judge/ack_deadline.hpp"

namespace bridge {
using namespace std;

ack_deadline::~ack_deadline() {
    stop();
}

void ack_deadline::arm(chrono::milliseconds timeout, function<void()> on_expired) {
    scoped_lock guard(thread_mut);
    join_timer();

    token = ARMED;
    auto deadline = chrono::steady_clock::now() + timeout;
    timer_thread = thread([this, deadline, on_expired = move(on_expired)] {
        {
            unique_lock lock(mut);
            cv.wait_until(lock, deadline, [this] { return token != ARMED; });
        }
        int expected = ARMED;
        if (token.compare_exchange_strong(expected, FIRED))
            on_expired();
    });
}

bool ack_deadline::disarm() {
    int expected = ARMED;
    bool cancelled;
    {
        // 持有锁修改 token，避免计时线程检查条件后、进入等待前错过通知
        scoped_lock guard(mut);
        cancelled = token.compare_exchange_strong(expected, CANCELLED);
    }
    if (cancelled) cv.notify_all();
    return cancelled;
}

void ack_deadline::stop() {
    scoped_lock guard(thread_mut);
    join_timer();
}

void ack_deadline::join_timer() {
    disarm();
    if (timer_thread.joinable() && timer_thread.get_id() != this_thread::get_id())
        timer_thread.join();
}

bool ack_deadline::armed() const {
    return token == ARMED;
}

}  // namespace bridge
