#include "judge/update_rate_limiter.hpp"

namespace bridge {
using namespace std;
using namespace nlohmann;

update_rate_limiter::update_rate_limiter(size_t limit, chrono::milliseconds window)
    : limit(limit), window(window) {}

vector<json> update_rate_limiter::offer(json event, clock::time_point now) {
    vector<json> forward;
    if (!last_reset || now - *last_reset > window) {
        counter = 0;
        last_reset = now;
    }

    if (pending) {
        if (counter < limit) {
            // 新的窗口开始，先转发之前合并的事件，保持测试点的顺序
            forward.push_back(move(*pending));
            pending.reset();
            ++counter;
        } else {
            for (auto &c : event.at("cases"))
                pending->at("cases").push_back(move(c));
            (*pending)["batch"] = event["batch"];
            return forward;
        }
    }

    if (counter < limit) {
        forward.push_back(move(event));
        ++counter;
    } else {
        pending = move(event);
    }
    return forward;
}

optional<json> update_rate_limiter::flush() {
    optional<json> result = move(pending);
    pending.reset();
    return result;
}

void update_rate_limiter::reset() {
    counter = 0;
    last_reset.reset();
    pending.reset();
}

size_t update_rate_limiter::updates() const {
    return counter;
}

}  // namespace bridge
