#include "test/mocks.hpp"

namespace bridge::test {
using namespace std;
using namespace nlohmann;

void recording_sink::notify_result(const string &judge, const string &submission_id, const json &event) {
    {
        scoped_lock guard(mut);
        events.push_back({judge, submission_id, event});
    }
    cv.notify_all();
}

vector<recording_sink::record> recording_sink::records() const {
    scoped_lock guard(mut);
    return events;
}

bool recording_sink::wait_records(size_t count, chrono::milliseconds timeout) const {
    unique_lock lock(mut);
    return cv.wait_for(lock, timeout, [&] { return events.size() >= count; });
}

size_t recording_sink::terminal_count(const string &submission_id) const {
    scoped_lock guard(mut);
    size_t count = 0;
    for (auto &r : events)
        if (r.submission_id == submission_id && r.event.value("done", false))
            ++count;
    return count;
}

}  // namespace bridge::test
