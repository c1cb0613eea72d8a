#include "judge/session_registry.hpp"
#include <glog/logging.h>
#include "judge/judge_handler.hpp"
#include "server/scheduler.hpp"

namespace bridge {
using namespace std;

void session_registry::set_scheduler(server::scheduler *scheduler) {
    this->scheduler = scheduler;
}

void session_registry::register_session(const shared_ptr<judge_handler> &judge) {
    shared_ptr<judge_handler> previous;
    {
        scoped_lock guard(mut);
        auto &slot = sessions[judge->name()];
        previous = slot.lock();
        slot = judge;
    }

    if (previous && previous != judge) {
        LOG(WARNING) << "Judge " << judge->name() << " reconnected from " << judge->address()
                     << ", disconnecting previous session from " << previous->address();
        previous->disconnect(true);
    }

    LOG(INFO) << "Judge available: " << judge->name();
    if (scheduler) scheduler->session_ready(judge);
}

void session_registry::unregister_session(const judge_handler &judge) {
    scoped_lock guard(mut);
    auto it = sessions.find(judge.name());
    if (it == sessions.end()) return;

    auto current = it->second.lock();
    if (!current || current.get() == &judge)
        sessions.erase(it);
}

shared_ptr<judge_handler> session_registry::find(const string &name) const {
    scoped_lock guard(mut);
    auto it = sessions.find(name);
    if (it == sessions.end()) return nullptr;
    return it->second.lock();
}

shared_ptr<judge_handler> session_registry::find_by_submission(const string &submission_id) const {
    for (auto &judge : snapshot())
        if (judge->current_submission() == submission_id)
            return judge;
    return nullptr;
}

vector<shared_ptr<judge_handler>> session_registry::snapshot() const {
    vector<shared_ptr<judge_handler>> result;
    scoped_lock guard(mut);
    for (auto &[name, session] : sessions)
        if (auto judge = session.lock())
            result.push_back(move(judge));
    return result;
}

}  // namespace bridge
