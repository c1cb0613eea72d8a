#include "server/judge_queue.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <iterator>
#include "common/exceptions.hpp"
#include "judge/judge_handler.hpp"
#include "judge/session_registry.hpp"

namespace bridge::server {
using namespace std;

judge_queue::judge_queue(session_registry &registry)
    : registry(registry) {}

void judge_queue::enqueue(pending_submission submission) {
    {
        scoped_lock guard(mut);
        LOG(INFO) << "Queued submission " << submission.submission_id << " for problem " << submission.problem_id;
        queue.push_back(move(submission));
    }
    dispatch();
}

bool judge_queue::abort(const string &submission_id) {
    {
        scoped_lock guard(mut);
        auto it = find_if(queue.begin(), queue.end(), [&](const pending_submission &s) {
            return s.submission_id == submission_id;
        });
        if (it != queue.end()) {
            queue.erase(it);
            LOG(INFO) << "Removed queued submission " << submission_id;
            return true;
        }

        // 正在分配的提交在本轮分配结束后再处理
        auto flight = in_flight.find(submission_id);
        if (flight != in_flight.end()) {
            flight->second.aborted = true;
            LOG(INFO) << "Submission " << submission_id << " will be aborted after dispatching";
            return true;
        }
    }

    auto judge = registry.find_by_submission(submission_id);
    if (!judge) return false;

    try {
        judge->abort();
        LOG(INFO) << "Requested judge " << judge->name() << " to abort submission " << submission_id;
    } catch (network_error &e) {
        LOG(WARNING) << "Unable to abort submission " << submission_id << " on judge " << judge->name() << ": " << e.what();
    }
    return true;
}

size_t judge_queue::size() const {
    scoped_lock guard(mut);
    size_t unsettled = count_if(in_flight.begin(), in_flight.end(), [](auto &entry) {
        return !entry.second.settled;
    });
    return queue.size() + unsettled;
}

void judge_queue::session_ready(const shared_ptr<judge_handler> &judge) {
    dispatch();
}

void judge_queue::session_idle(const shared_ptr<judge_handler> &judge) {
    {
        scoped_lock guard(mut);
        auto current = judge->current_submission();
        for (auto it = running.begin(); it != running.end();) {
            // 评测机空闲后可能已经被分配了新的提交
            if (it->second.judge == judge.get() && it->first != current)
                it = running.erase(it);
            else
                ++it;
        }
        for (auto &[id, flight] : in_flight)
            if (flight.judge == judge.get() && id != current)
                flight.finished = true;
    }
    dispatch();
}

void judge_queue::submission_lost(const string &submission_id) {
    {
        scoped_lock guard(mut);
        auto it = running.find(submission_id);
        if (it == running.end()) {
            auto flight = in_flight.find(submission_id);
            if (flight != in_flight.end()) {
                flight->second.lost = true;
                return;
            }
            LOG(WARNING) << "Lost submission " << submission_id << " is not tracked, unable to requeue";
            return;
        }

        LOG(INFO) << "Requeued lost submission " << submission_id;
        queue.push_front(move(it->second.submission));
        running.erase(it);
    }
    dispatch();
}

void judge_queue::submission_failed(const string &submission_id, const string &message) {
    scoped_lock guard(mut);
    LOG(ERROR) << "Submission " << submission_id << " failed: " << message;
    running.erase(submission_id);
    auto flight = in_flight.find(submission_id);
    if (flight != in_flight.end()) flight->second.finished = true;
}

void judge_queue::dispatch() {
    {
        scoped_lock guard(mut);
        dispatch_requested = true;
        if (dispatching) return;
        dispatching = true;
    }

    while (true) {
        deque<pending_submission> batch;
        {
            scoped_lock guard(mut);
            if (!dispatch_requested) {
                dispatching = false;
                return;
            }
            dispatch_requested = false;
            batch.swap(queue);
            for (auto &submission : batch)
                in_flight[submission.submission_id] = in_flight_submission();
        }

        auto sessions = registry.snapshot();
        vector<dispatch_result> results;
        try {
            for (auto &submission : batch)
                results.push_back(try_dispatch(submission, sessions));
        } catch (...) {
            // 未分配的提交放回队列，让下一次分配继续处理
            results.resize(batch.size(), dispatch_result::pending);
            settle(batch, results);
            scoped_lock guard(mut);
            dispatching = false;
            throw;
        }

        for (auto &submission_id : settle(batch, results)) {
            auto judge = registry.find_by_submission(submission_id);
            if (!judge) continue;
            try {
                judge->abort();
                LOG(INFO) << "Requested judge " << judge->name() << " to abort submission " << submission_id;
            } catch (network_error &e) {
                LOG(WARNING) << "Unable to abort submission " << submission_id << " on judge " << judge->name() << ": " << e.what();
            }
        }
    }
}

judge_queue::dispatch_result judge_queue::try_dispatch(const pending_submission &submission, const vector<shared_ptr<judge_handler>> &sessions) {
    vector<shared_ptr<judge_handler>> candidates;
    for (auto &judge : sessions)
        if (!judge->working() && judge->can_judge(submission.problem_id, submission.language, submission.judge_id))
            candidates.push_back(judge);

    stable_sort(candidates.begin(), candidates.end(), [](auto &a, auto &b) {
        return a->load() < b->load();
    });

    for (auto &judge : candidates) {
        {
            scoped_lock guard(mut);
            auto &flight = in_flight[submission.submission_id];
            if (flight.aborted) return dispatch_result::pending;
            flight.judge = judge.get();
        }
        try {
            judge->submit(submission.submission_id, submission.problem_id, submission.language, submission.source);
            scoped_lock guard(mut);
            in_flight[submission.submission_id].settled = true;
            return dispatch_result::assigned;
        } catch (submission_data_unavailable &e) {
            LOG(ERROR) << "Dropping submission " << submission.submission_id << ": " << e.what();
            scoped_lock guard(mut);
            in_flight[submission.submission_id].settled = true;
            return dispatch_result::dropped;
        } catch (session_busy &e) {
            DLOG(INFO) << e.what();
        } catch (network_error &e) {
            LOG(WARNING) << "Unable to dispatch submission " << submission.submission_id << " to judge "
                         << judge->name() << ": " << e.what();
        }
    }
    return dispatch_result::pending;
}

vector<string> judge_queue::settle(deque<pending_submission> &batch, const vector<dispatch_result> &results) {
    scoped_lock guard(mut);
    vector<string> aborted;
    deque<pending_submission> requeue;
    for (size_t i = 0; i < batch.size(); ++i) {
        auto &submission = batch[i];
        in_flight_submission flight;
        auto it = in_flight.find(submission.submission_id);
        if (it != in_flight.end()) {
            flight = it->second;
            in_flight.erase(it);
        }

        if (results[i] == dispatch_result::dropped) continue;

        if (results[i] == dispatch_result::pending) {
            if (flight.aborted)
                LOG(INFO) << "Removed queued submission " << submission.submission_id;
            else
                requeue.push_back(move(submission));
            continue;
        }

        // 评测机在分配期间断开连接，提交需要再分配一轮
        if (flight.lost) {
            LOG(INFO) << "Requeued lost submission " << submission.submission_id;
            requeue.push_back(move(submission));
            dispatch_requested = true;
            continue;
        }
        if (flight.finished) continue;
        if (flight.aborted) aborted.push_back(submission.submission_id);
        running[submission.submission_id] = {move(submission), flight.judge};
    }

    queue.insert(queue.begin(), make_move_iterator(requeue.begin()), make_move_iterator(requeue.end()));
    return aborted;
}

}  // namespace bridge::server
