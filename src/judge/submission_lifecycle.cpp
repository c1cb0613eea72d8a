#include "judge/submission_lifecycle.hpp"

namespace bridge {
using namespace std;

const char *state_name(lifecycle_state state) {
    switch (state) {
        case lifecycle_state::IDLE: return "idle";
        case lifecycle_state::REQUESTED: return "requested";
        case lifecycle_state::ACKNOWLEDGED: return "acknowledged";
        case lifecycle_state::GRADING: return "grading";
    }
    return "unknown";
}

const char *event_name(lifecycle_event event) {
    switch (event) {
        case lifecycle_event::ACKNOWLEDGED: return "submission-acknowledged";
        case lifecycle_event::GRADING_BEGIN: return "grading-begin";
        case lifecycle_event::BATCH_BEGIN: return "batch-begin";
        case lifecycle_event::BATCH_END: return "batch-end";
        case lifecycle_event::TEST_CASE: return "test-case-status";
        case lifecycle_event::COMPILE_MESSAGE: return "compile-message";
        case lifecycle_event::COMPILE_ERROR: return "compile-error";
        case lifecycle_event::GRADING_END: return "grading-end";
        case lifecycle_event::INTERNAL_ERROR: return "internal-error";
        case lifecycle_event::TERMINATED: return "submission-terminated";
    }
    return "unknown";
}

const char *transition_name(transition result) {
    switch (result) {
        case transition::APPLIED: return "applied";
        case transition::FINISHED: return "finished";
        case transition::NO_SUBMISSION: return "no current submission";
        case transition::ID_MISMATCH: return "submission id mismatch";
        case transition::INVALID_STATE: return "invalid state";
    }
    return "unknown";
}

bool submission_lifecycle::begin(const string &id) {
    scoped_lock guard(mut);
    if (current_state != lifecycle_state::IDLE) return false;
    current_state = lifecycle_state::REQUESTED;
    submission_id = id;
    batch_id = 0;
    in_batch = false;
    return true;
}

void submission_lifecycle::finish() {
    current_state = lifecycle_state::IDLE;
    submission_id.reset();
    batch_id = 0;
    in_batch = false;
}

transition submission_lifecycle::apply(lifecycle_event event, const string &id) {
    scoped_lock guard(mut);
    if (current_state == lifecycle_state::IDLE) return transition::NO_SUBMISSION;
    if (submission_id != id) return transition::ID_MISMATCH;

    bool grading = current_state == lifecycle_state::GRADING;
    switch (event) {
        case lifecycle_event::ACKNOWLEDGED:
            if (current_state != lifecycle_state::REQUESTED) return transition::INVALID_STATE;
            current_state = lifecycle_state::ACKNOWLEDGED;
            return transition::APPLIED;

        case lifecycle_event::GRADING_BEGIN:
            if (current_state != lifecycle_state::ACKNOWLEDGED && !grading) return transition::INVALID_STATE;
            current_state = lifecycle_state::GRADING;
            batch_id = 0;
            in_batch = false;
            return transition::APPLIED;

        case lifecycle_event::BATCH_BEGIN:
            if (!grading) return transition::INVALID_STATE;
            ++batch_id;
            in_batch = true;
            return transition::APPLIED;

        case lifecycle_event::BATCH_END:
            if (!grading || !in_batch) return transition::INVALID_STATE;
            in_batch = false;
            return transition::APPLIED;

        case lifecycle_event::TEST_CASE:
            return grading ? transition::APPLIED : transition::INVALID_STATE;

        case lifecycle_event::COMPILE_MESSAGE:
            return transition::APPLIED;

        case lifecycle_event::COMPILE_ERROR:
            finish();
            return transition::FINISHED;

        case lifecycle_event::GRADING_END:
            if (!grading) return transition::INVALID_STATE;
            finish();
            return transition::FINISHED;

        case lifecycle_event::INTERNAL_ERROR:
        case lifecycle_event::TERMINATED:
            finish();
            return transition::FINISHED;
    }
    return transition::INVALID_STATE;
}

optional<string> submission_lifecycle::reset() {
    scoped_lock guard(mut);
    optional<string> lost = submission_id;
    finish();
    return lost;
}

lifecycle_state submission_lifecycle::state() const {
    scoped_lock guard(mut);
    return current_state;
}

optional<string> submission_lifecycle::current() const {
    scoped_lock guard(mut);
    return submission_id;
}

optional<int> submission_lifecycle::batch() const {
    scoped_lock guard(mut);
    if (!in_batch) return nullopt;
    return batch_id;
}

}  // namespace bridge
