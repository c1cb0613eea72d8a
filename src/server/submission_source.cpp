#include "server/submission_source.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "server/rabbitmq.hpp"

namespace bridge::server {
using namespace std;
using namespace nlohmann;

submission_source::submission_source(const amqp &queue, judge_queue &judges)
    : queue(queue), judges(judges) {}

submission_source::~submission_source() {
    stop();
}

void submission_source::start() {
    consumer = thread([this] { consume_loop(); });
}

void submission_source::stop() {
    stopping = true;
    if (consumer.joinable()) consumer.join();
}

void submission_source::dispatch(judge_queue &judges, const json &message) {
    string action = get_value<string>(message, "action");
    if (action == "submit") {
        pending_submission submission;
        submission.submission_id = get_value<string>(message, "submission-id");
        submission.problem_id = get_value<string>(message, "problem-id");
        submission.language = get_value<string>(message, "language");
        submission.source = get_value<string>(message, "source");
        if (exists(message, "judge-id"))
            submission.judge_id = get_value<string>(message, "judge-id");
        judges.enqueue(move(submission));
    } else if (action == "abort") {
        string submission_id = get_value<string>(message, "submission-id");
        if (!judges.abort(submission_id))
            LOG(WARNING) << "Unable to abort submission " << submission_id << ": not found";
    } else {
        throw invalid_argument("Unknown action " + action);
    }
}

void submission_source::consume_loop() {
    try {
        rabbitmq mq(queue, false);
        while (!stopping) {
            AmqpClient::Envelope::ptr_t envelope;
            if (!mq.fetch(envelope, 1000)) continue;

            string body = envelope->Message()->Body();
            try {
                dispatch(judges, json::parse(body));
            } catch (std::exception &e) {
                LOG(ERROR) << "Malformed submission message: " << e.what() << endl
                           << body;
            }
            mq.ack(envelope);
        }
    } catch (std::exception &e) {
        LOG(ERROR) << "Submission queue failed, no more submissions will be received: "
                   << boost::diagnostic_information(e);
    }
}

}  // namespace bridge::server
