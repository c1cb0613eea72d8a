#include "server/rabbitmq_result_sink.hpp"
#include <glog/logging.h>
#include "common/messages.hpp"

namespace bridge::server {
using namespace std;
using namespace nlohmann;

rabbitmq_result_sink::rabbitmq_result_sink(const amqp &queue)
    : mq(queue, true) {
    publisher = thread([this] { publish_loop(); });
}

rabbitmq_result_sink::~rabbitmq_result_sink() {
    stop();
}

void rabbitmq_result_sink::notify_result(const string &judge, const string &submission_id, const json &event) {
    json j = {{"judge", judge}, {"submission", submission_id}, {"event", event}};
    messages.push(message::encode(j));
}

void rabbitmq_result_sink::stop() {
    stopping = true;
    if (publisher.joinable()) publisher.join();
}

void rabbitmq_result_sink::publish_loop() {
    string message;
    while (true) {
        if (!messages.pop_for(message, chrono::milliseconds(100))) {
            if (stopping) break;
            continue;
        }

        try {
            mq.report(message);
        } catch (std::exception &e) {
            LOG(ERROR) << "Unable to publish judge result, dropping: " << e.what() << endl
                       << message;
        }
    }
}

}  // namespace bridge::server
