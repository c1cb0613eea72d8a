#include "server/rabbitmq.hpp"
#include <glog/logging.h>
#include <thread>

namespace bridge::server {
using namespace std;

static constexpr int MAX_RETRY = 5;

rabbitmq::rabbitmq(const amqp &amqp, bool write) : queue(amqp), write(write) {
    connect();
}

void rabbitmq::connect() {
    LOG(INFO) << "RabbitMQ: Connecting to " << queue.hostname << ":" << queue.port << ", queue " << queue.queue;
    channel = AmqpClient::Channel::Create(queue.hostname, queue.port);
    channel->DeclareQueue(queue.queue, /* passive */ false, /* durable */ true, /* exclusive */ false, /* auto_delete */ false);
    channel->DeclareExchange(queue.exchange, queue.exchange_type, /* passive */ false, /* durable */ true);
    channel->BindQueue(queue.queue, queue.exchange, queue.routing_key);
    if (!write)  // 对于从消息队列读取消息的情况，我们需要监听队列
        channel->BasicConsume(queue.queue, /* consumer tag */ "", /* no_local */ true, /* no_ack */ false, /* exclusive */ false);
}

bool rabbitmq::fetch(AmqpClient::Envelope::ptr_t &envelope, int timeout) {
    scoped_lock guard(mut);
    for (int retry = 1;; ++retry) {
        try {
            return channel->BasicConsumeMessage(envelope, timeout);
        } catch (std::exception &e) {
            if (retry >= MAX_RETRY) throw;
            LOG(WARNING) << "RabbitMQ: Unable to consume message, reconnecting: " << e.what();
            this_thread::sleep_for(chrono::seconds(retry));
            connect();
        }
    }
}

void rabbitmq::ack(const AmqpClient::Envelope::ptr_t &envelope) {
    scoped_lock guard(mut);
    channel->BasicAck(envelope);
}

void rabbitmq::report(const string &message) {
    scoped_lock guard(mut);
    AmqpClient::BasicMessage::ptr_t msg = AmqpClient::BasicMessage::Create(message);
    DLOG(INFO) << "Sending message to exchange:" << queue.exchange << ", routing_key=" << queue.routing_key << std::endl
               << message;

    for (int retry = 1;; ++retry) {
        try {
            channel->BasicPublish(queue.exchange, queue.routing_key, msg);
            break;
        } catch (std::exception &e) {
            if (retry >= MAX_RETRY) throw;
            LOG(WARNING) << "RabbitMQ: Unable to publish message, reconnecting: " << e.what();
            this_thread::sleep_for(chrono::seconds(retry));
            connect();
        }
    }
    DLOG(INFO) << "Sending message succeeded";
}

}  // namespace bridge::server
