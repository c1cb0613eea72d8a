#include "server/config.hpp"
#include <fstream>

namespace bridge::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("port").get_to(mq.port);
    j.at("exchange").get_to(mq.exchange);
    if (j.count("exchange_type"))
        j.at("exchange_type").get_to(mq.exchange_type);
    else
        mq.exchange_type = "direct";
    j.at("hostname").get_to(mq.hostname);
    j.at("queue").get_to(mq.queue);
    if (j.count("routing_key"))
        j.at("routing_key").get_to(mq.routing_key);
    else
        mq.routing_key = "";
}

void from_json(const json &j, redis &redis_config) {
    j.at("host").get_to(redis_config.host);
    j.at("port").get_to(redis_config.port);
    redis_config.password = get_value_def<string>(j, "", "password");
    redis_config.retry_interval = get_value_def<unsigned>(j, 1000, "retry_interval");
}

void from_json(const json &j, listen_address &listen) {
    listen.host = get_value_def<string>(j, "0.0.0.0", "host");
    listen.port = get_value_def<int>(j, 9999, "port");
}

void from_json(const json &j, bridge_config &config) {
    if (j.count("listen"))
        j.at("listen").get_to(config.listen);
    j.at("judges").get_to(config.judges);
    j.at("redis").get_to(config.redis_config);
    j.at("submissionQueue").get_to(config.submission_queue);
    j.at("resultQueue").get_to(config.result_queue);
}

bridge_config load_bridge_config(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) throw invalid_argument("Unable to open configuration file " + path.string());
    return json::parse(fin).get<bridge_config>();
}

}  // namespace bridge::server
