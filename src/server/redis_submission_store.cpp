#include "server/redis_submission_store.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"

namespace bridge::server {
using namespace std;

redis_submission_store::redis_submission_store(const redis &redis_config) {
    conn.init(redis_config);
}

message::submission_data redis_submission_store::fetch(const string &submission_id) {
    vector<cpp_redis::reply> replies;
    try {
        replies = conn.execute([&](cpp_redis::client &client, vector<future<cpp_redis::reply>> &futures) {
            futures.push_back(client.hgetall("submission:" + submission_id));
        });
    } catch (network_error &e) {
        LOG(ERROR) << "Unable to fetch data of submission " << submission_id << ": " << e.what();
        BOOST_THROW_EXCEPTION(submission_data_unavailable("submission store unavailable: " + string(e.what())));
    }

    map<string, string> fields;
    const cpp_redis::reply &reply = replies.at(0);
    if (reply.is_array()) {
        auto &items = reply.as_array();
        for (size_t i = 0; i + 1 < items.size(); i += 2)
            if (items[i].is_string() && items[i + 1].is_string())
                fields[items[i].as_string()] = items[i + 1].as_string();
    }
    if (fields.empty())
        BOOST_THROW_EXCEPTION(submission_data_unavailable("submission " + submission_id + " not found"));
    return parse_submission_data(submission_id, fields);
}

static bool parse_flag(const string &value) {
    return value == "1" || value == "true" || value == "True";
}

message::submission_data parse_submission_data(const string &submission_id, const map<string, string> &fields) {
    auto optional_int = [&](const char *key) -> optional<int64_t> {
        auto it = fields.find(key);
        if (it == fields.end() || it->second.empty() || it->second == "None") return nullopt;
        return boost::lexical_cast<int64_t>(it->second);
    };
    auto flag = [&](const char *key) {
        auto it = fields.find(key);
        return it != fields.end() && parse_flag(it->second);
    };

    message::submission_data data;
    try {
        data.time_limit = boost::lexical_cast<double>(fields.at("time"));
        data.memory_limit = boost::lexical_cast<int64_t>(fields.at("memory"));
        data.short_circuit = flag("short-circuit");
        data.pretests_only = flag("pretests-only");
        data.contest_no = optional_int("contest-no");
        data.attempt_no = optional_int("attempt-no");
        data.user_id = optional_int("user").value_or(0);
    } catch (out_of_range &) {
        BOOST_THROW_EXCEPTION(submission_data_unavailable("submission " + submission_id + " has incomplete data"));
    } catch (boost::bad_lexical_cast &) {
        BOOST_THROW_EXCEPTION(submission_data_unavailable("submission " + submission_id + " has malformed data"));
    }
    return data;
}

}  // namespace bridge::server
