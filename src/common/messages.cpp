#include "common/messages.hpp"
#include <glog/logging.h>
#include "common/json_utils.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace bridge::message {
using namespace std;
using namespace nlohmann;

/**
 * @brief 读取 submission-id 字段
 * 评测机可能以整数或字符串的形式返回提交编号，统一转换为字符串
 */
static string read_submission_id(const json &j) {
    const json &id = access(j, "submission-id");
    string result;
    if (id.is_string())
        result = id.get<string>();
    else if (id.is_number_integer())
        result = id.dump();
    else
        throw build_invalid_argument(j, "submission-id");
    if (result.empty() || result.size() > MAX_IDENTIFIER_LENGTH)
        throw invalid_argument("submission-id is empty or too long");
    return result;
}

static double read_number(const json &j, const char *key) {
    const json &value = access(j, key);
    if (!value.is_number()) throw build_invalid_argument(j, key);
    return value.get<double>();
}

static bool valid_identifier(const string &s) {
    return !s.empty() && s.size() <= MAX_IDENTIFIER_LENGTH;
}

/**
 * @brief 解析题目列表
 * 每一项可以是题目编号，也可以是 [题目编号, 修改时间] 的二元组
 * @return 格式是否合法，超过 MAX_PROBLEMS 的部分将被丢弃
 */
static bool parse_problems(const json &j, set<string> &problems) {
    if (!j.is_array()) return false;
    for (auto &entry : j) {
        const json *code = &entry;
        if (entry.is_array()) {
            if (entry.empty()) return false;
            code = &entry.at(0);
        }
        if (!code->is_string()) return false;
        string id = code->get<string>();
        if (!valid_identifier(id)) return false;
        if (problems.size() >= MAX_PROBLEMS) {
            LOG(WARNING) << "Problem list truncated to " << MAX_PROBLEMS << " entries";
            break;
        }
        problems.insert(move(id));
    }
    return true;
}

static bool parse_executors(const json &j, map<string, json> &executors) {
    if (!j.is_object()) return false;
    for (auto &[name, info] : j.items()) {
        if (!valid_identifier(name)) return false;
        if (executors.size() >= MAX_PROBLEMS) {
            LOG(WARNING) << "Executor list truncated to " << MAX_PROBLEMS << " entries";
            break;
        }
        executors.emplace(name, info);
    }
    return true;
}

static handshake decode_handshake(const json &j) {
    handshake packet;
    string id = get_value_def<string>(j, "", "id");
    if (valid_identifier(id)) packet.id = move(id);
    if (exists(j, "key") && j.at("key").is_string())
        packet.key = j.at("key").get<string>();

    packet.malformed = !exists(j, "problems") || !parse_problems(j.at("problems"), packet.problems) ||
                       !exists(j, "executors") || !parse_executors(j.at("executors"), packet.executors);
    return packet;
}

static test_case_status decode_test_case_status(const json &j) {
    test_case_status packet;
    packet.submission_id = read_submission_id(j);
    const json &cases = access(j, "cases");
    if (!cases.is_array() || cases.empty())
        throw invalid_argument("cases must be a non-empty array");
    for (auto &c : cases)
        if (!c.is_object())
            throw invalid_argument("each test case must be an object");
    packet.cases = cases;
    return packet;
}

inbound decode(const string &raw) {
    json j;
    try {
        j = json::parse(raw);
    } catch (json::exception &e) {
        // 数值溢出等错误以 out_of_range 的形式报告，同样视为无法解析
        return unrecognized{raw, string("invalid json: ") + e.what()};
    }
    if (!j.is_object())
        return unrecognized{raw, "packet is not an object"};
    if (!j.contains("name") || !j.at("name").is_string())
        return unrecognized{raw, "packet has no name"};

    string name = j.at("name").get<string>();
    try {
        if (name == "handshake")
            return decode_handshake(j);
        if (name == "submission-acknowledged")
            return submission_acknowledged{read_submission_id(j)};
        if (name == "grading-begin")
            return grading_begin{read_submission_id(j), get_value_def<bool>(j, false, "pretested")};
        if (name == "grading-end")
            return grading_end{read_submission_id(j)};
        if (name == "compile-error")
            return compile_error{read_submission_id(j), get_value<string>(j, "log")};
        if (name == "compile-message")
            return compile_message{read_submission_id(j), get_value<string>(j, "log")};
        if (name == "batch-begin")
            return batch_begin{read_submission_id(j)};
        if (name == "batch-end")
            return batch_end{read_submission_id(j)};
        if (name == "test-case-status")
            return decode_test_case_status(j);
        if (name == "internal-error")
            return internal_error{read_submission_id(j), get_value<string>(j, "message")};
        if (name == "submission-terminated")
            return submission_terminated{read_submission_id(j)};
        if (name == "ping")
            return ping{read_number(j, "when")};
        if (name == "ping-response") {
            ping_response packet{read_number(j, "when"), read_number(j, "time"), nullopt};
            if (exists(j, "load")) packet.load = read_number(j, "load");
            return packet;
        }
        if (name == "supported-problems") {
            supported_problems packet;
            packet.malformed = !exists(j, "problems") || !parse_problems(j.at("problems"), packet.problems);
            return packet;
        }
    } catch (invalid_argument &e) {
        return unrecognized{raw, e.what()};
    } catch (json::exception &e) {
        return unrecognized{raw, e.what()};
    }
    return unrecognized{raw, "unknown packet name " + truncate_utf8(name, MAX_IDENTIFIER_LENGTH)};
}

string name_of(const inbound &msg) {
    return visit(overloaded{
                     [](const handshake &) { return "handshake"; },
                     [](const submission_acknowledged &) { return "submission-acknowledged"; },
                     [](const grading_begin &) { return "grading-begin"; },
                     [](const grading_end &) { return "grading-end"; },
                     [](const compile_error &) { return "compile-error"; },
                     [](const compile_message &) { return "compile-message"; },
                     [](const batch_begin &) { return "batch-begin"; },
                     [](const batch_end &) { return "batch-end"; },
                     [](const test_case_status &) { return "test-case-status"; },
                     [](const internal_error &) { return "internal-error"; },
                     [](const submission_terminated &) { return "submission-terminated"; },
                     [](const ping &) { return "ping"; },
                     [](const ping_response &) { return "ping-response"; },
                     [](const supported_problems &) { return "supported-problems"; },
                     [](const unrecognized &) { return "unrecognized"; }},
                 msg);
}

void to_json(json &j, const handshake_success &) {
    j = {{"name", "handshake-success"}};
}

void to_json(json &j, const submission_request &request) {
    const submission_data &data = request.data;
    j = {{"name", "submission-request"},
         {"submission-id", request.submission_id},
         {"problem-id", request.problem_id},
         {"language", request.language},
         {"source", request.source},
         {"time-limit", data.time_limit},
         {"memory-limit", data.memory_limit},
         {"short-circuit", data.short_circuit},
         {"meta", {{"pretests-only", data.pretests_only},
                   {"in-contest", data.contest_no ? json(*data.contest_no) : json(nullptr)},
                   {"attempt-no", data.attempt_no ? json(*data.attempt_no) : json(nullptr)},
                   {"user", data.user_id}}}};
}

void to_json(json &j, const terminate_submission &) {
    j = {{"name", "terminate-submission"}};
}

void to_json(json &j, const ping &request) {
    j = {{"name", "ping"}, {"when", request.when}};
}

void to_json(json &j, const ping_response &response) {
    j = {{"name", "ping-response"}, {"when", response.when}, {"time", response.time}};
    if (response.load) j["load"] = *response.load;
}

void to_json(json &j, const disconnect &) {
    j = {{"name", "disconnect"}};
}

string encode(const json &j) {
    // 源代码来自用户，可能包含非法的 UTF-8 序列，替换掉而不是抛出异常
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace bridge::message
