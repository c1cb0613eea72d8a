#pragma once

#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 按照 keys 依次访问 json 对象的嵌套字段
 * @return 字段不存在或中间某层不是对象时返回 nullptr
 */
template <typename... Keys>
const json *find_path(const json &j, Keys &&... keys) {
    const json *ref = &j;
    auto step = [&ref](const auto &key) {
        if (ref && ref->is_object() && ref->contains(key))
            ref = &ref->at(key);
        else
            ref = nullptr;
    };
    (step(keys), ...);
    return ref;
}

template <typename... Keys>
bool exists(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    return ref && !ref->is_null();
}

template <typename... Keys>
std::invalid_argument build_invalid_argument(const json &j, Keys &&... keys) {
    std::string msg = "Unexpected value type of: ";
    ((msg += boost::lexical_cast<std::string>(keys) + "."), ...);
    msg += " in " + j.dump();
    return std::invalid_argument(msg);
}

template <typename... Keys>
const json &access(const json &j, Keys &&... keys) {
    const json *ref = find_path(j, keys...);
    if (!ref)
        throw build_invalid_argument(j, keys...);
    else
        return *ref;
}

/**
 * @brief 读取必须存在的字段，字段不存在或类型不匹配时抛出 std::invalid_argument
 */
template <typename T, typename... Keys>
T get_value(const json &j, Keys &&... keys) {
    const json &res = access(j, keys...);
    try {
        return res.get<T>();
    } catch (json::exception &) {
        throw build_invalid_argument(j, keys...);
    }
}

/**
 * @brief 读取可选字段，字段不存在、为 null 或类型不匹配时返回 def_value
 */
template <typename T, typename... Keys>
T get_value_def(const json &j, const T &def_value, Keys &&... keys) {
    const json *res = find_path(j, keys...);
    if (!res || res->is_null()) return def_value;
    try {
        return res->get<T>();
    } catch (json::exception &) {
        return def_value;
    }
}

}  // namespace nlohmann
