#pragma once

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

namespace bridge::test {

/**
 * @brief 比较两个 json 值，不相等时输出双方内容和 json patch 形式的差异
 */
inline ::testing::AssertionResult json_equal(const char *actual_expression, const char *expected_expression,
                                             const nlohmann::json &actual, const nlohmann::json &expected) {
    if (actual == expected) return ::testing::AssertionSuccess();
    return ::testing::AssertionFailure()
           << actual_expression << " is\n" << actual.dump(2) << "\n"
           << expected_expression << " is\n" << expected.dump(2) << "\n"
           << "patch from actual to expected:\n" << nlohmann::json::diff(actual, expected).dump(2);
}

}  // namespace bridge::test

#define EXPECT_JSON_EQ(actual, expected) EXPECT_PRED_FORMAT2(::bridge::test::json_equal, actual, expected)
