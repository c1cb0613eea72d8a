#include "judge/authenticator.hpp"
#include "common/stl_utils.hpp"

namespace bridge {
using namespace std;

authenticator::~authenticator() {}

key_authenticator::key_authenticator(map<string, string> keys)
    : keys(move(keys)) {}

bool key_authenticator::authenticate(const string &id, const string &key) {
    auto it = keys.find(id);
    if (it == keys.end()) return false;
    return constant_time_equals(it->second, key);
}

}  // namespace bridge
