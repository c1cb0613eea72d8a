#include "common/stl_utils.hpp"

namespace bridge {
using namespace std;

string truncate_utf8(const string &str, size_t max_size) {
    if (str.size() <= max_size) return str;
    size_t len = max_size;
    // 回退到一个字符的起始字节，UTF-8 的后续字节形如 10xxxxxx
    while (len > 0 && (static_cast<unsigned char>(str[len]) & 0xC0) == 0x80)
        --len;
    return str.substr(0, len);
}

bool constant_time_equals(const string &a, const string &b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i)
        diff |= static_cast<unsigned char>(a[i] ^ b[i]);
    return diff == 0;
}

}  // namespace bridge
