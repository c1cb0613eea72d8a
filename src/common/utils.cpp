#include "common/utils.hpp"
#include <cstdlib>
#include <thread>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

double unix_time() {
    return chrono::duration<double>(chrono::system_clock::now().time_since_epoch()).count();
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

bool retry_until(chrono::steady_clock::time_point deadline, chrono::milliseconds interval, int attempts,
                 const function<bool()> &attempt) {
    for (int i = 0; i < attempts; ++i) {
        if (i > 0) {
            if (chrono::steady_clock::now() + interval >= deadline) return false;
            this_thread::sleep_for(interval);
        }
        if (chrono::steady_clock::now() >= deadline) return false;
        if (attempt()) return true;
    }
    return false;
}
