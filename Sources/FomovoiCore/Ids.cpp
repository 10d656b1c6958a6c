#include "Ids.hpp"

#include <chrono>
#include <cstdio>
#include <random>

namespace fv {

std::string generate_uuid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());

    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;   // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xffff),
                  static_cast<unsigned>(hi & 0xffff),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xffffffffffffULL));
    return buf;
}

int64_t now_unix() {
    using namespace std::chrono;
    return static_cast<int64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace fv
