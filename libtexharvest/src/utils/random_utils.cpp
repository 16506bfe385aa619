#include "../../include/random_utils.hpp"

#include <cstdio>
#include <random>

namespace RandomUtils {

    unsigned long long next_u64() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        return rng();
    }

    std::string random_suffix() {
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", next_u64());
        return buf;
    }

} // namespace RandomUtils
