#include "util/ids.hpp"
#include <random>

namespace codebox::util {

namespace {

std::mt19937_64& engine() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

constexpr const char* HEX_CHARS = "0123456789abcdef";

} // namespace

std::string random_hex(size_t length) {
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; i++) {
        out.push_back(HEX_CHARS[dist(engine())]);
    }
    return out;
}

std::string uuid4() {
    std::string hex = random_hex(32);
    // Version nibble and variant bits
    hex[12] = '4';
    std::uniform_int_distribution<int> variant(8, 11);
    hex[16] = HEX_CHARS[variant(engine())];

    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace codebox::util
