#include "util/random.hpp"

#include <cstdio>

RandomGenerator::RandomGenerator() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    engine.seed(seq);
}

RandomGenerator::RandomGenerator(std::uint64_t seed) : engine(seed) {}

std::uint64_t RandomGenerator::next64() {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine();
}

std::string RandomGenerator::uuid4() {
    std::uint64_t hi = next64();
    std::uint64_t lo = next64();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned int>(hi >> 32),
                  static_cast<unsigned int>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned int>(hi & 0xFFFF),
                  static_cast<unsigned int>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}
