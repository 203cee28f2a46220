#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

/**
 * @brief Thread-safe wrapper around std::mt19937_64 used to mint run identifiers.
 */
class RandomGenerator {
public:
    /** @brief Seed with std::random_device for non-deterministic runs. */
    RandomGenerator();

    /** @brief Seed with a fixed value for deterministic runs. */
    explicit RandomGenerator(std::uint64_t seed);

    /** @brief Next raw 64-bit value. */
    std::uint64_t next64();

    /**
     * @brief Random (version 4, RFC 4122 variant) UUID in canonical text form,
     * e.g. "3f2b8c1e-9d4a-4c6e-8b1f-0a2d3e4f5a6b".
     */
    std::string uuid4();

private:
    std::mutex mutex_;
    std::mt19937_64 engine;
};
