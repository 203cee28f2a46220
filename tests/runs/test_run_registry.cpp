/**
 * @file test_run_registry.cpp
 * @brief Unit tests for run registration and lookup
 */

#include <gtest/gtest.h>

#include "runs/run_registry.hpp"

#include <set>
#include <string>
#include <thread>
#include <vector>

TEST(RunRegistry, CreateRegistersRunningRecord) {
    RunRegistry registry;
    RunParams params;
    params.simTime = 30;
    params.minGreen = 4;
    params.maxGreen = 12;

    std::string id = registry.create(params);
    std::shared_ptr<RunRecord> record = registry.find(id);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->id, id);
    EXPECT_EQ(record->params.simTime, 30);
    EXPECT_EQ(record->params.maxGreen, 12);
    EXPECT_EQ(record->status, RunStatus::Running);
    EXPECT_EQ(record->stats.totalVehicles, 0);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(RunRegistry, UnknownIdIsNotFound) {
    RunRegistry registry;
    registry.create(RunParams{});
    EXPECT_EQ(registry.find("nonexistent-id"), nullptr);
    EXPECT_EQ(registry.find(""), nullptr);
}

TEST(RunRegistry, IdentifiersAreVersion4Uuids) {
    RunRegistry registry;
    const std::string hex = "0123456789abcdef";
    for (int i = 0; i < 20; ++i) {
        std::string id = registry.create(RunParams{});
        ASSERT_EQ(id.size(), 36u) << id;
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[18], '-');
        EXPECT_EQ(id[23], '-');
        EXPECT_EQ(id[14], '4') << id;
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos) << id;
        for (std::size_t k = 0; k < id.size(); ++k) {
            if (k == 8 || k == 13 || k == 18 || k == 23) continue;
            EXPECT_NE(hex.find(id[k]), std::string::npos) << id;
        }
    }
}

TEST(RunRegistry, SeededRegistriesAreDeterministic) {
    RunRegistry a(42);
    RunRegistry b(42);
    EXPECT_EQ(a.create(RunParams{}), b.create(RunParams{}));
}

TEST(RunRegistry, IdsInCreationOrder) {
    RunRegistry registry(7);
    std::string first = registry.create(RunParams{});
    std::string second = registry.create(RunParams{});
    std::vector<std::string> ids = registry.ids();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], first);
    EXPECT_EQ(ids[1], second);
}

TEST(RunRegistry, ConcurrentCreatesYieldUniqueIds) {
    RunRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 100;
    std::vector<std::vector<std::string>> created(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, &created, t] {
            for (int i = 0; i < kPerThread; ++i) {
                std::string id = registry.create(RunParams{});
                // Lookups interleave with creations from other threads.
                if (registry.find(id) != nullptr) {
                    created[t].push_back(id);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::set<std::string> unique;
    for (const auto& ids : created) {
        EXPECT_EQ(ids.size(), static_cast<std::size_t>(kPerThread));
        unique.insert(ids.begin(), ids.end());
    }
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
    EXPECT_EQ(registry.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
