#include "buildmap-test-helpers.h"
#include "runmap/buildmap/build-map.h"
#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace runmap::buildmap;
using namespace buildmap_test;

namespace {

constexpr int kThreads = 8;

}  // namespace

class BuildMapConcurrencyTest : public ::testing::Test
{
protected:
    TempBuildsDir builds{"build-map-concurrency"};
    CountingConstructor counting;
};

TEST_F(BuildMapConcurrencyTest, ConcurrentGetLoadsOnce)
{
    for (int n = 1; n <= 16; ++n)
        builds.add_build(hourly_id(n), n);
    counting.set_delay(std::chrono::milliseconds(20));
    BuildMap map(builds.path(), counting.constructor());

    std::vector<BuildPtr> results(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&map, &results, t]() { results[t] = map.get(11); });
    }
    for (auto& thread : threads)
        thread.join();

    ASSERT_NE(results[0], nullptr);
    EXPECT_EQ(results[0]->number(), 11);
    for (const auto& result : results)
        EXPECT_EQ(result, results[0]);

    // Every directory visited along the way was loaded exactly once
    EXPECT_EQ(counting.calls_for(hourly_id(11)), 1);
    for (int n = 1; n <= 16; ++n)
        EXPECT_LE(counting.calls_for(hourly_id(n)), 1);

    auto on_load = std::dynamic_pointer_cast<TestBuild>(results[0]);
    ASSERT_NE(on_load, nullptr);
    EXPECT_EQ(on_load->on_load_calls(), 1);
}

TEST_F(BuildMapConcurrencyTest, ConcurrentGetOfAHoleLoadsOnce)
{
    builds.add_empty_dir(hourly_id(1));
    BuildMap map(builds.path(), counting.constructor());

    std::vector<std::thread> threads;
    std::atomic<int> found{0};
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&map, &found]() {
            if (map.get_by_id(hourly_id(1)))
                ++found;
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(found.load(), 0);
    EXPECT_EQ(map.stats().load_attempts, 1u);
    EXPECT_EQ(map.stats().listings, 1u);
}

TEST_F(BuildMapConcurrencyTest, ConcurrentNewestAgree)
{
    for (int n = 1; n <= 32; ++n)
        builds.add_build(hourly_id(n), n);
    counting.set_delay(std::chrono::milliseconds(2));
    BuildMap map(builds.path(), counting.constructor());

    std::vector<BuildPtr> newest(kThreads);
    std::vector<BuildPtr> oldest(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&, t]() {
            newest[t] = map.newest_value();
            oldest[t] = map.oldest_value();
        });
    }
    for (auto& thread : threads)
        thread.join();

    for (int t = 0; t < kThreads; ++t)
    {
        ASSERT_NE(newest[t], nullptr);
        ASSERT_NE(oldest[t], nullptr);
        EXPECT_EQ(newest[t], newest[0]);
        EXPECT_EQ(oldest[t], oldest[0]);
    }
    EXPECT_EQ(newest[0]->number(), 32);
    EXPECT_EQ(oldest[0]->number(), 1);
    for (int n = 1; n <= 32; ++n)
        EXPECT_LE(counting.calls_for(hourly_id(n)), 1);
}

TEST_F(BuildMapConcurrencyTest, ReadersSeeConsistentSnapshotsWhileWritersChange)
{
    constexpr int kBuilds = 40;
    for (int n = 1; n <= kBuilds; ++n)
        builds.add_build(hourly_id(n), n);
    BuildMap map(builds.path(), counting.constructor());

    std::atomic<bool> done{false};
    std::atomic<int> inconsistencies{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t)
    {
        readers.emplace_back([&]() {
            while (!done.load())
            {
                auto pinned = map.view().pin();
                std::size_t counted = 0;
                BuildNumber last = MIN_BUILD_NUMBER;
                for (const auto& [number, build] : pinned)
                {
                    if (number <= last || build->number() != number)
                        ++inconsistencies;
                    last = number;
                    ++counted;
                }
                if (counted != pinned.size())
                    ++inconsistencies;
            }
        });
    }

    std::thread loader([&]() {
        for (int n = 1; n <= kBuilds; ++n)
            map.get_by_id(hourly_id(n));
    });
    std::thread remover([&]() {
        for (int n = 2; n <= kBuilds; n += 2)
        {
            if (auto build = map.get_by_id(hourly_id(n)))
                map.remove_value(build);
        }
    });

    loader.join();
    remover.join();
    done = true;
    for (auto& reader : readers)
        reader.join();

    EXPECT_EQ(inconsistencies.load(), 0);

    // Only odd builds remain, each linked to its loaded neighbours
    auto pinned = map.view().pin();
    EXPECT_EQ(pinned.size(), static_cast<std::size_t>(kBuilds / 2));
    for (const auto& [number, build] : pinned)
    {
        EXPECT_EQ(number % 2, 1);
        if (number > 1)
            EXPECT_EQ(pinned.links_of(*build).previous, number - 2);
        if (number < kBuilds - 1)
            EXPECT_EQ(pinned.links_of(*build).next, number + 2);
    }
}

TEST_F(BuildMapConcurrencyTest, LinksAlwaysMatchTheSnapshotTheyArePinnedWith)
{
    constexpr int kBuilds = 60;
    for (int n = 1; n <= kBuilds; ++n)
        builds.add_build(hourly_id(n), n);
    BuildMap map(builds.path(), counting.constructor());

    std::atomic<bool> done{false};
    std::atomic<int> broken_links{0};
    std::atomic<int> checked{0};

    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t)
    {
        readers.emplace_back([&]() {
            do
            {
                auto pinned = map.view().pin();
                BuildPtr previous;
                for (const auto& [number, build] : pinned)
                {
                    // Consecutive loaded builds point at each other, and
                    // every link resolves inside the same snapshot
                    if (pinned.previous_of(*build) != previous)
                        ++broken_links;
                    if (previous && pinned.next_of(*previous) != build)
                        ++broken_links;
                    previous = build;
                }
                if (previous && pinned.next_of(*previous))
                    ++broken_links;
                ++checked;
            } while (!done.load());
        });
    }

    std::vector<std::thread> writers;
    for (int w = 0; w < 3; ++w)
    {
        writers.emplace_back([&map, w]() {
            for (int n = 1 + w; n <= kBuilds; n += 3)
            {
                auto build = map.get_by_id(hourly_id(n));
                if (build && n % 4 == 0)
                    map.remove_value(build);
            }
        });
    }
    for (auto& writer : writers)
        writer.join();
    done = true;
    for (auto& reader : readers)
        reader.join();

    EXPECT_GT(checked.load(), 0);
    EXPECT_EQ(broken_links.load(), 0);
    EXPECT_EQ(
        map.view().size(), static_cast<std::size_t>(kBuilds - kBuilds / 4));
}
