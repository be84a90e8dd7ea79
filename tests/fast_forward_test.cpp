#include <topbase-cpp/fast_forward.hpp>
#include <topbase-cpp/memory_repository.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace topbase_cpp;
using topbase_cpp::test::HistoryBuilder;

TEST(TryFastForward, series_sitting_on_the_target_fast_forwards) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto base = h.write("main", "f", "1\n");
    h.branch("feature", "main");
    h.write("feature", "f", "2\n");
    const auto tip = h.write("feature", "f", "3\n");

    const auto series = build_series(repo, tip, base);
    EXPECT_EQ(try_fast_forward(series, base), tip);
}

TEST(TryFastForward, diverged_target_does_not) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto base = h.write("main", "f", "1\n");
    h.branch("feature", "main");
    const auto tip = h.write("feature", "g", "2\n");
    const auto moved = h.write("main", "h", "3\n");

    const auto series = build_series(repo, tip, base);
    EXPECT_FALSE(try_fast_forward(series, moved).has_value());
}

TEST(TryFastForward, series_with_omitted_merges_does_not) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto base = h.write("main", "f", "1\n");
    h.branch("feature", "main");
    h.branch("tmp", "main");
    h.write("tmp", "t", "t\n");
    h.write("feature", "g", "2\n");
    h.merge("feature", "tmp", h.tree_of("tmp"));
    const auto tip = h.write("feature", "h", "3\n");

    const auto series = build_series(repo, tip, base);
    EXPECT_EQ(series.merges_skipped, 1u);
    EXPECT_FALSE(try_fast_forward(series, base).has_value());
}

TEST(TryFastForward, empty_series_does_not) {
    auto repo = MemoryRepository{};
    auto h = HistoryBuilder{repo};
    const auto base = h.write("main", "f", "1\n");

    EXPECT_FALSE(try_fast_forward(build_series(repo, base, base), base).has_value());
}
