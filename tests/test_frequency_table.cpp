#include <gtest/gtest.h>
#include <random>
#include <optional>
#include <limits>
#include <cmath>
#include "FrequencyTable.hpp"

using Table = FrequencyTable<char>;

static void expect_sorted(const Table& t) {
    const auto& e = t.entries();
    for (size_t i = 1; i < e.size(); ++i) {
        ASSERT_GE(e[i - 1].frequency, e[i].frequency) << "at rank " << i;
    }
}

TEST(FrequencyTableTest, InitialState) {
    Table t;
    EXPECT_TRUE(t.is_empty());
    EXPECT_EQ(t.size(), 0u);
    EXPECT_EQ(t.total(), 0u);
    EXPECT_EQ(t.most_frequent(), std::nullopt);
    EXPECT_EQ(t.sample(0.0), std::nullopt);
    EXPECT_EQ(t.probability('a'), 0.0);
}

TEST(FrequencyTableTest, TracksFrequencies) {
    Table t;
    t.add('a');
    EXPECT_EQ(t.frequency('a'), 1u);

    t.add('b');
    EXPECT_EQ(t.frequency('a'), 1u);
    EXPECT_EQ(t.frequency('b'), 1u);

    t.add('a');
    EXPECT_EQ(t.frequency('a'), 2u);
    EXPECT_EQ(t.frequency('b'), 1u);
    EXPECT_EQ(t.frequency('z'), 0u);
}

TEST(FrequencyTableTest, TracksTotal) {
    Table t;
    t.add('a');
    EXPECT_EQ(t.total(), 1u);
    t.add('b');
    EXPECT_EQ(t.total(), 2u);
    t.add('a');
    EXPECT_EQ(t.total(), 3u);
    t.add(std::nullopt);
    EXPECT_EQ(t.total(), 4u);
    EXPECT_EQ(t.size(), 3u);
}

TEST(FrequencyTableTest, MostFrequent) {
    Table t;
    t.add('a');
    EXPECT_EQ(t.most_frequent(), 'a');
    t.add('b');
    EXPECT_EQ(t.most_frequent(), 'a');
    t.add('c');
    EXPECT_EQ(t.most_frequent(), 'a');
    t.add('b');
    EXPECT_EQ(t.most_frequent(), 'b');
    t.add('c');
    EXPECT_EQ(t.most_frequent(), 'b');
    t.add('c');
    EXPECT_EQ(t.most_frequent(), 'c');
}

TEST(FrequencyTableTest, TiesKeepEarlierEntryAhead) {
    Table t;
    t.add('a');
    t.add('b');
    t.add('b');
    t.add('a');

    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t.entries()[0].outcome, 'b');
    EXPECT_EQ(t.entries()[0].frequency, 2u);
    EXPECT_EQ(t.entries()[1].outcome, 'a');
    EXPECT_EQ(t.entries()[1].frequency, 2u);
    EXPECT_EQ(t.most_frequent(), 'b');
}

TEST(FrequencyTableTest, IncrementJumpsPastSeveralLowerEntries) {
    Table t;
    t.add('a');
    t.add('b');
    t.add('c');
    t.add('d');
    t.add('d');

    EXPECT_EQ(t.entries()[0].outcome, 'd');
    EXPECT_EQ(t.entries()[1].outcome, 'a');
    EXPECT_EQ(t.entries()[2].outcome, 'b');
    EXPECT_EQ(t.entries()[3].outcome, 'c');

    // index stays consistent after the move
    t.add('c');
    EXPECT_EQ(t.frequency('c'), 2u);
    EXPECT_EQ(t.entries()[1].outcome, 'c');
    EXPECT_EQ(t.entries()[2].outcome, 'a');
}

TEST(FrequencyTableTest, Sampling) {
    Table t;
    EXPECT_EQ(t.sample(0.0), std::nullopt);

    t.add('a');
    EXPECT_EQ(t.sample(0.0), 'a');

    t.add('b');
    EXPECT_EQ(t.sample(0.0), 'a');
    EXPECT_EQ(t.sample(0.5), 'b');

    t.add('c');
    EXPECT_EQ(t.sample(0.0), 'a');
    EXPECT_EQ(t.sample(0.34), 'b');
    EXPECT_EQ(t.sample(0.67), 'c');

    t.add('b');
    EXPECT_EQ(t.sample(0.0), 'b');
    EXPECT_EQ(t.sample(0.5), 'a');
    EXPECT_EQ(t.sample(0.75), 'c');

    t.add('c');
    EXPECT_EQ(t.sample(0.0), 'b');
    EXPECT_EQ(t.sample(0.4), 'c');
    EXPECT_EQ(t.sample(0.8), 'a');

    t.add('c');
    EXPECT_EQ(t.sample(0.0), 'c');
}

TEST(FrequencyTableTest, SampleOutsideUnitIntervalGivesNothing) {
    Table t;
    t.add('a');
    t.add('b');
    EXPECT_EQ(t.sample(-0.25), std::nullopt);
    EXPECT_EQ(t.sample(1.0), std::nullopt);
    EXPECT_EQ(t.sample(3.0), std::nullopt);
    EXPECT_EQ(t.sample(1e19), std::nullopt);
    EXPECT_EQ(t.sample(1e30), std::nullopt);
    EXPECT_EQ(t.sample(std::numeric_limits<double>::infinity()), std::nullopt);
    EXPECT_EQ(t.sample(-std::numeric_limits<double>::infinity()), std::nullopt);
    EXPECT_EQ(t.sample(std::numeric_limits<double>::quiet_NaN()), std::nullopt);
    // just below 1 still lands on the last entry
    EXPECT_EQ(t.sample(std::nextafter(1.0, 0.0)), 'b');
}

TEST(FrequencyTableTest, EndMarkerIsAnOrdinaryOutcome) {
    Table t;
    t.add(std::nullopt);
    t.add(std::nullopt);
    t.add('a');

    // the end marker ranks first, so reads come back empty
    EXPECT_EQ(t.most_frequent(), std::nullopt);
    EXPECT_EQ(t.sample(0.0), std::nullopt);
    EXPECT_EQ(t.sample(0.9), 'a');
    EXPECT_EQ(t.frequency(std::nullopt), 2u);

    auto top = t.outcome_at(0);
    ASSERT_TRUE(top.has_value());
    EXPECT_FALSE(top->has_value());
    EXPECT_EQ(t.outcome_at(5), std::nullopt);
}

TEST(FrequencyTableTest, Probability) {
    Table t;
    t.add('a');
    t.add('a');
    t.add('a');
    t.add('b');
    EXPECT_DOUBLE_EQ(t.probability('a'), 0.75);
    EXPECT_DOUBLE_EQ(t.probability('b'), 0.25);
    EXPECT_DOUBLE_EQ(t.probability('c'), 0.0);
}

TEST(FrequencyTableTest, RandomAddsKeepInvariants) {
    Table t;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> pick(0, 9);

    for (uint64_t n = 1; n <= 2000; ++n) {
        const int v = pick(rng);
        if (v == 9) t.add(std::nullopt);
        else t.add(static_cast<char>('a' + v));

        uint64_t sum = 0;
        for (const auto& e : t.entries()) sum += e.frequency;
        ASSERT_EQ(sum, n);
        ASSERT_EQ(t.total(), n);
        expect_sorted(t);
    }

    for (const auto& e : t.entries()) {
        EXPECT_EQ(t.frequency(e.outcome), e.frequency);
    }
}

TEST(FrequencyTableTest, SampleIsDeterministicAndCoversAllOutcomes) {
    Table t;
    t.add('a');
    t.add('b');
    t.add('b');
    t.add('c');

    // walking x across [0,1) in steps of 1/total visits each rank frequency times
    std::vector<std::optional<char>> seen;
    for (int i = 0; i < 4; ++i) {
        seen.push_back(t.sample(i / 4.0));
        EXPECT_EQ(t.sample(i / 4.0), seen.back());
    }
    EXPECT_EQ(seen, (std::vector<std::optional<char>>{'b', 'b', 'a', 'c'}));
}
