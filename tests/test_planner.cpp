/**
 * @file test_planner.cpp
 * @brief Unit tests for greedy point placement
 */

#include <gtest/gtest.h>
#include "nego_planner.hpp"
#include "nego_errors.hpp"
#include "nego_test_suites.hpp"
#include <algorithm>
#include <string>

using namespace nego;
using nego::testing_support::scripted;
using nego::testing_support::RecordingObserver;

class PlannerTest : public ::testing::Test {
protected:
    SuitePtr standard(const std::string& name) {
        SuitePtr s = reg.find(name);
        EXPECT_NE(s, nullptr) << name;
        return s;
    }

    std::vector<SuiteLevel> all_standard(int levels) {
        std::vector<SuiteLevel> out;
        for (const auto& s : reg.all()) out.push_back({s, levels});
        return out;
    }

    static void expect_disjoint(const LayoutPlan& plan) {
        for (size_t i = 0; i < plan.placements.size(); ++i) {
            for (size_t j = i + 1; j < plan.placements.size(); ++j) {
                const auto& a = plan.placements[i];
                const auto& b = plan.placements[j];
                EXPECT_TRUE(a.end() <= b.offset || b.end() <= a.offset)
                    << a.suite->name() << " overlaps " << b.suite->name();
            }
        }
    }

    static size_t max_end(const LayoutPlan& plan) {
        size_t m = 0;
        for (const auto& p : plan.placements) m = std::max(m, p.end());
        return m;
    }

    SuiteRegistry reg = SuiteRegistry::with_standard_suites();
    ReservationIndex index;
    RecordingObserver observer;
};

// ---- Base cases ----

TEST_F(PlannerTest, SingleSuiteSingleLevel) {
    PlacementPlanner planner(index, observer);
    auto plan = planner.plan({{standard("x25519-elligator2-chacha20"), 1}});

    ASSERT_EQ(plan.placements.size(), 1u);
    EXPECT_EQ(plan.placements[0].level, 0);
    EXPECT_EQ(plan.placements[0].offset, 0u);
    EXPECT_EQ(plan.header_length, 32u);
    EXPECT_EQ(index.live_count(), 1u);
}

TEST_F(PlannerTest, SingleSuiteSettlesOnLevelZero) {
    PlacementPlanner planner(index, observer);
    auto plan = planner.plan({{standard("x448-elligator2-shake256"), 6}});

    ASSERT_EQ(plan.placements.size(), 1u);
    EXPECT_EQ(plan.placements[0].level, 0);
    EXPECT_EQ(plan.header_length, 56u);
    EXPECT_EQ(index.live_count(), 1u);
}

TEST_F(PlannerTest, EmptyInputIsContractViolation) {
    PlacementPlanner planner(index);
    EXPECT_THROW(planner.plan({}), ContractViolation);
}

TEST_F(PlannerTest, DuplicateOrNullSuiteIsContractViolation) {
    PlacementPlanner planner(index);
    auto s = standard("x25519-elligator2-chacha20");

    EXPECT_THROW(planner.plan({{s, 2}, {s, 3}}), ContractViolation);
    EXPECT_THROW(planner.plan({{nullptr, 2}}), ContractViolation);
    EXPECT_THROW(planner.plan({{s, 0}}), ContractViolation);
    EXPECT_TRUE(index.empty());
}

// ---- Collision forcing ----

TEST_F(PlannerTest, CollisionPushesSecondSuiteUp) {
    // alpha: level 1 slot 1 -> [64,96), max 96
    // beta:  level 1 slot 1 -> [64,96) again, level 2 slot 0 -> [96,128), max 128
    auto alpha = scripted("alpha", 32, {0, 1});
    auto beta = scripted("beta", 32, {0, 1, 0});

    PlacementPlanner planner(index, observer);
    auto plan = planner.plan({{beta, 3}, {alpha, 2}});

    ASSERT_EQ(plan.placements.size(), 2u);
    EXPECT_EQ(plan.placements[0].suite->name(), "alpha");
    EXPECT_EQ(plan.placements[0].level, 0);
    EXPECT_EQ(plan.placements[0].offset, 0u);

    // alpha still holds [64,96) while beta probes, so beta stops at level 2
    EXPECT_EQ(plan.placements[1].suite->name(), "beta");
    EXPECT_EQ(plan.placements[1].level, 2);
    EXPECT_EQ(plan.placements[1].offset, 96u);
    EXPECT_EQ(plan.header_length, 128u);

    EXPECT_EQ(index.live_count(), 2u);
    expect_disjoint(plan);
}

TEST_F(PlannerTest, CollisionAtLastResortFails) {
    // Same worst-case extent; name order puts alpha first and beta's
    // only top-level slot is the one alpha already holds.
    auto alpha = scripted("alpha", 32, {0, 1});
    auto beta = scripted("beta", 32, {0, 1});

    PlacementPlanner planner(index, observer);
    try {
        planner.plan({{beta, 2}, {alpha, 2}});
        FAIL() << "expected PlacementExhausted";
    } catch (const PlacementExhausted& e) {
        EXPECT_EQ(e.suite(), "beta");
        EXPECT_NE(std::string(e.what()).find("beta"), std::string::npos);
    }

    ASSERT_EQ(observer.failed.size(), 1u);
    EXPECT_EQ(observer.failed[0], "beta");
    // alpha's reservations were rolled back too
    EXPECT_TRUE(index.empty());
}

TEST_F(PlannerTest, FailureLeavesPriorReservationsIntact) {
    ReservationNode foreign;
    foreign.suite = "foreign";
    foreign.range = ByteRange{0, 1000};
    auto kept = index.insert(foreign);
    ASSERT_TRUE(kept);

    PlacementPlanner planner(index, observer);
    EXPECT_THROW(planner.plan({{standard("x25519-elligator2-chacha20"), 3}}),
                 PlacementExhausted);

    EXPECT_EQ(index.live_count(), 1u);
    EXPECT_TRUE(index.is_live(*kept));
}

TEST_F(PlannerTest, LevelZeroFirstWriterWins) {
    auto a = scripted("a", 16, {0, 0});
    auto b = scripted("b", 16, {0, 1, 3});

    PlacementPlanner planner(index, observer);
    auto plan = planner.plan({{a, 2}, {b, 3}});

    ASSERT_NE(plan.find("a"), nullptr);
    ASSERT_NE(plan.find("b"), nullptr);
    EXPECT_EQ(plan.find("a")->level, 0);
    EXPECT_EQ(plan.find("a")->offset, 0u);
    // b's level 1 slot [32,48) is free; its level 0 is taken by a
    EXPECT_EQ(plan.find("b")->level, 1);
    EXPECT_EQ(plan.find("b")->offset, 32u);
    EXPECT_EQ(plan.header_length, 48u);
}

TEST_F(PlannerTest, WalkStopsAtFirstBlockedLevel) {
    // first: levels 0..1 at [0,8) and [8,16)
    // second: level 2 slot 3 -> [48,56) free, level 1 slot 0 -> [8,16) blocked,
    // level 0 would be blocked too but is never tried
    auto first = scripted("first", 8, {0, 0});
    auto second = scripted("second", 8, {0, 0, 3});

    PlacementPlanner planner(index, observer);
    auto plan = planner.plan({{first, 2}, {second, 3}});

    EXPECT_EQ(plan.find("second")->level, 2);
    int second_attempts = 0;
    for (const auto& a : observer.attempts) {
        if (a.suite == "second") ++second_attempts;
    }
    EXPECT_EQ(second_attempts, 2);
}

// ---- Ordering ----

TEST_F(PlannerTest, AscendingMaxOrder) {
    auto wide = scripted("wide", 64, {0, 1, 3});      // max 7*64 = 448
    auto mid = scripted("mid", 32, {0, 1, 3});        // max 224
    auto narrow = scripted("narrow", 16, {0, 0});     // max 32

    PlacementPlanner planner(index, observer);
    auto plan = planner.plan({{wide, 3}, {mid, 3}, {narrow, 2}});

    std::vector<std::string> expected = {"narrow", "mid", "wide"};
    EXPECT_EQ(observer.order, expected);
    ASSERT_EQ(plan.placements.size(), 3u);
    EXPECT_EQ(plan.placements[0].suite->name(), "narrow");
    EXPECT_EQ(plan.placements[0].offset, 0u);

    // Attempts of a suite all precede the next suite's
    ASSERT_FALSE(observer.attempts.empty());
    EXPECT_EQ(observer.attempts.front().suite, "narrow");
    EXPECT_EQ(observer.attempts.back().suite, "wide");
}

TEST_F(PlannerTest, DeriveAllSortsByMaxThenName) {
    PlacementPlanner planner(index);
    auto sorted = planner.derive_all(all_standard(5));

    ASSERT_EQ(sorted.size(), 5u);
    for (size_t i = 1; i < sorted.size(); ++i) {
        EXPECT_TRUE(sorted[i - 1].max < sorted[i].max ||
                    (sorted[i - 1].max == sorted[i].max &&
                     sorted[i - 1].suite->name() < sorted[i].suite->name()));
    }
    EXPECT_EQ(sorted.front().suite->name(), "ristretto255-blake2b");
}

// ---- Standard suites, known layouts ----

TEST_F(PlannerTest, StandardSuitesFourLevels) {
    PlacementPlanner planner(index, observer);
    auto plan = planner.plan(all_standard(4));

    EXPECT_EQ(plan.header_length, 832u);
    ASSERT_EQ(plan.placements.size(), 5u);

    struct Want { const char* name; int level; size_t offset; };
    const Want want[] = {
        {"x25519-elligator2-chacha20", 0, 0},
        {"ristretto255-blake2b",       1, 64},
        {"ed25519-elligator2-sha512",  2, 96},
        {"x448-elligator2-shake256",   3, 672},
        {"secp256k1-ellswift-sha256",  3, 768},
    };
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(plan.placements[i].suite->name(), want[i].name);
        EXPECT_EQ(plan.placements[i].level, want[i].level) << want[i].name;
        EXPECT_EQ(plan.placements[i].offset, want[i].offset) << want[i].name;
    }
    expect_disjoint(plan);
}

TEST_F(PlannerTest, StandardSuitesFiveLevels) {
    PlacementPlanner planner(index, observer);
    auto plan = planner.plan(all_standard(5));

    EXPECT_EQ(plan.header_length, 832u);
    EXPECT_EQ(plan.find("ristretto255-blake2b")->offset, 0u);
    EXPECT_EQ(plan.find("x25519-elligator2-chacha20")->level, 1);
    EXPECT_EQ(plan.find("x25519-elligator2-chacha20")->offset, 32u);
}

TEST_F(PlannerTest, StandardSuitesTooFewLevelsFail) {
    PlacementPlanner planner(index, observer);
    EXPECT_THROW(planner.plan(all_standard(1)), PlacementExhausted);
    EXPECT_TRUE(index.empty());
}

// ---- Properties over many synthetic suites ----

TEST_F(PlannerTest, PropertiesHoldOverManyLayouts) {
    int successes = 0;
    for (int trial = 0; trial < 40; ++trial) {
        std::vector<SuiteLevel> suites;
        for (int k = 0; k < 3; ++k) {
            size_t plen = 32 + 16 * static_cast<size_t>((trial + k) % 3);
            auto s = std::make_shared<StandardSuite>(
                "trial" + std::to_string(trial) + "-suite" + std::to_string(k),
                plen, k % 2 ? SeedHash::SHA256 : SeedHash::BLAKE2B_256);
            suites.push_back({s, 6});
        }

        ReservationIndex idx;
        PlacementPlanner planner(idx);
        LayoutPlan plan;
        try {
            plan = planner.plan(suites);
        } catch (const PlacementExhausted&) {
            EXPECT_TRUE(idx.empty());
            continue;
        }
        ++successes;

        expect_disjoint(plan);
        EXPECT_EQ(plan.header_length, max_end(plan));
        EXPECT_EQ(idx.live_count(), suites.size());
        EXPECT_EQ(idx.extent(), plan.header_length);

        for (const auto& p : plan.placements) {
            auto sp = derive_positions(p.suite, 6);
            EXPECT_EQ(p.offset, sp.offsets[p.level]);
            EXPECT_EQ(p.tag, sp.tags[p.level]);
            EXPECT_TRUE(idx.is_live(p.node));
        }

        // Deterministic: a second run gives the same layout
        ReservationIndex idx2;
        PlacementPlanner again(idx2);
        auto plan2 = again.plan(suites);
        ASSERT_EQ(plan2.placements.size(), plan.placements.size());
        for (size_t i = 0; i < plan.placements.size(); ++i) {
            EXPECT_EQ(plan2.placements[i].offset, plan.placements[i].offset);
            EXPECT_EQ(plan2.placements[i].level, plan.placements[i].level);
        }
    }
    EXPECT_GT(successes, 0);
}

TEST_F(PlannerTest, ParallelDerivationMatchesSequential) {
    ReservationIndex seq_index;
    PlacementPlanner seq(seq_index);
    auto expected = seq.plan(all_standard(6));

    PlannerOptions opts;
    opts.derive_workers = 4;
    PlacementPlanner par(index, null_observer(), opts);
    auto got = par.plan(all_standard(6));

    EXPECT_EQ(got.header_length, expected.header_length);
    ASSERT_EQ(got.placements.size(), expected.placements.size());
    for (size_t i = 0; i < got.placements.size(); ++i) {
        EXPECT_EQ(got.placements[i].suite->name(), expected.placements[i].suite->name());
        EXPECT_EQ(got.placements[i].offset, expected.placements[i].offset);
    }
}

TEST_F(PlannerTest, ObserverSeesBothDumps) {
    PlacementPlanner planner(index, observer);
    auto plan = planner.plan(all_standard(4));

    ASSERT_EQ(observer.dumps.size(), 2u);
    EXPECT_EQ(observer.dumps[0].first, "intermediate");
    EXPECT_GE(observer.dumps[0].second, observer.dumps[1].second);
    EXPECT_EQ(observer.dumps[1].first, "ciphersuite");
    EXPECT_EQ(observer.dumps[1].second, 5u);
    EXPECT_EQ(observer.header_length, plan.header_length);
}
