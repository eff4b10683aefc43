#include "monte_carlo.h"
#include "number_codec.h"
#include <gtest/gtest.h>
#include <string.h>

static number_t N(const char* text)
{
    number_t n;
    memset(&n, 0, sizeof(n));
    EXPECT_TRUE(number_from_string(text, &n)) << text;
    return n;
}

class MonteCarloTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(build_number_universe(&p_universe, &universe_count)); }
    void TearDown() override { free(p_universe); }

    static int distribution_total(const SimStats& stats)
    {
        int total = 0;
        for (int i = 1; i <= MAX_SIM_GUESSES; ++i) total += stats.guess_distribution[i];
        return total;
    }

    number_t* p_universe = NULL;
    int universe_count = 0;
};

TEST_F(MonteCarloTest, BaselineSolvesEverySecret)
{
    GuessStrategyConfig baseline = { "First Candidate", GUESS_POOL_FIRST_CANDIDATE, NULL, 0 };
    SimStats stats = run_guess_strategy(&baseline, p_universe, universe_count, p_universe, universe_count);

    EXPECT_STREQ("First Candidate", stats.strategy_name);
    EXPECT_STREQ("0123", stats.opener);
    EXPECT_EQ(UNIVERSE_SIZE, stats.wins);
    EXPECT_EQ(0, stats.losses);
    EXPECT_EQ(28024, stats.total_guesses);
    EXPECT_EQ(9, stats.worst_game);
    EXPECT_NEAR(5.56031746031746, stats.average_guesses, 1e-9);
    EXPECT_DOUBLE_EQ(100.0, stats.win_percent);
    EXPECT_EQ(stats.wins, distribution_total(stats));
    EXPECT_EQ(1, stats.guess_distribution[1]);
}

TEST_F(MonteCarloTest, DefaultStrategyWinsSampledGames)
{
    number_t secrets[6] = { N("0123"), N("0124"), N("0284"), N("4961"), N("9876"), N("1234") };
    SimStats stats = run_guess_strategy(&ALL_STRATEGIES[DEFAULT_STRATEGY_INDEX], secrets, 6, p_universe, universe_count);

    EXPECT_EQ(6, stats.wins);
    EXPECT_EQ(0, stats.losses);
    EXPECT_EQ(1, stats.guess_distribution[1]);
    EXPECT_EQ(stats.wins, distribution_total(stats));
    EXPECT_LE(stats.worst_game, MAX_SIM_GUESSES);
}

TEST_F(MonteCarloTest, BrokenOpenerCountsEveryGameAsLost)
{
    GuessStrategyConfig broken = { "Broken", GUESS_POOL_CANDIDATES, "0000", 0 };
    number_t secrets[2] = { N("0123"), N("4567") };
    SimStats stats = run_guess_strategy(&broken, secrets, 2, p_universe, universe_count);

    EXPECT_EQ(0, stats.wins);
    EXPECT_EQ(2, stats.losses);
    EXPECT_DOUBLE_EQ(0.0, stats.average_guesses);
}
