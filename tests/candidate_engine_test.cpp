#include "candidate_engine.h"
#include "feedback_oracle.h"
#include "number_codec.h"
#include <gtest/gtest.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

static number_t N(const char* text)
{
    number_t n;
    memset(&n, 0, sizeof(n));
    EXPECT_TRUE(number_from_string(text, &n)) << text;
    return n;
}

static feedback_t F(int bulls, int cows)
{
    feedback_t f = { bulls, cows };
    return f;
}

class CandidateEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(candidate_engine_init(&engine));
        ASSERT_TRUE(build_number_universe(&p_universe, &universe_count));
    }

    void TearDown() override
    {
        candidate_engine_free(&engine);
        free(p_universe);
    }

    void prune(const char* guess, int bulls, int cows)
    {
        number_t g = N(guess);
        feedback_t f = F(bulls, cows);
        ASSERT_EQ(ENGINE_OK, candidate_engine_prune(&engine, &g, &f));
    }

    candidate_engine_t engine;
    number_t* p_universe = NULL;
    int universe_count = 0;
};

TEST_F(CandidateEngineTest, StartsWithTheWholeUniverse)
{
    EXPECT_EQ(UNIVERSE_SIZE, candidate_engine_count(&engine));

    double bits = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_uncertainty(&engine, &bits));
    EXPECT_NEAR(12.29920801838728, bits, 1e-9);
}

TEST_F(CandidateEngineTest, PruneKeepsOnlyConsistentSecrets)
{
    prune("5678", 0, 0);
    ASSERT_EQ(360, candidate_engine_count(&engine));

    number_t guess = N("5678");
    const number_t* p_cands = candidate_engine_candidates(&engine);
    for (int i = 0; i < candidate_engine_count(&engine); ++i)
    {
        feedback_t f;
        ASSERT_EQ(ENGINE_OK, evaluate_feedback(&p_cands[i], &guess, &f));
        EXPECT_EQ(0, f.bulls);
        EXPECT_EQ(0, f.cows);
    }

    number_t secret = N("1234");
    EXPECT_TRUE(candidate_engine_contains(&engine, &secret));
    EXPECT_FALSE(candidate_engine_contains(&engine, &guess));

    double bits = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_uncertainty(&engine, &bits));
    EXPECT_NEAR(log2(360.0), bits, 1e-12);
}

TEST_F(CandidateEngineTest, PrunePreservesAscendingOrder)
{
    prune("0123", 0, 3);
    ASSERT_EQ(264, candidate_engine_count(&engine));

    const number_t* p_cands = candidate_engine_candidates(&engine);
    EXPECT_STREQ("1034", p_cands[0].digits);
    for (int i = 1; i < candidate_engine_count(&engine); ++i)
    {
        ASSERT_LT(number_to_code(&p_cands[i - 1]), number_to_code(&p_cands[i]));
    }
}

TEST_F(CandidateEngineTest, RepeatingTheSamePruneChangesNothing)
{
    prune("0123", 0, 3);
    prune("0123", 0, 3);
    EXPECT_EQ(264, candidate_engine_count(&engine));
}

TEST_F(CandidateEngineTest, SolvedFeedbackLeavesOnlyTheGuess)
{
    prune("1234", 4, 0);
    ASSERT_EQ(1, candidate_engine_count(&engine));
    EXPECT_STREQ("1234", candidate_engine_candidates(&engine)[0].digits);

    double bits = -1.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_uncertainty(&engine, &bits));
    EXPECT_DOUBLE_EQ(0.0, bits);
}

TEST_F(CandidateEngineTest, ContradictoryFeedbackEmptiesTheSet)
{
    // Three bulls and one cow is impossible with four distinct digits.
    prune("1234", 3, 1);
    EXPECT_EQ(0, candidate_engine_count(&engine));

    double bits = 0.0;
    EXPECT_EQ(ENGINE_ERR_EMPTY_CANDIDATE_SET, candidate_engine_uncertainty(&engine, &bits));

    number_t best;
    EXPECT_EQ(ENGINE_ERR_EMPTY_CANDIDATE_SET,
        candidate_engine_suggest_best_guess(&engine, p_universe, universe_count, &best, NULL));

    number_t guess = N("5678");
    double gain = -1.0;
    EXPECT_EQ(ENGINE_ERR_EMPTY_CANDIDATE_SET, candidate_engine_expected_information_gain(&engine, &guess, &gain));
}

TEST_F(CandidateEngineTest, OutOfRangeFeedbackEmptiesTheSet)
{
    number_t g = N("1234");
    feedback_t f = F(3, 2);
    EXPECT_EQ(ENGINE_OK, candidate_engine_prune(&engine, &g, &f));
    EXPECT_EQ(0, candidate_engine_count(&engine));
}

TEST_F(CandidateEngineTest, MalformedGuessLeavesTheSetUntouched)
{
    number_t bad;
    memcpy(bad.digits, "1123", 5);
    bad.digit_mask = (1 << 1) | (1 << 2) | (1 << 3);
    feedback_t f = F(0, 0);

    EXPECT_EQ(ENGINE_ERR_INVALID_NUMBER, candidate_engine_prune(&engine, &bad, &f));
    EXPECT_EQ(UNIVERSE_SIZE, candidate_engine_count(&engine));

    double gain = 0.0;
    EXPECT_EQ(ENGINE_ERR_INVALID_NUMBER, candidate_engine_expected_information_gain(&engine, &bad, &gain));
}

TEST_F(CandidateEngineTest, InformationGainOfTheOpener)
{
    number_t guess = N("0123");
    double gain = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_expected_information_gain(&engine, &guess, &gain));
    EXPECT_NEAR(2.77115216575502, gain, 1e-9);
}

TEST_F(CandidateEngineTest, PerfectSplitOfTwoCandidatesIsOneBit)
{
    prune("0123", 3, 0);
    ASSERT_EQ(24, candidate_engine_count(&engine));
    prune("0145", 3, 0);
    ASSERT_EQ(2, candidate_engine_count(&engine));

    number_t a = N("0125");
    number_t b = N("0143");
    EXPECT_TRUE(candidate_engine_contains(&engine, &a));
    EXPECT_TRUE(candidate_engine_contains(&engine, &b));

    double gain = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_expected_information_gain(&engine, &a, &gain));
    EXPECT_DOUBLE_EQ(1.0, gain);
}

TEST_F(CandidateEngineTest, SingleCandidateHasZeroGain)
{
    prune("1234", 4, 0);
    number_t guess = N("5678");
    double gain = -1.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_expected_information_gain(&engine, &guess, &gain));
    EXPECT_DOUBLE_EQ(0.0, gain);
}

TEST_F(CandidateEngineTest, SuggestOnFreshEngineReturnsFirstOfTiedOpeners)
{
    number_t best;
    double best_entropy = 0.0;
    ASSERT_EQ(ENGINE_OK,
        candidate_engine_suggest_best_guess(&engine, p_universe, universe_count, &best, &best_entropy));
    EXPECT_STREQ("0123", best.digits);
    EXPECT_NEAR(2.77115216575502, best_entropy, 1e-9);
}

TEST_F(CandidateEngineTest, SuggestBreaksTiesByPoolOrder)
{
    number_t pool[2] = { N("5678"), N("0123") };
    number_t best;
    ASSERT_EQ(ENGINE_OK, candidate_engine_suggest_best_guess(&engine, pool, 2, &best, NULL));
    EXPECT_STREQ("5678", best.digits);
}

TEST_F(CandidateEngineTest, SuggestMaximisesGainOverThePool)
{
    prune("0123", 0, 3);

    number_t best;
    double best_entropy = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_suggest_best_guess(&engine,
        candidate_engine_candidates(&engine), candidate_engine_count(&engine), &best, &best_entropy));
    EXPECT_NEAR(2.7266276289439566, best_entropy, 1e-9);
    EXPECT_TRUE(candidate_engine_contains(&engine, &best));

    ASSERT_EQ(ENGINE_OK,
        candidate_engine_suggest_best_guess(&engine, p_universe, universe_count, &best, &best_entropy));
    EXPECT_NEAR(2.7802047045625553, best_entropy, 1e-9);

    double check = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_expected_information_gain(&engine, &best, &check));
    EXPECT_DOUBLE_EQ(best_entropy, check);
}

TEST_F(CandidateEngineTest, GainIsBoundedByTheRemainingUncertainty)
{
    prune("0123", 1, 0);
    prune("2734", 0, 3);
    ASSERT_EQ(28, candidate_engine_count(&engine));

    double bits = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_uncertainty(&engine, &bits));
    EXPECT_NEAR(log2(28.0), bits, 1e-12);

    for (int i = 0; i < universe_count; ++i)
    {
        double gain = -1.0;
        ASSERT_EQ(ENGINE_OK, candidate_engine_expected_information_gain(&engine, &p_universe[i], &gain));
        ASSERT_GE(gain, 0.0) << p_universe[i].digits;
        ASSERT_LE(gain, bits + 1e-12) << p_universe[i].digits;
    }
}

TEST_F(CandidateEngineTest, EqualPartitionsTieToTheFirstPoolMember)
{
    // Secret 7453: 7435 and 7453 split the 28 survivors into the same group
    // sizes under different hints.
    prune("0123", 1, 0);
    prune("2734", 0, 3);
    ASSERT_EQ(28, candidate_engine_count(&engine));

    number_t early = N("7435");
    number_t late = N("7453");
    double early_gain = 0.0;
    double late_gain = 0.0;
    ASSERT_EQ(ENGINE_OK, candidate_engine_expected_information_gain(&engine, &early, &early_gain));
    ASSERT_EQ(ENGINE_OK, candidate_engine_expected_information_gain(&engine, &late, &late_gain));
    EXPECT_EQ(early_gain, late_gain);

    number_t best;
    double best_entropy = 0.0;
    ASSERT_EQ(ENGINE_OK,
        candidate_engine_suggest_best_guess(&engine, p_universe, universe_count, &best, &best_entropy));
    EXPECT_STREQ("7435", best.digits);
    EXPECT_EQ(early_gain, best_entropy);

    number_t reversed[2] = { late, early };
    ASSERT_EQ(ENGINE_OK, candidate_engine_suggest_best_guess(&engine, reversed, 2, &best, NULL));
    EXPECT_STREQ("7453", best.digits);
}

TEST_F(CandidateEngineTest, SuggestRejectsBadPools)
{
    number_t best;
    EXPECT_EQ(ENGINE_ERR_EMPTY_POOL, candidate_engine_suggest_best_guess(&engine, p_universe, 0, &best, NULL));

    number_t pool[2] = { N("0123"), N("4567") };
    pool[1].digits[1] = '4';
    EXPECT_EQ(ENGINE_ERR_INVALID_NUMBER, candidate_engine_suggest_best_guess(&engine, pool, 2, &best, NULL));
}

TEST(EngineStatus, EveryStatusHasAName)
{
    EXPECT_STREQ("OK", engine_status_to_string(ENGINE_OK));
    EXPECT_STRNE("", engine_status_to_string(ENGINE_ERR_INVALID_NUMBER));
    EXPECT_STRNE("", engine_status_to_string(ENGINE_ERR_EMPTY_CANDIDATE_SET));
    EXPECT_STRNE("", engine_status_to_string(ENGINE_ERR_EMPTY_POOL));
    EXPECT_STRNE("", engine_status_to_string(ENGINE_ERR_OUT_OF_MEMORY));
}
