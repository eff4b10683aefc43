#include "feedback_oracle.h"
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

static feedback_t score(const char* secret, const char* guess)
{
    number_t s = N(secret);
    number_t g = N(guess);
    feedback_t f = { -1, -1 };
    EXPECT_EQ(ENGINE_OK, evaluate_feedback(&s, &g, &f));
    return f;
}

TEST(FeedbackOracle, CountsBullsAndCows)
{
    feedback_t f = score("1234", "1234");
    EXPECT_EQ(4, f.bulls);
    EXPECT_EQ(0, f.cows);
    EXPECT_TRUE(feedback_is_solved(&f));

    f = score("1234", "4321");
    EXPECT_EQ(0, f.bulls);
    EXPECT_EQ(4, f.cows);

    f = score("1234", "5678");
    EXPECT_EQ(0, f.bulls);
    EXPECT_EQ(0, f.cows);

    f = score("1234", "1243");
    EXPECT_EQ(2, f.bulls);
    EXPECT_EQ(2, f.cows);

    f = score("0123", "0145");
    EXPECT_EQ(2, f.bulls);
    EXPECT_EQ(0, f.cows);

    f = score("9876", "6789");
    EXPECT_EQ(0, f.bulls);
    EXPECT_EQ(4, f.cows);
    EXPECT_FALSE(feedback_is_solved(&f));
}

TEST(FeedbackOracle, HoldsOverEveryPairOfNumbers)
{
    number_t* p_universe = NULL;
    int count = 0;
    ASSERT_TRUE(build_number_universe(&p_universe, &count));

    int self_not_solved = 0;
    int over_four = 0;
    int asymmetric = 0;
    int false_solved = 0;
    int index_mismatch = 0;

    for (int a = 0; a < count; ++a)
    {
        feedback_t self;
        ASSERT_EQ(ENGINE_OK, evaluate_feedback(&p_universe[a], &p_universe[a], &self));
        if (self.bulls != NUMBER_LENGTH || self.cows != 0) self_not_solved++;

        for (int b = a + 1; b < count; ++b)
        {
            feedback_t ab;
            feedback_t ba;
            if (evaluate_feedback(&p_universe[a], &p_universe[b], &ab) != ENGINE_OK ||
                evaluate_feedback(&p_universe[b], &p_universe[a], &ba) != ENGINE_OK)
            {
                FAIL() << p_universe[a].digits << " / " << p_universe[b].digits;
            }

            if (ab.bulls + ab.cows > NUMBER_LENGTH || ab.bulls < 0 || ab.cows < 0) over_four++;
            if (ab.bulls != ba.bulls || ab.cows != ba.cows) asymmetric++;
            if (feedback_is_solved(&ab)) false_solved++;
            if (feedback_to_index(&ab) != compute_feedback_index(&p_universe[a], &p_universe[b])) index_mismatch++;
        }
    }

    EXPECT_EQ(0, self_not_solved);
    EXPECT_EQ(0, over_four);
    EXPECT_EQ(0, asymmetric);
    EXPECT_EQ(0, false_solved);
    EXPECT_EQ(0, index_mismatch);
    free(p_universe);
}

TEST(FeedbackOracle, IndexMatchesEvaluatedFeedback)
{
    number_t s = N("4961");
    number_t g = N("1964");
    feedback_t f;
    ASSERT_EQ(ENGINE_OK, evaluate_feedback(&s, &g, &f));
    EXPECT_EQ(2, f.bulls);
    EXPECT_EQ(2, f.cows);
    EXPECT_EQ(feedback_to_index(&f), compute_feedback_index(&s, &g));
    EXPECT_EQ(2 * (NUMBER_LENGTH + 1) + 2, feedback_to_index(&f));
}

TEST(FeedbackOracle, RejectsOutOfRangeFeedbackIndex)
{
    feedback_t too_many = { 3, 2 };
    feedback_t negative = { -1, 0 };
    feedback_t solved = { 4, 0 };
    EXPECT_EQ(-1, feedback_to_index(&too_many));
    EXPECT_EQ(-1, feedback_to_index(&negative));
    EXPECT_EQ(FEEDBACK_BUCKETS - (NUMBER_LENGTH + 1), feedback_to_index(&solved));
}

TEST(FeedbackOracle, RejectsMalformedNumbers)
{
    number_t good = N("1234");
    number_t bad;
    memcpy(bad.digits, "1123", 5);
    bad.digit_mask = (1 << 1) | (1 << 2) | (1 << 3);

    feedback_t f;
    EXPECT_EQ(ENGINE_ERR_INVALID_NUMBER, evaluate_feedback(&good, &bad, &f));
    EXPECT_EQ(ENGINE_ERR_INVALID_NUMBER, evaluate_feedback(&bad, &good, &f));
}

TEST(FeedbackOracle, ComparesFeedback)
{
    feedback_t a = { 1, 2 };
    feedback_t b = { 1, 2 };
    feedback_t c = { 2, 1 };
    EXPECT_TRUE(feedbacks_equal(&a, &b));
    EXPECT_FALSE(feedbacks_equal(&a, &c));
}
