/*
 * FILE: feedback_oracle.cpp
 *
 * WHAT:
 * Implements the Bulls & Cows scoring rules.
 *
 * KEY OPTIMIZATION:
 * Digits are unique inside a number, so the number of shared digits is the
 * popcount of the two digit masks ANDed together. Cows are then just the
 * shared count minus the bulls, with no per-digit bookkeeping.
 */

#include "feedback_oracle.h"
#include "number_codec.h"

/*
 * FUNCTION: count_bits
 *
 * WHAT:
 * Population count of a 10-bit digit mask (Kernighan's loop: one iteration
 * per set bit, at most 4 here).
 */
static int count_bits(unsigned int mask)
{
    int count = 0;
    while (mask != 0)
    {
        mask &= mask - 1;
        count++;
    }
    return count;
}

static int count_bulls(const number_t* p_secret, const number_t* p_guess)
{
    int bulls = 0;
    for (int i = 0; i < NUMBER_LENGTH; i++)
    {
        if (p_secret->digits[i] == p_guess->digits[i]) bulls++;
    }
    return bulls;
}

engine_status_t evaluate_feedback(const number_t* p_secret, const number_t* p_guess, feedback_t* p_feedback)
{
    if (!number_is_valid(p_secret) || !number_is_valid(p_guess)) return ENGINE_ERR_INVALID_NUMBER;

    int bulls = count_bulls(p_secret, p_guess);
    int shared = count_bits((unsigned int)(p_secret->digit_mask & p_guess->digit_mask));

    p_feedback->bulls = bulls;
    p_feedback->cows = shared - bulls;
    return ENGINE_OK;
}

int compute_feedback_index(const number_t* p_secret, const number_t* p_guess)
{
    int bulls = count_bulls(p_secret, p_guess);
    int shared = count_bits((unsigned int)(p_secret->digit_mask & p_guess->digit_mask));
    return bulls * (NUMBER_LENGTH + 1) + (shared - bulls);
}

int feedback_to_index(const feedback_t* p_feedback)
{
    if (p_feedback->bulls < 0 || p_feedback->cows < 0) return -1;
    if (p_feedback->bulls + p_feedback->cows > NUMBER_LENGTH) return -1;
    return p_feedback->bulls * (NUMBER_LENGTH + 1) + p_feedback->cows;
}

bool feedbacks_equal(const feedback_t* p_a, const feedback_t* p_b)
{
    return p_a->bulls == p_b->bulls && p_a->cows == p_b->cows;
}

bool feedback_is_solved(const feedback_t* p_feedback)
{
    return p_feedback->bulls == NUMBER_LENGTH;
}
