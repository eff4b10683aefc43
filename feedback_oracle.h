/*
 * FILE: feedback_oracle.h
 *
 * WHAT:
 * Defines the interface of the Feedback Oracle: the rules that turn a
 * (secret, guess) pair into a Bulls & Cows hint.
 *
 * WHY:
 * This is the "Referee" component. It knows nothing about candidates,
 * entropy or strategy. The console uses it to score real guesses and the
 * engine uses it to simulate hypothetical ones.
 */

#pragma once
#ifndef FEEDBACK_ORACLE_H
#define FEEDBACK_ORACLE_H
#include "bulls_cows_types.h"

/*
 * FUNCTION: evaluate_feedback
 *
 * WHAT:
 * Computes the hint for `p_guess` against `p_secret`.
 * - Bulls: positions where the digits match.
 * - Cows: digits present in both numbers, minus the bulls.
 *
 * RETURNS:
 * - ENGINE_OK with *p_feedback filled in.
 * - ENGINE_ERR_INVALID_NUMBER if either number is not 4 distinct digits.
 */
engine_status_t evaluate_feedback(const number_t* p_secret, const number_t* p_guess, feedback_t* p_feedback);

/*
 * FUNCTION: compute_feedback_index
 *
 * WHAT:
 * Unchecked fast path of evaluate_feedback. Returns the hint encoded as
 * bulls * 5 + cows, an integer in [0, FEEDBACK_BUCKETS).
 *
 * WHY:
 * The entropy loops call this millions of times per suggestion. Both
 * numbers must already be valid (they come from the universe or from a
 * guess that passed evaluate_feedback / number_is_valid).
 */
int compute_feedback_index(const number_t* p_secret, const number_t* p_guess);

/*
 * FUNCTION: feedback_to_index
 *
 * WHAT:
 * Encodes a hint the same way compute_feedback_index does. Returns -1 for
 * a hint that is out of range (negative, or bulls + cows > 4).
 */
int feedback_to_index(const feedback_t* p_feedback);

bool feedbacks_equal(const feedback_t* p_a, const feedback_t* p_b);

/*
 * FUNCTION: feedback_is_solved
 *
 * WHAT:
 * true when every digit is a bull, i.e. the guess was the secret.
 */
bool feedback_is_solved(const feedback_t* p_feedback);

#endif
