/*
 * FILE: entropy_calculator.h
 *
 * WHAT:
 * Defines the interface for the mathematical engine of the solver.
 * This module handles the Information Theory calculations: the uncertainty
 * of a candidate set and the Shannon Entropy of the partition a guess
 * induces on it.
 *
 * WHY:
 * This is the "Calculator" component. It doesn't know about strategy or
 * game state; it simply crunches numbers over arrays it is handed. The
 * Candidate Engine owns the arrays and decides when to call it.
 */

#pragma once
#ifndef ENTROPY_CALCULATOR_H
#define ENTROPY_CALCULATOR_H
#include "bulls_cows_types.h"

/*
 * FUNCTION: calculate_state_uncertainty
 *
 * WHAT:
 * log2(candidate_count): the bits still needed to pin down the secret when
 * every remaining candidate is equally likely. candidate_count must be > 0.
 */
double calculate_state_uncertainty(int candidate_count);

/*
 * FUNCTION: calculate_guess_entropy
 *
 * WHAT:
 * Plays `p_guess` against every candidate, groups the candidates by the
 * hint they would produce, and returns H = -Sum( p * log2(p) ) over the
 * groups.
 *
 * WHY:
 * H is the expected number of bits the guess reveals. It is 0 when every
 * candidate gives the same hint and log2(candidate_count) when every
 * candidate lands in its own group.
 */
double calculate_guess_entropy(const number_t* p_guess, const number_t* p_candidates, int candidate_count);

/*
 * FUNCTION: calculate_entropy_for_pool
 *
 * WHAT:
 * Calculates calculate_guess_entropy for every member of `p_pool` and
 * stores the result at the same index of `p_entropies`.
 *
 * WHY:
 * Picking a guess means scoring a whole pool (up to 5,040 guesses against
 * up to 5,040 candidates). The pool members are independent, so the outer
 * loop runs on all cores.
 */
void calculate_entropy_for_pool(const number_t* p_pool, int pool_count,
    const number_t* p_candidates, int candidate_count, double* p_entropies);

#endif
