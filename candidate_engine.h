/*
 * FILE: candidate_engine.h
 *
 * WHAT:
 * Defines the Candidate Engine: the owner of the set of numbers still
 * consistent with every hint received so far. It exposes:
 * 1. The remaining uncertainty in bits.
 * 2. The expected information gain of any guess.
 * 3. The best guess from a caller-supplied pool.
 * 4. Pruning after a real hint.
 *
 * WHY:
 * The set is the only mutable state of a game. Keeping it inside one
 * struct (instead of a global list) lets several games run side by side,
 * which the Monte Carlo tournament does on every core.
 */

#pragma once
#ifndef CANDIDATE_ENGINE_H
#define CANDIDATE_ENGINE_H
#include "bulls_cows_types.h"

/*
 * STRUCT: candidate_engine_t
 *
 * WHAT:
 * - p_candidates: heap array, the first candidate_count entries are live.
 *   Starts as the full universe in ascending order; pruning compacts it in
 *   place and keeps the survivors in their original relative order.
 * - candidate_count: live entries. Only ever decreases.
 *
 * Always create with candidate_engine_init and release with
 * candidate_engine_free. Do not copy the struct; the copy would share the
 * array.
 */
typedef struct _candidate_engine
{
    number_t* p_candidates;
    int candidate_count;
} candidate_engine_t;

/*
 * FUNCTION: candidate_engine_init
 *
 * WHAT:
 * Allocates the candidate array and fills it with all UNIVERSE_SIZE numbers.
 *
 * RETURNS:
 * - true on success.
 * - false if memory allocation fails (the engine is left empty).
 */
bool candidate_engine_init(candidate_engine_t* p_engine);

void candidate_engine_free(candidate_engine_t* p_engine);

/*
 * FUNCTION: candidate_engine_uncertainty
 *
 * WHAT:
 * log2 of the candidate count. 0 bits once one candidate is left.
 *
 * RETURNS:
 * - ENGINE_OK with *p_bits filled in.
 * - ENGINE_ERR_EMPTY_CANDIDATE_SET if no candidate is left.
 */
engine_status_t candidate_engine_uncertainty(const candidate_engine_t* p_engine, double* p_bits);

/*
 * FUNCTION: candidate_engine_expected_information_gain
 *
 * WHAT:
 * Entropy of the partition `p_guess` induces on the current candidates,
 * i.e. the expected bits revealed by playing it when the secret is uniform
 * over the candidates. The guess does not have to be a candidate.
 *
 * RETURNS:
 * - ENGINE_OK with *p_bits filled in.
 * - ENGINE_ERR_INVALID_NUMBER if the guess is malformed.
 * - ENGINE_ERR_EMPTY_CANDIDATE_SET if no candidate is left.
 */
engine_status_t candidate_engine_expected_information_gain(const candidate_engine_t* p_engine,
    const number_t* p_guess, double* p_bits);

/*
 * FUNCTION: candidate_engine_suggest_best_guess
 *
 * WHAT:
 * Scores every member of `p_pool` and returns the one with the highest
 * expected information gain. On a tie the member that comes first in the
 * pool wins. Pass the engine's own candidates for a "consistent" guess or
 * the full universe to allow exploratory guesses.
 *
 * PARAMETERS:
 * - p_best: Output. The chosen guess.
 * - p_best_entropy: Output, optional (may be NULL). Its gain.
 *
 * RETURNS:
 * - ENGINE_OK on success.
 * - ENGINE_ERR_EMPTY_POOL if pool_count is 0.
 * - ENGINE_ERR_INVALID_NUMBER if a pool member is malformed.
 * - ENGINE_ERR_EMPTY_CANDIDATE_SET if no candidate is left.
 * - ENGINE_ERR_OUT_OF_MEMORY if the score buffer cannot be allocated.
 */
engine_status_t candidate_engine_suggest_best_guess(const candidate_engine_t* p_engine,
    const number_t* p_pool, int pool_count, number_t* p_best, double* p_best_entropy);

/*
 * FUNCTION: candidate_engine_prune
 *
 * WHAT:
 * Keeps only the candidates c for which evaluate_feedback(c, guess) equals
 * `p_observed`. There is no undo.
 *
 * WHY:
 * An impossible or contradictory hint is not rejected here; it simply
 * empties the set, and the next uncertainty / gain call reports
 * ENGINE_ERR_EMPTY_CANDIDATE_SET.
 *
 * RETURNS:
 * - ENGINE_OK after pruning (even if nothing is left).
 * - ENGINE_ERR_INVALID_NUMBER if the guess is malformed; the set is untouched.
 */
engine_status_t candidate_engine_prune(candidate_engine_t* p_engine, const number_t* p_guess,
    const feedback_t* p_observed);

int candidate_engine_count(const candidate_engine_t* p_engine);

/*
 * FUNCTION: candidate_engine_candidates
 *
 * WHAT:
 * Read-only view of the live candidates (candidate_engine_count entries).
 * Valid until the next prune.
 */
const number_t* candidate_engine_candidates(const candidate_engine_t* p_engine);

bool candidate_engine_contains(const candidate_engine_t* p_engine, const number_t* p_number);

/*
 * FUNCTION: engine_status_to_string
 *
 * WHAT:
 * Human readable name of a status code for console messages.
 */
const char* engine_status_to_string(engine_status_t status);

#endif
