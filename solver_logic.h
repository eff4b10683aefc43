/*
 * FILE: solver_logic.h
 *
 * WHAT:
 * Defines the interface for the decision-making layer of the solver.
 * This module is responsible for:
 * 1. Applying a GuessStrategyConfig (opener, pool, endgame clamp) to pick
 *    the next guess.
 * 2. Ranking a pool of guesses for the hint table.
 * 3. Producing the "Top Choices" box (best consistent vs best explorer).
 *
 * WHY:
 * Separation of concerns. The Candidate Engine answers "how good is this
 * guess?"; this module decides which guesses to ask about. The console
 * loop and the tournament both go through here so they behave the same.
 */

#pragma once
#ifndef SOLVER_LOGIC_H
#define SOLVER_LOGIC_H
#include "bulls_cows_types.h"
#include "candidate_engine.h"
#include "guess_strategies.h"

/*
 * CONSTANT: Max Recommendations
 *
 * WHAT:
 * The number of "best guess" categories shown in the Top Choices box.
 * 0: Best Consistent (a candidate), 1: Best Explorer (any number).
 */
const int MAX_RECOMMENDATIONS = 2;

/*
 * STRUCT: guess_recommendation_t
 *
 * WHAT:
 * A display wrapper pairing a category label with its scored guess.
 */
typedef struct _guess_recommendation
{
    const char* label;
    scored_guess_t scored;
} guess_recommendation_t;

typedef guess_recommendation_t recommendations_array_t[MAX_RECOMMENDATIONS];

/*
 * FUNCTION: choose_next_guess
 *
 * WHAT:
 * The "Brain" of the solver. Picks the next guess for the given strategy:
 * 1. Opener Override: while the candidate set is still the whole universe,
 *    play the configured opener.
 * 2. First Candidate: play the first remaining candidate.
 * 3. Candidates pool: best guess among the candidates.
 * 4. Universe pool: best guess among all numbers, unless the endgame clamp
 *    applies, in which case among the candidates.
 *
 * PARAMETERS:
 * - p_universe / universe_count: the full universe (build_number_universe).
 * - p_guess: Output. The chosen guess.
 * - p_entropy: Output, optional. The guess's expected information gain.
 *
 * RETURNS:
 * - ENGINE_OK on success, otherwise the first engine error encountered
 *   (ENGINE_ERR_INVALID_NUMBER for a malformed opener).
 */
engine_status_t choose_next_guess(const candidate_engine_t* p_engine,
    const GuessStrategyConfig* config,
    const number_t* p_universe,
    int universe_count,
    number_t* p_guess,
    double* p_entropy);

/*
 * FUNCTION: get_top_guess_candidates
 *
 * WHAT:
 * Scores every member of `p_pool`, sorts them (entropy, then candidates
 * first, then pool order) and copies the best `requested` of them into
 * `p_out`.
 *
 * PARAMETERS:
 * - p_out: Output array with room for `requested` entries.
 * - p_written: Output. min(requested, pool_count).
 *
 * RETURNS:
 * - ENGINE_OK, or the same errors as candidate_engine_suggest_best_guess.
 */
engine_status_t get_top_guess_candidates(const candidate_engine_t* p_engine,
    const number_t* p_pool,
    int pool_count,
    scored_guess_t* p_out,
    int requested,
    int* p_written);

/*
 * FUNCTION: get_best_guess_candidates
 *
 * WHAT:
 * Fills the Top Choices box:
 * 1. Best Consistent: highest-entropy guess that could still be the secret.
 * 2. Best Explorer: highest-entropy guess over the whole universe.
 *
 * WHY:
 * Shows the user the trade-off between a guess that might win now and a
 * guess that only gathers information.
 */
engine_status_t get_best_guess_candidates(const candidate_engine_t* p_engine,
    const number_t* p_universe,
    int universe_count,
    recommendations_array_t recommendations);

#endif
