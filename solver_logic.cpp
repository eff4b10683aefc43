/*
 * FILE: solver_logic.cpp
 *
 * WHAT:
 * Implements the decision-making layer: strategy dispatch in
 * `choose_next_guess`, and the ranking helpers behind the hint table.
 *
 * WHY:
 * candidate_engine.cpp scores guesses; this file applies the strategy. It
 * decides when to skip the search (opener, baseline), which pool to search,
 * and when to stop exploring and start aiming at the secret (endgame clamp).
 */

#include "solver_logic.h"
#include "comparators.h"
#include "entropy_calculator.h"
#include "number_codec.h"
#include <stdio.h>
#include <string.h>
#include <stdlib.h>

/*
 * FUNCTION: play_fixed_guess
 *
 * WHAT:
 * Returns `p_fixed` as the guess and, if requested, its information gain.
 * Shared by the opener override and the baseline strategy.
 */
static engine_status_t play_fixed_guess(const candidate_engine_t* p_engine, const number_t* p_fixed,
    number_t* p_guess, double* p_entropy)
{
    double entropy = 0.0;
    engine_status_t status = candidate_engine_expected_information_gain(p_engine, p_fixed, &entropy);
    if (status != ENGINE_OK) return status;

    *p_guess = *p_fixed;
    if (p_entropy != NULL) *p_entropy = entropy;
    return ENGINE_OK;
}

engine_status_t choose_next_guess(const candidate_engine_t* p_engine,
    const GuessStrategyConfig* config,
    const number_t* p_universe,
    int universe_count,
    number_t* p_guess,
    double* p_entropy)
{
    int candidate_count = candidate_engine_count(p_engine);
    if (candidate_count == 0) return ENGINE_ERR_EMPTY_CANDIDATE_SET;

    const number_t* p_candidates = candidate_engine_candidates(p_engine);

    // --- OPENER OVERRIDE ---
    // Nothing has been learned yet: every opener is equivalent, play the fixed one.
    if (config->opener_override != NULL && candidate_count == UNIVERSE_SIZE)
    {
        number_t opener;
        if (!number_from_string(config->opener_override, &opener)) return ENGINE_ERR_INVALID_NUMBER;
        return play_fixed_guess(p_engine, &opener, p_guess, p_entropy);
    }

    switch (config->pool)
    {
    case GUESS_POOL_FIRST_CANDIDATE:
        return play_fixed_guess(p_engine, &p_candidates[0], p_guess, p_entropy);

    case GUESS_POOL_UNIVERSE:
        // THE ENDGAME CLAMP: stop exploring once the candidates are few.
        if (candidate_count > config->endgame_clamp)
        {
            return candidate_engine_suggest_best_guess(p_engine, p_universe, universe_count, p_guess, p_entropy);
        }
        return candidate_engine_suggest_best_guess(p_engine, p_candidates, candidate_count, p_guess, p_entropy);

    case GUESS_POOL_CANDIDATES:
    default:
        return candidate_engine_suggest_best_guess(p_engine, p_candidates, candidate_count, p_guess, p_entropy);
    }
}

/*
 * FUNCTION: get_top_guess_candidates
 *
 * WHAT:
 * 1. Validate the pool the same way the engine does.
 * 2. Score the pool (parallel) and mark which members are live candidates
 *    using a lookup table indexed by number_to_code.
 * 3. qsort with compare_scored_guesses_by_entropy_desc and copy the head.
 */
engine_status_t get_top_guess_candidates(const candidate_engine_t* p_engine,
    const number_t* p_pool,
    int pool_count,
    scored_guess_t* p_out,
    int requested,
    int* p_written)
{
    *p_written = 0;
    if (pool_count <= 0) return ENGINE_ERR_EMPTY_POOL;
    for (int i = 0; i < pool_count; i++)
    {
        if (!number_is_valid(&p_pool[i])) return ENGINE_ERR_INVALID_NUMBER;
    }

    int candidate_count = candidate_engine_count(p_engine);
    if (candidate_count == 0) return ENGINE_ERR_EMPTY_CANDIDATE_SET;
    const number_t* p_candidates = candidate_engine_candidates(p_engine);

    double* p_entropies = (double*)malloc(sizeof(double) * pool_count);
    scored_guess_t* p_scored = (scored_guess_t*)malloc(sizeof(scored_guess_t) * pool_count);
    bool* p_is_candidate = (bool*)calloc(NUMBER_CODE_LIMIT, sizeof(bool));
    if (p_entropies == NULL || p_scored == NULL || p_is_candidate == NULL)
    {
        printf("Failed to allocate memory.\n");
        free(p_entropies); free(p_scored); free(p_is_candidate);
        return ENGINE_ERR_OUT_OF_MEMORY;
    }

    for (int i = 0; i < candidate_count; i++) p_is_candidate[number_to_code(&p_candidates[i])] = true;

    calculate_entropy_for_pool(p_pool, pool_count, p_candidates, candidate_count, p_entropies);

    for (int i = 0; i < pool_count; i++)
    {
        p_scored[i].guess = p_pool[i];
        p_scored[i].entropy = p_entropies[i];
        p_scored[i].pool_index = i;
        p_scored[i].is_candidate = p_is_candidate[number_to_code(&p_pool[i])];
    }

    qsort(p_scored, pool_count, sizeof(scored_guess_t), compare_scored_guesses_by_entropy_desc);

    int n = (requested < pool_count) ? requested : pool_count;
    if (n < 0) n = 0;
    if (n > 0) memcpy(p_out, p_scored, sizeof(scored_guess_t) * n);
    *p_written = n;

    free(p_entropies); free(p_scored); free(p_is_candidate);
    return ENGINE_OK;
}

/*
 * FUNCTION: fill_recommendation
 *
 * WHAT:
 * Asks the engine for the best guess of `p_pool` and stores it with its
 * label and candidate flag.
 */
static engine_status_t fill_recommendation(const candidate_engine_t* p_engine,
    const char* label,
    const number_t* p_pool,
    int pool_count,
    guess_recommendation_t* p_recommendation)
{
    p_recommendation->label = label;
    p_recommendation->scored.pool_index = 0;

    engine_status_t status = candidate_engine_suggest_best_guess(p_engine, p_pool, pool_count,
        &p_recommendation->scored.guess, &p_recommendation->scored.entropy);
    if (status != ENGINE_OK) return status;

    p_recommendation->scored.is_candidate = candidate_engine_contains(p_engine, &p_recommendation->scored.guess);
    return ENGINE_OK;
}

engine_status_t get_best_guess_candidates(const candidate_engine_t* p_engine,
    const number_t* p_universe,
    int universe_count,
    recommendations_array_t recommendations)
{
    // An empty candidate list would otherwise be reported as an empty pool.
    if (candidate_engine_count(p_engine) == 0) return ENGINE_ERR_EMPTY_CANDIDATE_SET;

    engine_status_t status = fill_recommendation(p_engine, "Best Consistent",
        candidate_engine_candidates(p_engine), candidate_engine_count(p_engine), &recommendations[0]);
    if (status != ENGINE_OK) return status;

    return fill_recommendation(p_engine, "Best Explorer", p_universe, universe_count, &recommendations[1]);
}
