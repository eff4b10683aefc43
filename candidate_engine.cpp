/*
 * FILE: candidate_engine.cpp
 *
 * WHAT:
 * Implements the Candidate Engine: the candidate set, the uncertainty and
 * information-gain queries, best-guess search and pruning.
 *
 * WHY:
 * entropy_calculator.cpp does the raw math over arrays; this file owns the
 * array, enforces the error rules (bad numbers, empty set, empty pool) and
 * keeps the set shrinking monotonically.
 */

#include "candidate_engine.h"
#include "entropy_calculator.h"
#include "feedback_oracle.h"
#include "number_codec.h"
#include <stdio.h>
#include <string.h>

bool candidate_engine_init(candidate_engine_t* p_engine)
{
    p_engine->p_candidates = NULL;
    p_engine->candidate_count = 0;

    return build_number_universe(&p_engine->p_candidates, &p_engine->candidate_count);
}

void candidate_engine_free(candidate_engine_t* p_engine)
{
    if (p_engine->p_candidates != NULL) free(p_engine->p_candidates);
    p_engine->p_candidates = NULL;
    p_engine->candidate_count = 0;
}

engine_status_t candidate_engine_uncertainty(const candidate_engine_t* p_engine, double* p_bits)
{
    if (p_engine->candidate_count == 0) return ENGINE_ERR_EMPTY_CANDIDATE_SET;

    *p_bits = calculate_state_uncertainty(p_engine->candidate_count);
    return ENGINE_OK;
}

engine_status_t candidate_engine_expected_information_gain(const candidate_engine_t* p_engine,
    const number_t* p_guess, double* p_bits)
{
    if (!number_is_valid(p_guess)) return ENGINE_ERR_INVALID_NUMBER;
    if (p_engine->candidate_count == 0) return ENGINE_ERR_EMPTY_CANDIDATE_SET;

    *p_bits = calculate_guess_entropy(p_guess, p_engine->p_candidates, p_engine->candidate_count);
    return ENGINE_OK;
}

/*
 * FUNCTION: candidate_engine_suggest_best_guess
 *
 * WHAT:
 * 1. Validate the pool (non-empty, every member well formed).
 * 2. Score the whole pool in parallel.
 * 3. Scan the scores serially, keeping the first strict maximum.
 *
 * WHY:
 * The scores are computed in parallel but the selection is serial, so the
 * "first in pool order wins a tie" rule holds no matter how OpenMP splits
 * the work.
 */
engine_status_t candidate_engine_suggest_best_guess(const candidate_engine_t* p_engine,
    const number_t* p_pool, int pool_count, number_t* p_best, double* p_best_entropy)
{
    if (pool_count <= 0) return ENGINE_ERR_EMPTY_POOL;
    for (int i = 0; i < pool_count; i++)
    {
        if (!number_is_valid(&p_pool[i])) return ENGINE_ERR_INVALID_NUMBER;
    }
    if (p_engine->candidate_count == 0) return ENGINE_ERR_EMPTY_CANDIDATE_SET;

    double* p_entropies = (double*)malloc(sizeof(double) * pool_count);
    if (p_entropies == NULL)
    {
        printf("Failed to allocate memory.\n");
        return ENGINE_ERR_OUT_OF_MEMORY;
    }

    calculate_entropy_for_pool(p_pool, pool_count, p_engine->p_candidates, p_engine->candidate_count, p_entropies);

    int best_index = 0;
    for (int i = 1; i < pool_count; i++)
    {
        if (p_entropies[i] > p_entropies[best_index]) best_index = i;
    }

    *p_best = p_pool[best_index];
    if (p_best_entropy != NULL) *p_best_entropy = p_entropies[best_index];

    free(p_entropies);
    return ENGINE_OK;
}

/*
 * FUNCTION: candidate_engine_prune
 *
 * WHAT:
 * The primary state-update mechanism. Compacts the array in place: every
 * candidate that would have produced the observed hint is moved down to the
 * next free slot, the rest are overwritten.
 *
 * WHY:
 * "If the secret were X, would I have seen this hint?" If yes, X stays.
 * Compacting (instead of flagging) keeps the live candidates contiguous so
 * the entropy loops never skip dead entries.
 */
engine_status_t candidate_engine_prune(candidate_engine_t* p_engine, const number_t* p_guess,
    const feedback_t* p_observed)
{
    if (!number_is_valid(p_guess)) return ENGINE_ERR_INVALID_NUMBER;

    // A hint that cannot be encoded matches nothing and empties the set.
    int observed_index = feedback_to_index(p_observed);

    int kept = 0;
    for (int i = 0; i < p_engine->candidate_count; ++i)
    {
        const number_t* pCandidate = &p_engine->p_candidates[i];
        if (compute_feedback_index(pCandidate, p_guess) != observed_index) continue;

        if (kept != i) p_engine->p_candidates[kept] = *pCandidate;
        kept++;
    }
    p_engine->candidate_count = kept;
    return ENGINE_OK;
}

int candidate_engine_count(const candidate_engine_t* p_engine)
{
    return p_engine->candidate_count;
}

const number_t* candidate_engine_candidates(const candidate_engine_t* p_engine)
{
    return p_engine->p_candidates;
}

bool candidate_engine_contains(const candidate_engine_t* p_engine, const number_t* p_number)
{
    for (int i = 0; i < p_engine->candidate_count; ++i)
    {
        if (numbers_equal(&p_engine->p_candidates[i], p_number)) return true;
    }
    return false;
}

const char* engine_status_to_string(engine_status_t status)
{
    switch (status)
    {
    case ENGINE_OK:                      return "OK";
    case ENGINE_ERR_INVALID_NUMBER:      return "Invalid number (need 4 distinct digits)";
    case ENGINE_ERR_EMPTY_CANDIDATE_SET: return "No candidates left (contradictory feedback)";
    case ENGINE_ERR_EMPTY_POOL:          return "Empty guess pool";
    case ENGINE_ERR_OUT_OF_MEMORY:       return "Out of memory";
    }
    return "Unknown error";
}
