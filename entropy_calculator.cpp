/*
 * FILE: entropy_calculator.cpp
 *
 * WHAT:
 * The mathematical engine of the solver. This file contains the routines
 * for calculating Shannon Entropy (Information Bits).
 *
 * KEY OPTIMIZATIONS:
 * 1. Integer Encoding: hints are encoded as bulls * 5 + cows (0-24), so the
 * histogram is a plain array indexed by the hint.
 * 2. Stack Allocation: the 25-slot histogram lives on the stack; no
 * malloc/free in the hot path. Its non-empty groups are summed smallest
 * first so that equal partitions give bit-identical scores.
 * 3. OpenMP Parallelism: the loop over guesses is split across all cores.
 *
 * WHY:
 * Scoring the full universe against the full universe is 25 million hint
 * evaluations. That has to stay well under a second for the hint prompt and
 * for the tournament.
 */

#include "entropy_calculator.h"
#include "feedback_oracle.h"
#include "comparators.h"
#include <stdlib.h>
#include <math.h>
#include <omp.h> // REQUIRED: OpenMP Header for multi-threading

double calculate_state_uncertainty(int candidate_count)
{
    return log2((double)candidate_count);
}

/*
 * FUNCTION: calculate_guess_entropy
 *
 * WHAT:
 * Formula: H = -Sum( p(x) * log2(p(x)) )
 * Where x is a (bulls, cows) hint and p(x) is the share of candidates that
 * would answer the guess with x.
 */
double calculate_guess_entropy(const number_t* p_guess, const number_t* p_candidates, int candidate_count)
{
    if (candidate_count <= 1) return 0.0;

    // Histogram: how many candidates produce each of the 25 hints.
    int counts[FEEDBACK_BUCKETS] = { 0 };

    // 1. Tally hint frequencies
    for (int i = 0; i < candidate_count; i++)
    {
        counts[compute_feedback_index(&p_candidates[i], p_guess)]++;
    }

    // 2. Canonical order: compact the non-empty groups and sort them by size,
    // so equal partitions sum the same terms in the same order.
    int groups[FEEDBACK_BUCKETS];
    int group_count = 0;
    for (int i = 0; i < FEEDBACK_BUCKETS; i++)
    {
        if (counts[i] > 0) groups[group_count++] = counts[i];
    }
    qsort(groups, group_count, sizeof(int), compare_group_sizes_asc);

    // 3. Sum the entropy of the partition
    double entropy = 0.0;
    double inv_num = 1.0 / (double)candidate_count;

    for (int i = 0; i < group_count; i++)
    {
        double p = groups[i] * inv_num;
        entropy -= p * log2(p);
    }

    return entropy;
}

/*
 * FUNCTION: calculate_entropy_for_pool
 *
 * WHAT:
 * Scores every pool member against the same candidate array.
 *
 * WHY:
 * Every iteration does the same amount of work (one full pass over the
 * candidates), so a static schedule splits the pool evenly.
 */
void calculate_entropy_for_pool(const number_t* p_pool, int pool_count,
    const number_t* p_candidates, int candidate_count, double* p_entropies)
{
#pragma omp parallel for schedule(static)
    for (int i = 0; i < pool_count; i++)
    {
        p_entropies[i] = calculate_guess_entropy(&p_pool[i], p_candidates, candidate_count);
    }
}
