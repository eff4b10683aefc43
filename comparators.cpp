/*
 * FILE: comparators.cpp
 *
 * WHAT:
 * Implements the comparison logic used by `qsort` to order scored guesses.
 *
 * TIE-BREAKING:
 * qsort is not stable, so every comparator ends on a key that is unique
 * per element (the pool index). The resulting order is identical run to
 * run.
 */

#include "comparators.h"

 // --- Internal Helper Functions ---
 // Positive result = Entry 1 sorts after Entry 2.

static int entropy_diff(const scored_guess_t* entry1, const scored_guess_t* entry2)
{
    // Higher entropy first
    if (entry1->entropy > entry2->entropy) return -1;
    if (entry1->entropy < entry2->entropy) return 1;
    return 0;
}

static int candidate_diff(const scored_guess_t* entry1, const scored_guess_t* entry2)
{
    // Candidates (possible answers) first
    if (entry1->is_candidate && !entry2->is_candidate) return -1;
    if (!entry1->is_candidate && entry2->is_candidate) return 1;
    return 0;
}

static int pool_index_diff(const scored_guess_t* entry1, const scored_guess_t* entry2)
{
    if (entry1->pool_index < entry2->pool_index) return -1;
    if (entry1->pool_index > entry2->pool_index) return 1;
    return 0;
}

int compare_scored_guesses_by_entropy_desc(const void* p1, const void* p2)
{
    const scored_guess_t* entry1 = (const scored_guess_t*)p1;
    const scored_guess_t* entry2 = (const scored_guess_t*)p2;

    int result = entropy_diff(entry1, entry2);
    if (result != 0) return result;

    result = candidate_diff(entry1, entry2);
    if (result != 0) return result;

    return pool_index_diff(entry1, entry2);
}

int compare_group_sizes_asc(const void* p1, const void* p2)
{
    int size1 = *(const int*)p1;
    int size2 = *(const int*)p2;
    if (size1 < size2) return -1;
    if (size1 > size2) return 1;
    return 0;
}
