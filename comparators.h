/*
 * FILE: comparators.h
 *
 * WHAT:
 * Defines the comparison functions used by the C standard library `qsort`
 * function to order scored guesses and feedback group sizes.
 *
 * WHY:
 * The hint table shows the best guesses first. Sorting by entropy alone is
 * not enough: many guesses share the exact same score (every opening guess
 * does), so the order must be pinned down or the table would change from
 * run to run.
 */

#pragma once
#ifndef COMPARATORS_H
#define COMPARATORS_H
#include "bulls_cows_types.h"

/*
 * FUNCTION: compare_scored_guesses_by_entropy_desc
 *
 * WHAT:
 * Sorts an array of scored_guess_t (not pointers) by:
 * 1. Entropy: higher values come first.
 * 2. Candidate status: guesses that could still be the secret come first.
 * 3. Pool order: lower pool_index comes first.
 *
 * WHY:
 * With equal information, a guess that might also win outright is the
 * better play. The final pool-order key makes the sort total.
 */
int compare_scored_guesses_by_entropy_desc(const void* p1, const void* p2);

/*
 * FUNCTION: compare_group_sizes_asc
 *
 * WHAT:
 * Sorts an array of int (feedback group sizes) smallest first.
 *
 * WHY:
 * Two guesses that split the candidates into the same group sizes must
 * score the exact same entropy. Summing the groups in a fixed order makes
 * the floating-point result depend only on the sizes, not on which hint
 * each group sits under.
 */
int compare_group_sizes_asc(const void* p1, const void* p2);

#endif
