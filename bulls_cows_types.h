/*
 * FILE: bulls_cows_types.h
 *
 * WHAT:
 * Defines the core data structures and types used throughout the solver.
 * This includes the Number and Feedback records, the game constants, the
 * status codes returned by the engine, and the scored-guess record used
 * by the ranking and display code.
 *
 * WHY:
 * A centralized type definition keeps the Oracle, the Candidate Engine,
 * the Strategy layer and the console driver in agreement about what a
 * "number" and a "hint" look like.
 */

#pragma once
#ifndef BULLS_COWS_TYPES_H
#define BULLS_COWS_TYPES_H

#include <stdlib.h>
#include <stdbool.h>

/*
 * CONSTANTS: Game Constraints
 *
 * WHAT:
 * NUMBER_LENGTH  - digits per secret/guess.
 * DIGIT_COUNT    - size of the digit alphabet (0-9).
 * UNIVERSE_SIZE  - 10 * 9 * 8 * 7 permutations of distinct digits.
 * FEEDBACK_BUCKETS - one slot per (bulls, cows) pair, indexed bulls * 5 + cows.
 */
const int NUMBER_LENGTH = 4;
const int DIGIT_COUNT = 10;
const int UNIVERSE_SIZE = 5040;
const int FEEDBACK_BUCKETS = (NUMBER_LENGTH + 1) * (NUMBER_LENGTH + 1);

/*
 * STRUCT: number_t
 *
 * WHAT:
 * A single 4-digit number with distinct digits. Used for the secret, for
 * guesses and for every member of the candidate set.
 *
 * FIELDS:
 * - digits: ASCII '0'..'9', NUL terminated, so it prints with "%s".
 * - digit_mask: bit d set when digit d is present. Cached at construction
 *   so the cow count is a single AND + popcount in the hot loop.
 *
 * Numbers are built by the codec (number_codec.h) and then only handled
 * through const pointers.
 */
typedef struct _number
{
    char digits[NUMBER_LENGTH + 1];     /* "0123" + null terminator             */
    unsigned short digit_mask;          /* bit d set if digit d appears         */
} number_t;

/*
 * STRUCT: feedback_t
 *
 * WHAT:
 * The hint for one guess: bulls (right digit, right place) and cows
 * (right digit, wrong place). bulls + cows never exceeds NUMBER_LENGTH.
 */
typedef struct _feedback
{
    int bulls;
    int cows;
} feedback_t;

/*
 * ENUM: engine_status_t
 *
 * WHAT:
 * Result code of every engine operation that can fail. Results are written
 * through out-parameters and are only valid when ENGINE_OK is returned.
 *
 * - ENGINE_ERR_INVALID_NUMBER      : an argument is not 4 distinct digits.
 * - ENGINE_ERR_EMPTY_CANDIDATE_SET : no candidate left; earlier feedback
 *                                    contradicted itself.
 * - ENGINE_ERR_EMPTY_POOL          : asked to pick from an empty pool.
 * - ENGINE_ERR_OUT_OF_MEMORY       : malloc failed.
 */
typedef enum _engine_status
{
    ENGINE_OK = 0,
    ENGINE_ERR_INVALID_NUMBER,
    ENGINE_ERR_EMPTY_CANDIDATE_SET,
    ENGINE_ERR_EMPTY_POOL,
    ENGINE_ERR_OUT_OF_MEMORY
} engine_status_t;

/*
 * STRUCT: scored_guess_t
 *
 * WHAT:
 * A guess together with its expected information gain.
 *
 * FIELDS:
 * - pool_index: position of the guess in the pool it was scored from.
 *   Used as the final tie-breaker so rankings are deterministic.
 * - is_candidate: true if the guess could still be the secret.
 */
typedef struct _scored_guess
{
    number_t guess;
    double entropy;
    int pool_index;
    bool is_candidate;
} scored_guess_t;

#endif
