/*
 * FILE: guess_strategies.h
 *
 * WHAT:
 * Defines the configuration structures for the guessing bots.
 * By tweaking the pool, the opener and the endgame clamp, the same engine
 * behaves as a "Consistent" player (only guesses that could win), an
 * "Explorer" (any number, for information) or a naive baseline.
 *
 * WHY:
 * Hardcoding one policy makes comparison impossible. With the policy as
 * data, the tournament can race every bot over all 5,040 secrets and the
 * console can switch bots at startup without recompiling.
 */

#pragma once
#ifndef GUESS_STRATEGIES_H
#define GUESS_STRATEGIES_H

#include <stdbool.h>

/*
 * ENUM: guess_pool_t
 *
 * WHAT:
 * Where the bot looks for its next guess.
 * - GUESS_POOL_CANDIDATES     : only numbers that could still be the secret.
 * - GUESS_POOL_UNIVERSE       : all 5,040 numbers, including eliminated ones.
 * - GUESS_POOL_FIRST_CANDIDATE: no scoring; play the first remaining candidate.
 */
typedef enum _guess_pool
{
    GUESS_POOL_CANDIDATES = 0,
    GUESS_POOL_UNIVERSE,
    GUESS_POOL_FIRST_CANDIDATE
} guess_pool_t;

/*
 * STRUCT: GuessStrategyConfig
 *
 * WHAT:
 * The master configuration object for a single solver instance.
 * Passed into `choose_next_guess` to control decision making.
 */
typedef struct
{
    // The display name of the strategy (e.g., "Entropy Consistent (0123)").
    // Used in console output and tournament reports.
    const char* name;

    // 1. Guess Pool:
    // See guess_pool_t above.
    guess_pool_t pool;

    // 2. Opener Override:
    // If not NULL, this number is played while no information has been
    // gathered yet (the candidate set is still the full universe).
    // WHY: every opening guess scores the same 2.7712 bits, so searching
    // 5,040 x 5,040 for the first move only burns time.
    const char* opener_override;

    // 3. Endgame Clamp:
    // For GUESS_POOL_UNIVERSE only. Once the candidate count is at or below
    // this value, search the candidates instead of the universe.
    // WHY: with 1 candidate left every guess scores 0 bits and the
    // tie-break would pick a non-candidate; with 2 left, guessing one of
    // them wins half the time for the same information.
    int endgame_clamp;

} GuessStrategyConfig;

// --- GLOBAL STRATEGY DEFINITIONS ---
// Defined in guess_strategies.cpp
extern const int TOTAL_DEFINED_STRATEGIES;
extern const GuessStrategyConfig ALL_STRATEGIES[];

// Index of the strategy used when the user just presses Enter.
extern const int DEFAULT_STRATEGY_INDEX;

#endif
