/*
 * FILE: guess_strategies.cpp
 *
 * WHAT:
 * Defines the concrete instances of the solver configurations.
 * This file acts as the "Registry" of all available bot personalities.
 *
 * THE ROSTER (5 Strategies):
 * 0. Entropy Consistent (0123)   [DEFAULT] - Max entropy over the candidates.
 * 1. Entropy Consistent (Full)   - Same, but searches the opening move too.
 * 2. Entropy Explorer (0123)     - Max entropy over the universe, clamp at 2.
 * 3. Entropy Explorer (Pure)     - Universe search until a single candidate.
 * 4. First Candidate (Baseline)  - No entropy at all.
 *
 * WHY:
 * Keeping every configuration here lets the tournament re-run them all to
 * check that a change in the engine did not make any bot worse.
 */

#include "guess_strategies.h"
#include <stddef.h>

const int TOTAL_DEFINED_STRATEGIES = 5;
const int DEFAULT_STRATEGY_INDEX = 0;

/*
 * CONFIGURATION ARRAY:
 * Order of fields in GuessStrategyConfig struct:
 * 1. Name (string)
 * 2. Guess Pool (candidates / universe / first candidate)
 * 3. Opener Override (string or NULL)
 * 4. Endgame Clamp (int, universe pool only)
 */
const GuessStrategyConfig ALL_STRATEGIES[] = {

    // --- THE DEFAULT ---
    // Only guesses numbers that could still be the secret, so every guess
    // can win. Opens with 0123.
    /* 0 */ { "Entropy Consistent (0123)",   GUESS_POOL_CANDIDATES,      "0123", 0 },

    // Identical, but scores all 5,040 openers (they tie, so it plays 0123).
    /* 1 */ { "Entropy Consistent (Full)",   GUESS_POOL_CANDIDATES,      NULL,   0 },

    // --- EXPLORERS ---
    // Allowed to play eliminated numbers if they split the candidates better.
    /* 2 */ { "Entropy Explorer (0123)",     GUESS_POOL_UNIVERSE,        "0123", 2 },
    /* 3 */ { "Entropy Explorer (Pure)",     GUESS_POOL_UNIVERSE,        "0123", 1 },

    // --- BASELINE CONTROL ---
    // Plays the smallest remaining candidate every turn.
    /* 4 */ { "First Candidate (Baseline)",  GUESS_POOL_FIRST_CANDIDATE, NULL,   0 },
};
