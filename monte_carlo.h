/*
 * FILE: monte_carlo.h
 *
 * WHAT:
 * Defines the interface for the Simulation Engine.
 * This module runs "Tournaments" where a strategy plays one full game
 * against every possible secret to measure its win rate and average guess
 * count.
 *
 * WHY:
 * To prove that "Strategy A" is better than "Strategy B", we run both over
 * all 5,040 secrets. This module orchestrates that workload across all
 * cores.
 */

#pragma once
#ifndef MONTE_CARLO_H
#define MONTE_CARLO_H
#include "bulls_cows_types.h"
#include "guess_strategies.h"

/*
 * CONSTANT: MAX_SIM_GUESSES
 *
 * Guess cap per simulated game. Bulls & Cows has no official limit; a game
 * that needs more than this is counted as a loss.
 */
const int MAX_SIM_GUESSES = 12;

/*
 * STRUCT: SimStats
 *
 * WHAT:
 * A container for the results of a single strategy simulation.
 *
 * FIELDS:
 * - wins/losses: Raw counts.
 * - guess_distribution: Histogram (how many games were won in 1, 2, ... guesses).
 * - average_guesses: The primary "Efficiency" metric (over won games).
 * - time_taken: Wall-clock seconds for the run.
 */
typedef struct _sim_stats
{
    char strategy_name[50];
    char opener[NUMBER_LENGTH + 1];
    int wins;
    int losses;
    long total_guesses;
    int guess_distribution[MAX_SIM_GUESSES + 1];
    int worst_game;
    double average_guesses;
    double win_percent;
    double time_taken;
} SimStats;

/*
 * FUNCTION: run_guess_strategy
 *
 * WHAT:
 * Plays one game per entry of `p_secrets` with the given strategy and
 * aggregates the outcome.
 *
 * PARAMETERS:
 * - p_secrets / secret_count: the secrets to play against (the whole
 *   universe for a tournament, any subset for a quick check).
 * - p_universe / universe_count: the full universe, used by explorer pools.
 *
 * RETURNS:
 * The filled SimStats. If the opening guess cannot be determined every
 * game is counted as a loss.
 */
SimStats run_guess_strategy(const GuessStrategyConfig* config,
    const number_t* p_secrets, int secret_count,
    const number_t* p_universe, int universe_count);

/*
 * FUNCTION: print_distribution
 *
 * WHAT:
 * Prints a histogram of the guess distribution of one strategy.
 */
void print_distribution(const SimStats* s);

/*
 * FUNCTION: run_monte_carlo_simulation
 *
 * WHAT:
 * The entry point for the Tournament Mode.
 * 1. Runs every strategy index in `p_roster` over the whole universe.
 * 2. Prints a results table.
 * 3. Names the champion (highest win %, then lowest average) and prints
 *    its guess distribution.
 */
void run_monte_carlo_simulation(const number_t* p_universe, int universe_count,
    const int* p_roster, int roster_size);

#endif
