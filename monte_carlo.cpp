/*
 * FILE: monte_carlo.cpp
 *
 * WHAT:
 * Implements the Simulation Engine ("The Tournament").
 * This module runs thousands of full games in parallel to measure the
 * performance of a specific strategy configuration.
 *
 * ARCHITECTURE:
 * 1. Serial Setup: Pre-calculates the opening guess once.
 * 2. Parallel Execution: OpenMP hands out secrets to threads; each game
 * is played to the end by one thread.
 * 3. Game Isolation: Every game creates its own candidate engine, so
 * pruning in game A never touches game B.
 * 4. Aggregation: Atomic counters plus a per-thread histogram merged in a
 * critical section.
 */

#include "monte_carlo.h"
#include "candidate_engine.h"
#include "feedback_oracle.h"
#include "solver_logic.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>
#include <omp.h>

void print_distribution(const SimStats* s)
{
    printf("  %s Distribution:\n", s->strategy_name);
    if (s->wins == 0) { printf("    N/A (0 wins)\n"); return; }

    for (int i = 1; i <= MAX_SIM_GUESSES; i++)
    {
        if (s->guess_distribution[i] > 0)
        {
            double pct = 100.0 * s->guess_distribution[i] / s->wins;
            printf("    %2d guess%s | %4d (%5.2f%%)\n", i, (i == 1 ? "  " : "es"), s->guess_distribution[i], pct);
        }
    }
    printf("\n");
}

/*
 * FUNCTION: play_single_game
 *
 * WHAT:
 * Plays one game against `p_secret`, starting with `p_opener`.
 *
 * RETURNS:
 * - the number of guesses used (1..MAX_SIM_GUESSES) on a win.
 * - 0 on a loss (cap reached, or the engine reported an error).
 */
static int play_single_game(const GuessStrategyConfig* config, const number_t* p_secret,
    const number_t* p_opener, const number_t* p_universe, int universe_count)
{
    candidate_engine_t engine;
    if (!candidate_engine_init(&engine)) return 0;

    number_t current_guess = *p_opener;
    int result = 0;

    // GAME LOOP
    for (int turn = 1; turn <= MAX_SIM_GUESSES; turn++)
    {
        // Generate Feedback (Simulate the Game Engine)
        feedback_t feedback;
        if (evaluate_feedback(p_secret, &current_guess, &feedback) != ENGINE_OK) break;

        // Check for Win
        if (feedback_is_solved(&feedback)) { result = turn; break; }

        // Update Logic State and pick the next guess
        if (candidate_engine_prune(&engine, &current_guess, &feedback) != ENGINE_OK) break;
        if (choose_next_guess(&engine, config, p_universe, universe_count, &current_guess, NULL) != ENGINE_OK) break;
    }

    candidate_engine_free(&engine);
    return result;
}

/*
 * FUNCTION: run_guess_strategy
 *
 * FLOW:
 * 1. Determine Opener: ask the strategy for its first guess on a fresh engine.
 * 2. OpenMP Parallel Region: each thread plays whole games.
 * 3. Record outcome per game.
 * 4. Finalize averages and percentages.
 */
SimStats run_guess_strategy(const GuessStrategyConfig* config,
    const number_t* p_secrets, int secret_count,
    const number_t* p_universe, int universe_count)
{
    SimStats stats;
    memset(&stats, 0, sizeof(SimStats));
    snprintf(stats.strategy_name, sizeof(stats.strategy_name), "%s", config->name);

    printf(">>> Simulating Bot: %s ...\n", config->name);

    // --- PHASE 1: DETERMINE OPENER (Serial Step) ---
    // The first guess does not depend on the secret, so compute it once.
    printf("    Determining opening guess...\n");

    candidate_engine_t opener_engine;
    number_t opener;
    engine_status_t status = ENGINE_ERR_OUT_OF_MEMORY;
    if (candidate_engine_init(&opener_engine))
    {
        status = choose_next_guess(&opener_engine, config, p_universe, universe_count, &opener, NULL);
        candidate_engine_free(&opener_engine);
    }
    if (status != ENGINE_OK)
    {
        printf("    Could not determine opener: %s\n", engine_status_to_string(status));
        stats.losses = secret_count;
        return stats;
    }
    memcpy(stats.opener, opener.digits, sizeof(stats.opener));
    printf("    Opener: %s\n", opener.digits);

    // --- PHASE 2: PARALLEL SIMULATION LOOP ---
    time_t start_time = time(NULL);

#pragma omp parallel
    {
        // Local stats accumulator to reduce atomic contention
        int local_distribution[MAX_SIM_GUESSES + 1] = { 0 };
        int local_worst = 0;

        // Dynamic Schedule: late-game searches vary a lot in cost between secrets.
#pragma omp for schedule(dynamic)
        for (int t = 0; t < secret_count; t++)
        {
            int guesses_taken = play_single_game(config, &p_secrets[t], &opener, p_universe, universe_count);

            // End of Game: Record Stats
            if (guesses_taken > 0)
            {
#pragma omp atomic
                stats.wins++;
#pragma omp atomic
                stats.total_guesses += guesses_taken;

                local_distribution[guesses_taken]++;
                if (guesses_taken > local_worst) local_worst = guesses_taken;
            }
            else
            {
#pragma omp atomic
                stats.losses++;
            }

            // Progress Indicator (Only thread 0 prints to avoid console chaos)
            if (t % 500 == 0 && omp_get_thread_num() == 0) printf("    Progress: %d/%d (approx)\r", t, secret_count);
        }

        // Merge local histogram into the shared stats
#pragma omp critical
        {
            for (int i = 1; i <= MAX_SIM_GUESSES; i++) stats.guess_distribution[i] += local_distribution[i];
            if (local_worst > stats.worst_game) stats.worst_game = local_worst;
        }
    }

    // --- PHASE 3: FINALIZE STATS ---
    time_t end_time = time(NULL);
    stats.time_taken = difftime(end_time, start_time);

    if (stats.wins > 0) stats.average_guesses = (double)stats.total_guesses / stats.wins;
    else stats.average_guesses = 0.0;
    if (secret_count > 0) stats.win_percent = ((double)stats.wins / secret_count) * 100.0;

    printf("    Finished. Wins: %d (%.2f%%) Avg: %.4f Worst: %d\n", stats.wins, stats.win_percent, stats.average_guesses, stats.worst_game);
    return stats;
}

/*
 * FUNCTION: run_monte_carlo_simulation
 *
 * WHAT:
 * The Tournament Director. Runs each roster entry over the full universe
 * and prints the final comparison table.
 */
void run_monte_carlo_simulation(const number_t* p_universe, int universe_count,
    const int* p_roster, int roster_size)
{
    printf("\n=============================================\n");
    printf("   STARTING TOURNAMENT\n");
    printf("   Targeting %d secrets, %d strategies.\n", universe_count, roster_size);
    printf("   (Parallel Processing Enabled, %d threads)\n", omp_get_max_threads());
    printf("=============================================\n\n");

    if (roster_size <= 0) { printf("Empty roster, nothing to simulate.\n"); return; }

    SimStats* results = (SimStats*)malloc(sizeof(SimStats) * roster_size);
    if (results == NULL) { printf("Failed to allocate memory.\n"); return; }

    // Run the simulations
    for (int i = 0; i < roster_size; ++i)
    {
        int strat_idx = p_roster[i];
        results[i] = run_guess_strategy(&ALL_STRATEGIES[strat_idx], p_universe, universe_count, p_universe, universe_count);
    }

    // --- FINAL REPORT ---
    printf("\n\n=====================================================================================\n");
    printf("                               FINAL TOURNAMENT RESULTS                          \n");
    printf("=====================================================================================\n");
    printf("| %-30s | %-5s | %-6s | %-10s | %-11s | %-5s | %-8s |\n", "STRATEGY", "WINS", "LOSSES", "WIN %", "AVG GUESSES", "WORST", "TIME (s)");
    printf("|--------------------------------|-------|--------|------------|-------------|-------|----------|\n");

    int best_idx = -1;
    double best_avg = 100.0;
    double best_win = -1.0;

    // Print Rows and Determine Winner
    for (int i = 0; i < roster_size; i++)
    {
        printf("| %-30s | %-5d | %-6d | %9.2f%% | %11.4f | %5d | %8.2f |\n",
            results[i].strategy_name,
            results[i].wins,
            results[i].losses,
            results[i].win_percent,
            results[i].average_guesses,
            results[i].worst_game,
            results[i].time_taken);

        // Winner Logic: Highest Win % First, Lowest Average Second
        if (results[i].win_percent > best_win)
        {
            best_win = results[i].win_percent; best_idx = i; best_avg = results[i].average_guesses;
        }
        else if (results[i].win_percent == best_win && results[i].average_guesses < best_avg)
        {
            best_avg = results[i].average_guesses; best_idx = i;
        }
    }
    printf("=====================================================================================\n");

    if (best_idx >= 0)
    {
        printf("\n*** TOURNAMENT CHAMPION: %s ***\n", results[best_idx].strategy_name);
        printf("\n--- Detailed Distribution for Champion ---\n");
        print_distribution(&results[best_idx]);
    }

    free(results);
}
