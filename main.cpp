/*
 * PROJECT: Bulls & Cows Entropy Solver & Simulation Engine
 *
 * ARCHITECTURE OVERVIEW:
 * The application is split into layers:
 *
 * 1. Data Layer: number_codec builds the universe of 5,040 numbers with
 * distinct digits and parses user input into numbers and hints.
 * 2. Logic Layer: the Feedback Oracle (bulls & cows rules), the Entropy
 * Calculator (Shannon entropy of a guess) and the Candidate Engine (the set
 * of numbers still consistent with every hint).
 * 3. Strategy Layer: GuessStrategyConfig entries describe how a bot picks
 * its guess (which pool, which opener). The console and the tournament
 * share the same registry.
 *
 * MODES:
 * - Play: the computer hides a secret, you guess, the solver offers hints.
 * - Solver Assistant: someone else holds the secret; you type the guess you
 *   played and the hint you got, the solver narrows the candidates.
 * - Tournament: every strategy plays all 5,040 secrets.
 *
 * HINT FORMAT (Solver Assistant):
 * "1B2C" (1 bull, 2 cows) or two numbers "1 2".
 */

#include "bulls_cows_types.h"
#include "number_codec.h"
#include "feedback_oracle.h"
#include "candidate_engine.h"
#include "solver_logic.h"
#include "guess_strategies.h"
#include "game_session.h"
#include "monte_carlo.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <ctype.h>
#include <time.h>

 // CONSTANTS: Display formatting limits
const int TOP_GUESSES_TO_PRINT = 10;
const int TOTAL_TABLE_WIDTH = 60;
const char* SEPARATOR_TEMPLATE = "------------------------------------------------------------------------------------------";

typedef enum _game_mode
{
    GAME_MODE_PLAY = 1,
    GAME_MODE_ASSISTANT = 2,
    GAME_MODE_TOURNAMENT = 3
} game_mode_t;

// GLOBALS: Runtime configuration chosen at startup
static game_mode_t g_game_mode = GAME_MODE_PLAY;
static int g_strategy_index = DEFAULT_STRATEGY_INDEX;

/*
 * FUNCTION: clear_input_buffer
 *
 * WHAT:
 * Flushes the rest of the current line from stdin.
 *
 * WHY:
 * If the user types more characters than the buffer holds, the leftovers
 * would be consumed by the next prompt and skip it.
 */
static void clear_input_buffer() { int c; while ((c = getchar()) != '\n' && c != EOF) {} }

/*
 * FUNCTION: read_line
 *
 * WHAT:
 * Prints a prompt and reads one line into `buffer` without its newline.
 *
 * RETURNS:
 * - false on end of input (Ctrl+D / closed pipe).
 */
static bool read_line(const char* prompt, char* buffer, int size)
{
    printf("%s", prompt);
    fflush(stdout);
    if (fgets(buffer, size, stdin) == NULL) return false;

    size_t len = strlen(buffer);
    if (len > 0 && buffer[len - 1] == '\n') buffer[len - 1] = '\0';
    else if (!feof(stdin)) clear_input_buffer();
    return true;
}

static bool is_quit_command(const char* text)
{
    return (text[0] == 'q' || text[0] == 'Q') && text[1] == '\0';
}

/*
 * FUNCTION: print_top_guesses_table
 *
 * WHAT:
 * Prints the best guesses of the pool, ranked by expected information.
 * The C column marks guesses that could still be the secret.
 */
static void print_top_guesses_table(const scored_guess_t* p_top, int count, int candidate_count)
{
    printf("\n%*s## Top %d Guesses (of %d candidates left) ##\n", 8, "", count, candidate_count);
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);
    printf("| %3s | %6s | %12s | %1s |\n", "#", "GUESS", "ENTROPY", "C");
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);
    for (int i = 0; i < count; ++i)
    {
        printf("| %3d | %6s | %12.4f | %1s |\n", i + 1, p_top[i].guess.digits, p_top[i].entropy, p_top[i].is_candidate ? "Y" : "N");
    }
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);
}

/*
 * FUNCTION: print_recommendations_box
 *
 * WHAT:
 * Renders the Top Choices box (Best Consistent vs Best Explorer) and
 * highlights the guess the active strategy would play.
 *
 * WHY:
 * The explorer guess often carries more information but can never win on
 * the spot. Showing both lets the user decide.
 */
static void print_recommendations_box(const recommendations_array_t recommendations, const number_t* p_pick, double pick_entropy)
{
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);
    for (int i = 0; i < MAX_RECOMMENDATIONS; ++i)
    {
        const guess_recommendation_t* r = &recommendations[i];
        printf("| %-16s: %s  H=%.4f bits  %-12s |\n", r->label, r->scored.guess.digits, r->scored.entropy, r->scored.is_candidate ? "(candidate)" : "(eliminated)");
    }
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);

    char pick_str[100];
    snprintf(pick_str, sizeof(pick_str), ">>> RECOMMENDED (%s): %s (H=%.4f) <<<", ALL_STRATEGIES[g_strategy_index].name, p_pick->digits, pick_entropy);
    printf("%s\n", pick_str);
    printf("%.*s\n", TOTAL_TABLE_WIDTH, SEPARATOR_TEMPLATE);
}

/*
 * FUNCTION: analyze_and_recommend
 *
 * WHAT:
 * The "Reporting" phase of a turn: ranks the universe, fills the Top
 * Choices box, asks the active strategy for its pick and prints all three.
 *
 * RETURNS:
 * - ENGINE_OK with *p_pick set to the strategy's guess.
 * - the engine error otherwise (the caller reports it).
 */
static engine_status_t analyze_and_recommend(const game_session_t* p_session, number_t* p_pick)
{
    const candidate_engine_t* p_engine = &p_session->engine;
    scored_guess_t top[TOP_GUESSES_TO_PRINT];
    int top_count = 0;
    recommendations_array_t recommendations;
    double pick_entropy = 0.0;

    printf("    [AI is thinking... scanning %d guesses against %d candidates]\n", p_session->universe_count, candidate_engine_count(p_engine));

    engine_status_t status = get_top_guess_candidates(p_engine, p_session->p_universe, p_session->universe_count, top, TOP_GUESSES_TO_PRINT, &top_count);
    if (status != ENGINE_OK) return status;

    status = get_best_guess_candidates(p_engine, p_session->p_universe, p_session->universe_count, recommendations);
    if (status != ENGINE_OK) return status;

    status = choose_next_guess(p_engine, &ALL_STRATEGIES[g_strategy_index], p_session->p_universe, p_session->universe_count, p_pick, &pick_entropy);
    if (status != ENGINE_OK) return status;

    print_top_guesses_table(top, top_count, candidate_engine_count(p_engine));
    print_recommendations_box(recommendations, p_pick, pick_entropy);
    return ENGINE_OK;
}

/*
 * FUNCTION: print_turn_header
 *
 * WHAT:
 * Prints the turn number, the current uncertainty and the candidate count.
 *
 * RETURNS:
 * - false if the candidate set is empty (contradiction).
 */
static bool print_turn_header(const game_session_t* p_session)
{
    double uncertainty = 0.0;
    if (candidate_engine_uncertainty(&p_session->engine, &uncertainty) != ENGINE_OK)
    {
        printf("Error: No candidates remaining. Contradiction detected, aborting game.\n");
        return false;
    }

    printf("\n--- Turn %d ---\n", p_session->turn_count + 1);
    printf("Current State Entropy (Uncertainty): %.4f bits\n", uncertainty);
    printf("Remaining possible numbers: %d\n", candidate_engine_count(&p_session->engine));
    return true;
}

/*
 * FUNCTION: print_turn_outcome
 *
 * WHAT:
 * Reports how much a recorded turn narrowed the search, or the
 * contradiction if it emptied the candidate set.
 *
 * RETURNS:
 * - false when the game cannot continue.
 */
static bool print_turn_outcome(engine_status_t status, const turn_record_t* p_turn)
{
    if (status == ENGINE_ERR_EMPTY_CANDIDATE_SET)
    {
        printf("Error: No candidates remaining. Did you make a mistake? Aborting game.\n");
        return false;
    }
    if (status != ENGINE_OK)
    {
        printf("Error: %s\n", engine_status_to_string(status));
        return false;
    }

    printf("Information Gained: %.4f bits (%d -> %d candidates)\n", p_turn->information_gained, p_turn->candidates_before, p_turn->candidates_after);
    return true;
}

/*
 * FUNCTION: run_play_mode
 *
 * WHAT:
 * The core gameplay loop against a computer-held secret:
 * 1. Show the current uncertainty.
 * 2. Offer a hint.
 * 3. Read and validate a guess.
 * 4. Score it, prune the candidates, report the information gained.
 */
static void run_play_mode(game_session_t* p_session)
{
    char buffer[100];

    printf("=========================================\n");
    printf("   BULLS AND COWS: ENTROPY EDITION\n");
    printf("=========================================\n");
    printf("Rules: Guess the 4-digit number (unique digits).\n");
    printf("Goal: Minimize uncertainty (Entropy) to 0 bits.\n");

    game_session_choose_secret(p_session, (unsigned int)time(NULL));

    while (1)
    {
        // 1. Display Current Uncertainty
        if (!print_turn_header(p_session)) break;

        // 2. Offer AI Hint
        if (!read_line("Would you like an Entropy-based AI hint? (y/n): ", buffer, sizeof(buffer))) break;
        if (tolower((unsigned char)buffer[0]) == 'y')
        {
            number_t pick;
            engine_status_t status = analyze_and_recommend(p_session, &pick);
            if (status != ENGINE_OK) { printf("Error: %s\n", engine_status_to_string(status)); break; }
        }

        // 3. User Guess
        if (!read_line("Enter your guess (or 'q' to quit): ", buffer, sizeof(buffer))) break;
        if (is_quit_command(buffer)) { printf("The secret was %s.\n", p_session->secret.digits); break; }

        number_t guess;
        if (!number_from_string(buffer, &guess))
        {
            printf("Invalid input! Must be 4 unique digits.\n");
            continue;
        }

        // 4. Feedback
        turn_record_t turn;
        engine_status_t status = game_session_submit_guess(p_session, &guess, &turn);
        if (status == ENGINE_ERR_INVALID_NUMBER) { printf("Invalid input! Must be 4 unique digits.\n"); continue; }
        printf("Result: %d Bulls, %d Cows\n", turn.feedback.bulls, turn.feedback.cows);

        if (p_session->is_solved)
        {
            printf("\nCONGRATULATIONS! You found the secret %s.\n", p_session->secret.digits);
            printf("Total guesses: %d\n", p_session->turn_count);
            break;
        }

        // 5. Show information gain
        if (!print_turn_outcome(status, &turn)) break;
    }
}

/*
 * FUNCTION: run_solver_assistant_mode
 *
 * WHAT:
 * Helper loop for a game played elsewhere:
 * 1. Recommend a guess.
 * 2. Read the guess actually played (Enter = the recommendation).
 * 3. Read the hint received and prune.
 *
 * WHY:
 * Here a human reports the hints, so a typo can make them contradict each
 * other. The engine then runs out of candidates and we stop instead of
 * recommending nonsense.
 */
static void run_solver_assistant_mode(game_session_t* p_session)
{
    char buffer[100];

    printf("=========================================\n");
    printf("   BULLS AND COWS: SOLVER ASSISTANT\n");
    printf("=========================================\n");
    printf("Type the guess you played and the hint you got (e.g. '1B2C' or '1 2').\n");

    while (!p_session->is_solved)
    {
        if (!print_turn_header(p_session)) break;

        if (candidate_engine_count(&p_session->engine) == 1)
        {
            printf("The secret must be %s.\n", candidate_engine_candidates(&p_session->engine)[0].digits);
        }

        number_t pick;
        engine_status_t status = analyze_and_recommend(p_session, &pick);
        if (status != ENGINE_OK) { printf("Error: %s\n", engine_status_to_string(status)); break; }

        // 1. The guess that was played
        number_t guess;
        if (!read_line("Enter the guess you played (Enter = recommended, 'q' to quit): ", buffer, sizeof(buffer))) break;
        if (is_quit_command(buffer)) break;
        if (buffer[0] == '\0') guess = pick;
        else if (!number_from_string(buffer, &guess))
        {
            printf("Invalid input! Must be 4 unique digits.\n");
            continue;
        }

        // 2. The hint it received
        feedback_t feedback;
        while (1)
        {
            if (!read_line("Enter the result (e.g. '1B2C' or '1 2'): ", buffer, sizeof(buffer))) return;
            if (feedback_from_string(buffer, &feedback)) break;
            printf("Invalid result! Use bulls and cows with bulls + cows <= 4.\n");
        }

        turn_record_t turn;
        status = game_session_record_feedback(p_session, &guess, &feedback, &turn);
        if (p_session->is_solved)
        {
            printf("\n*** SOLVED: %s IN %d GUESSES! ***\n", guess.digits, p_session->turn_count);
            break;
        }
        if (!print_turn_outcome(status, &turn)) break;
    }
}

/*
 * FUNCTION: run_tournament_mode
 *
 * WHAT:
 * Runs the Monte Carlo tournament on the roster below.
 */
static void run_tournament_mode(const game_session_t* p_session)
{
    // --- MASTER ROSTER MENU ---
    // 0: Entropy Consistent (0123)  [DEFAULT]
    // 1: Entropy Consistent (Full)
    // 2: Entropy Explorer (0123)
    // 3: Entropy Explorer (Pure)
    // 4: First Candidate (Baseline)
    int active_roster[] = {
        0
        ,2
        ,4
    };
    int roster_size = sizeof(active_roster) / sizeof(active_roster[0]);

    run_monte_carlo_simulation(p_session->p_universe, p_session->universe_count, active_roster, roster_size);
}

/*
 * FUNCTION: get_game_setup_input
 *
 * WHAT:
 * Prompts the user for the runtime configuration:
 * 1. Mode (Play / Solver Assistant / Tournament).
 * 2. Hint strategy (ignored by the tournament, which uses its roster).
 *
 * RETURNS:
 * - false on end of input.
 */
static bool get_game_setup_input()
{
    char buffer[100];

    if (!read_line("\nSelect mode: [1] Play  [2] Solver Assistant  [3] Tournament (Default: 1): ", buffer, sizeof(buffer))) return false;
    if (buffer[0] == '2') { g_game_mode = GAME_MODE_ASSISTANT; printf("Solver initialized for SOLVER ASSISTANT mode.\n"); }
    else if (buffer[0] == '3') { g_game_mode = GAME_MODE_TOURNAMENT; printf("Solver initialized for TOURNAMENT mode.\n"); }
    else { g_game_mode = GAME_MODE_PLAY; printf("Solver initialized for PLAY mode.\n"); }

    if (g_game_mode == GAME_MODE_TOURNAMENT) return true;

    printf("\nAvailable hint strategies:\n");
    for (int i = 0; i < TOTAL_DEFINED_STRATEGIES; ++i) printf("  [%d] %s\n", i, ALL_STRATEGIES[i].name);
    char prompt[64];
    snprintf(prompt, sizeof(prompt), "Select hint strategy (Default: %d): ", DEFAULT_STRATEGY_INDEX);
    if (!read_line(prompt, buffer, sizeof(buffer))) return false;

    g_strategy_index = DEFAULT_STRATEGY_INDEX;
    if (buffer[0] != '\0')
    {
        int chosen = atoi(buffer);
        if (isdigit((unsigned char)buffer[0]) && chosen >= 0 && chosen < TOTAL_DEFINED_STRATEGIES) g_strategy_index = chosen;
        else printf("Unknown strategy '%s', using the default.\n", buffer);
    }
    printf("Hint strategy: %s\n", ALL_STRATEGIES[g_strategy_index].name);
    return true;
}

/*
 * FUNCTION: main
 *
 * WHAT:
 * The application entry point.
 * 1. Gets the runtime configuration.
 * 2. Creates the game session (engine + universe).
 * 3. Launches the selected mode.
 * 4. Cleans up on exit.
 */
int main(int argc, char* argv[])
{
    if (!get_game_setup_input()) return 0;

    game_session_t session;
    if (!game_session_init(&session))
    {
        printf("Failed to allocate memory.\n");
        return -1;
    }

    switch (g_game_mode)
    {
    case GAME_MODE_ASSISTANT:  run_solver_assistant_mode(&session); break;
    case GAME_MODE_TOURNAMENT: run_tournament_mode(&session); break;
    case GAME_MODE_PLAY:
    default:                   run_play_mode(&session); break;
    }

    game_session_free(&session);
    return 0;
}
