/*
 * FILE: game_session.cpp
 *
 * WHAT:
 * Implements the per-game bookkeeping around the Candidate Engine: secret
 * selection, scoring real guesses, and the turn history.
 */

#include "game_session.h"
#include "feedback_oracle.h"
#include "number_codec.h"
#include <stdio.h>
#include <string.h>
#include <random>

const int INITIAL_HISTORY_CAPACITY = 8;

bool game_session_init(game_session_t* p_session)
{
    memset(p_session, 0, sizeof(game_session_t));

    if (!candidate_engine_init(&p_session->engine)) return false;

    if (!build_number_universe(&p_session->p_universe, &p_session->universe_count))
    {
        candidate_engine_free(&p_session->engine);
        return false;
    }
    return true;
}

void game_session_free(game_session_t* p_session)
{
    candidate_engine_free(&p_session->engine);
    if (p_session->p_universe != NULL) free(p_session->p_universe);
    if (p_session->p_history != NULL) free(p_session->p_history);
    p_session->p_universe = NULL;
    p_session->p_history = NULL;
    p_session->universe_count = 0;
    p_session->turn_count = 0;
    p_session->history_capacity = 0;
}

void game_session_choose_secret(game_session_t* p_session, unsigned int seed)
{
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, p_session->universe_count - 1);

    p_session->secret = p_session->p_universe[dist(rng)];
    p_session->has_secret = true;
}

bool game_session_set_secret(game_session_t* p_session, const number_t* p_secret)
{
    if (!number_is_valid(p_secret)) return false;

    p_session->secret = *p_secret;
    p_session->has_secret = true;
    return true;
}

engine_status_t game_session_submit_guess(game_session_t* p_session, const number_t* p_guess,
    turn_record_t* p_record)
{
    if (!p_session->has_secret) return ENGINE_ERR_INVALID_NUMBER;

    feedback_t feedback;
    engine_status_t status = evaluate_feedback(&p_session->secret, p_guess, &feedback);
    if (status != ENGINE_OK) return status;

    return game_session_record_feedback(p_session, p_guess, &feedback, p_record);
}

/*
 * FUNCTION: append_turn
 *
 * WHAT:
 * Appends a record to the history, doubling the buffer when it is full.
 */
static bool append_turn(game_session_t* p_session, const turn_record_t* p_turn)
{
    if (p_session->turn_count == p_session->history_capacity)
    {
        int new_capacity = (p_session->history_capacity == 0) ? INITIAL_HISTORY_CAPACITY : p_session->history_capacity * 2;
        turn_record_t* ptr = (turn_record_t*)realloc(p_session->p_history, sizeof(turn_record_t) * new_capacity);
        if (ptr == NULL)
        {
            printf("Failed to allocate memory.\n");
            return false;
        }
        p_session->p_history = ptr;
        p_session->history_capacity = new_capacity;
    }

    p_session->p_history[p_session->turn_count++] = *p_turn;
    return true;
}

/*
 * FUNCTION: game_session_record_feedback
 *
 * WHAT:
 * 1. Measure the uncertainty before the hint.
 * 2. Prune the engine with the hint.
 * 3. Measure again and store the difference as the information gained.
 * 4. Append to the history; flag the game solved on 4 bulls.
 */
engine_status_t game_session_record_feedback(game_session_t* p_session, const number_t* p_guess,
    const feedback_t* p_observed, turn_record_t* p_record)
{
    if (!number_is_valid(p_guess)) return ENGINE_ERR_INVALID_NUMBER;

    turn_record_t turn;
    turn.guess = *p_guess;
    turn.feedback = *p_observed;
    turn.candidates_before = candidate_engine_count(&p_session->engine);

    engine_status_t status = candidate_engine_uncertainty(&p_session->engine, &turn.uncertainty_before);
    if (status != ENGINE_OK) return status;

    status = candidate_engine_prune(&p_session->engine, p_guess, p_observed);
    if (status != ENGINE_OK) return status;

    turn.candidates_after = candidate_engine_count(&p_session->engine);
    engine_status_t after_status = candidate_engine_uncertainty(&p_session->engine, &turn.uncertainty_after);
    if (after_status == ENGINE_OK)
    {
        turn.information_gained = turn.uncertainty_before - turn.uncertainty_after;
    }
    else
    {
        turn.uncertainty_after = 0.0;
        turn.information_gained = 0.0;
    }

    if (feedback_is_solved(p_observed) && turn.candidates_after > 0) p_session->is_solved = true;

    if (p_record != NULL) *p_record = turn;
    if (!append_turn(p_session, &turn)) return ENGINE_ERR_OUT_OF_MEMORY;

    return after_status;
}
