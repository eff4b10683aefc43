/*
 * FILE: game_session.h
 *
 * WHAT:
 * Defines one game of Bulls & Cows: the candidate engine, the secret (when
 * the computer holds one), and the history of turns played.
 *
 * WHY:
 * The engine only knows about candidates. A game also needs a secret to
 * score guesses against, and the console wants per-turn numbers ("how many
 * bits did that guess buy me?"). This module does that bookkeeping so
 * main.cpp only handles input and output.
 */

#pragma once
#ifndef GAME_SESSION_H
#define GAME_SESSION_H
#include "bulls_cows_types.h"
#include "candidate_engine.h"

/*
 * STRUCT: turn_record_t
 *
 * WHAT:
 * Everything the console prints about one turn.
 * - information_gained = uncertainty_before - uncertainty_after.
 *   When the turn emptied the set, uncertainty_after and
 *   information_gained are 0.
 */
typedef struct _turn_record
{
    number_t guess;
    feedback_t feedback;
    int candidates_before;
    int candidates_after;
    double uncertainty_before;
    double uncertainty_after;
    double information_gained;
} turn_record_t;

/*
 * STRUCT: game_session_t
 *
 * WHAT:
 * - engine: this game's own candidate set.
 * - p_universe: all 5,040 numbers, for secret selection and explorer pools.
 * - secret / has_secret: the hidden number in Play mode. Unset in Solver
 *   Assistant mode, where someone else holds the secret.
 * - p_history: growable array of turn_count records.
 * - is_solved: set once a hint with 4 bulls is recorded.
 */
typedef struct _game_session
{
    candidate_engine_t engine;
    number_t* p_universe;
    int universe_count;
    number_t secret;
    bool has_secret;
    turn_record_t* p_history;
    int turn_count;
    int history_capacity;
    bool is_solved;
} game_session_t;

/*
 * FUNCTION: game_session_init
 *
 * RETURNS:
 * - true on success.
 * - false if memory allocation fails (nothing is left allocated).
 */
bool game_session_init(game_session_t* p_session);

void game_session_free(game_session_t* p_session);

/*
 * FUNCTION: game_session_choose_secret
 *
 * WHAT:
 * Picks the secret uniformly from the universe using a Mersenne Twister
 * seeded with `seed`. The same seed always gives the same secret.
 */
void game_session_choose_secret(game_session_t* p_session, unsigned int seed);

/*
 * FUNCTION: game_session_set_secret
 *
 * WHAT:
 * Uses a caller-chosen secret (replays and tests).
 *
 * RETURNS:
 * - false if the number is malformed; the session keeps its old secret.
 */
bool game_session_set_secret(game_session_t* p_session, const number_t* p_secret);

/*
 * FUNCTION: game_session_submit_guess
 *
 * WHAT:
 * Play mode turn: scores the guess against the held secret, then records
 * it with game_session_record_feedback.
 *
 * RETURNS:
 * - ENGINE_OK, with *p_record (optional) filled in.
 * - ENGINE_ERR_INVALID_NUMBER if the guess is malformed or no secret has
 *   been chosen. Nothing is recorded.
 */
engine_status_t game_session_submit_guess(game_session_t* p_session, const number_t* p_guess,
    turn_record_t* p_record);

/*
 * FUNCTION: game_session_record_feedback
 *
 * WHAT:
 * Records a guess and the hint it received: prunes the engine, appends a
 * turn_record_t to the history and marks the game solved on 4 bulls.
 *
 * RETURNS:
 * - ENGINE_OK, with *p_record (optional) filled in.
 * - ENGINE_ERR_INVALID_NUMBER if the guess is malformed. Nothing recorded.
 * - ENGINE_ERR_EMPTY_CANDIDATE_SET if the set was already empty (nothing
 *   recorded) or this hint emptied it (the turn is recorded). Either way
 *   the hints so far contradict each other.
 * - ENGINE_ERR_OUT_OF_MEMORY if the history cannot grow (the engine has
 *   still been pruned).
 */
engine_status_t game_session_record_feedback(game_session_t* p_session, const number_t* p_guess,
    const feedback_t* p_observed, turn_record_t* p_record);

#endif
