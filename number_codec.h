/*
 * FILE: number_codec.h
 *
 * WHAT:
 * Defines the interface for building and parsing Numbers and Feedback.
 * This module is responsible for:
 * 1. Generating the universe of 5,040 valid numbers.
 * 2. Converting raw user text into validated number_t / feedback_t records.
 * 3. Small helpers (validity, equality, numeric code) shared by the engine.
 *
 * WHY:
 * Every other layer assumes well-formed numbers (4 distinct digits with a
 * correct digit mask). Keeping construction and validation in one place
 * means the Oracle can reject bad input with a single check.
 */

#pragma once
#ifndef NUMBER_CODEC_H
#define NUMBER_CODEC_H
#include "bulls_cows_types.h"

/*
 * CONSTANT: NUMBER_CODE_LIMIT
 *
 * One past the largest numeric code (9876). Sizes lookup tables indexed
 * by number_to_code.
 */
const int NUMBER_CODE_LIMIT = 10000;

/*
 * FUNCTION: number_from_string
 *
 * WHAT:
 * Parses exactly NUMBER_LENGTH characters of text into a number_t.
 * Surrounding whitespace is ignored.
 *
 * RETURNS:
 * - true if the text is 4 digits with no digit repeated.
 * - false otherwise (p_number is left untouched).
 */
bool number_from_string(const char* text, number_t* p_number);

/*
 * FUNCTION: number_is_valid
 *
 * WHAT:
 * Checks that a record holds 4 distinct ASCII digits, is NUL terminated,
 * and that its cached digit mask matches the digits.
 */
bool number_is_valid(const number_t* p_number);

bool numbers_equal(const number_t* p_a, const number_t* p_b);

/*
 * FUNCTION: number_to_code
 *
 * WHAT:
 * The number read as a base-10 integer ("0123" -> 123). Codes are unique
 * per number and lie in [0, NUMBER_CODE_LIMIT).
 */
int number_to_code(const number_t* p_number);

/*
 * FUNCTION: build_number_universe
 *
 * WHAT:
 * Allocates and fills the array of all UNIVERSE_SIZE valid numbers in
 * ascending order (0123, 0124, ..., 9876).
 *
 * PARAMETERS:
 * - pp_universe: Output. Will point to the new array. Caller frees it.
 * - p_count: Output. Will hold UNIVERSE_SIZE.
 *
 * RETURNS:
 * - true on success, false if memory allocation fails.
 */
bool build_number_universe(number_t** pp_universe, int* p_count);

/*
 * FUNCTION: feedback_from_string
 *
 * WHAT:
 * Parses a hint typed by a user. Accepted forms:
 * - "1B2C" / "1b2c" (bulls then cows, letters in either case)
 * - "1 2" or "1,2"  (two integers)
 *
 * RETURNS:
 * - true if the text parses and describes a possible hint
 *   (bulls, cows >= 0 and bulls + cows <= NUMBER_LENGTH).
 * - false otherwise.
 */
bool feedback_from_string(const char* text, feedback_t* p_feedback);

#endif
