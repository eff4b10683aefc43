/*
 * FILE: number_codec.cpp
 *
 * WHAT:
 * Implements construction, validation and parsing of Numbers and Feedback.
 *
 * KEY RULES:
 * 1. A number is exactly 4 ASCII digits with no digit repeated.
 * 2. The digit mask is always computed here, never trusted from the caller.
 * 3. The universe is generated in ascending order, which every "first
 *    encountered wins" tie-break downstream relies on.
 */

#include "number_codec.h"
#include <stdio.h>
#include <string.h>
#include <ctype.h>

/*
 * FUNCTION: trim_bounds
 *
 * WHAT:
 * Finds the first and one-past-last non-whitespace characters of a string.
 *
 * WHY:
 * Input read with `fgets` keeps its newline, and users type stray spaces.
 * We skip them without modifying the caller's buffer.
 */
static void trim_bounds(const char* text, const char** pp_begin, const char** pp_end)
{
    const char* begin = text;
    while (*begin != '\0' && isspace((unsigned char)*begin)) begin++;

    const char* end = begin + strlen(begin);
    while (end > begin && isspace((unsigned char)*(end - 1))) end--;

    *pp_begin = begin;
    *pp_end = end;
}

/*
 * FUNCTION: compute_digit_mask
 *
 * WHAT:
 * Builds the 10-bit presence mask for a digit string. Returns 0 if a
 * character is not a digit or a digit repeats, which never happens for a
 * valid number (a valid number always has exactly 4 bits set).
 */
static unsigned short compute_digit_mask(const char* digits)
{
    unsigned short mask = 0;
    for (int i = 0; i < NUMBER_LENGTH; i++)
    {
        char ch = digits[i];
        if (ch < '0' || ch > '9') return 0;

        unsigned short bit = (unsigned short)(1u << (ch - '0'));
        if (mask & bit) return 0; // Repeated digit
        mask |= bit;
    }
    return mask;
}

bool number_from_string(const char* text, number_t* p_number)
{
    if (text == NULL || p_number == NULL) return false;

    const char* begin;
    const char* end;
    trim_bounds(text, &begin, &end);

    if (end - begin != NUMBER_LENGTH) return false;

    unsigned short mask = compute_digit_mask(begin);
    if (mask == 0) return false;

    memcpy(p_number->digits, begin, NUMBER_LENGTH);
    p_number->digits[NUMBER_LENGTH] = '\0';
    p_number->digit_mask = mask;
    return true;
}

bool number_is_valid(const number_t* p_number)
{
    if (p_number == NULL) return false;
    if (p_number->digits[NUMBER_LENGTH] != '\0') return false;

    unsigned short mask = compute_digit_mask(p_number->digits);
    return mask != 0 && mask == p_number->digit_mask;
}

bool numbers_equal(const number_t* p_a, const number_t* p_b)
{
    return memcmp(p_a->digits, p_b->digits, NUMBER_LENGTH) == 0;
}

int number_to_code(const number_t* p_number)
{
    int code = 0;
    for (int i = 0; i < NUMBER_LENGTH; i++) code = code * 10 + (p_number->digits[i] - '0');
    return code;
}

/*
 * FUNCTION: build_number_universe
 *
 * WHAT:
 * Enumerates every 4-digit string with distinct digits.
 *
 * LOGIC:
 * Four nested loops over 0-9 with "already used" checks. The loops run in
 * ascending order, so the output is sorted without an extra qsort.
 */
bool build_number_universe(number_t** pp_universe, int* p_count)
{
    *p_count = 0;
    *pp_universe = (number_t*)malloc(sizeof(number_t) * UNIVERSE_SIZE);
    if (*pp_universe == NULL)
    {
        fprintf(stderr, "Out of memory allocating number universe!\n");
        return false;
    }

    number_t* pNext = *pp_universe;
    for (int a = 0; a < DIGIT_COUNT; a++)
    {
        for (int b = 0; b < DIGIT_COUNT; b++)
        {
            if (b == a) continue;
            for (int c = 0; c < DIGIT_COUNT; c++)
            {
                if (c == a || c == b) continue;
                for (int d = 0; d < DIGIT_COUNT; d++)
                {
                    if (d == a || d == b || d == c) continue;

                    pNext->digits[0] = (char)('0' + a);
                    pNext->digits[1] = (char)('0' + b);
                    pNext->digits[2] = (char)('0' + c);
                    pNext->digits[3] = (char)('0' + d);
                    pNext->digits[NUMBER_LENGTH] = '\0';
                    pNext->digit_mask = (unsigned short)((1u << a) | (1u << b) | (1u << c) | (1u << d));
                    pNext++;
                }
            }
        }
    }

    *p_count = (int)(pNext - *pp_universe);
    return true;
}

/*
 * FUNCTION: feedback_from_string
 *
 * WHAT:
 * Accepts "<bulls>B<cows>C" or "<bulls> <cows>" (space or comma).
 *
 * WHY:
 * In Solver Assistant mode the user copies the hint from another game or
 * another person. Both the compact "1B2C" notation and plain numbers are
 * common, so we take either and reject anything ambiguous.
 */
bool feedback_from_string(const char* text, feedback_t* p_feedback)
{
    if (text == NULL || p_feedback == NULL) return false;

    const char* begin;
    const char* end;
    trim_bounds(text, &begin, &end);

    int values[2] = { -1, -1 };
    int found = 0;
    bool letter_form = false;
    const char* p = begin;

    while (p < end)
    {
        char ch = *p;
        if (isdigit((unsigned char)ch))
        {
            if (found == 2) return false;
            // "12" with no separator is ambiguous, and any two-digit value is out of range.
            if (p + 1 < end && isdigit((unsigned char)*(p + 1))) return false;
            values[found++] = ch - '0';

            // In letter form the digit must be followed by its letter.
            if (p + 1 < end)
            {
                char next = (char)toupper((unsigned char)*(p + 1));
                if (next == 'B' || next == 'C')
                {
                    if ((found == 1 && next != 'B') || (found == 2 && next != 'C')) return false;
                    // "1 2C" mixes the two notations.
                    if (found == 2 && !letter_form) return false;
                    letter_form = true;
                    p++;
                }
                else if (letter_form)
                {
                    return false;
                }
            }
            else if (letter_form)
            {
                return false; // "1B2" with no closing 'C'
            }
        }
        else if (ch == ' ' || ch == ',' || ch == '\t')
        {
            if (letter_form) return false;
        }
        else
        {
            return false;
        }
        p++;
    }

    if (found != 2) return false;
    if (values[0] + values[1] > NUMBER_LENGTH) return false;

    p_feedback->bulls = values[0];
    p_feedback->cows = values[1];
    return true;
}
