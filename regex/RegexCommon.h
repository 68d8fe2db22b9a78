
#ifndef REGEX_COMMON_H_
#define REGEX_COMMON_H_

#include "Types.h"
#include <cstdint>
#include <cstddef>
#include <climits>

/* Largest count accepted in a {m,n} quantifier. */
#define REG_MAX_COUNT 65535UL

/* Marks an unbounded maximum in {m,} constructs and for '*' and '+'. */
#define REG_INFINITY (-1)

/* Number of capturing parentheses allowed. */
#define NSUBEXP 1000

/* Largest number of instructions a compiled regex can hold. */
const size_t MaxProgramSize = 1000000UL;

/* Maximum nesting depth of groups while parsing. */
const int MaxNestingDepth = 250;

/* Unicode helpers. Case folding and character categories come from the
 * QChar tables of the linked QtCore. */
char_type foldCase(char_type c);
bool equalsIgnoringCase(char_type a, char_type b);

bool isLineTerminator(char_type c, bool unixLines);
bool isWordChar(char_type c);
bool isDigitChar(char_type c);
bool isSpaceChar(char_type c);
bool isHorizontalSpace(char_type c);
bool isVerticalSpace(char_type c);

#endif
