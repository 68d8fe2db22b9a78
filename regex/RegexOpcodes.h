
#ifndef REGEX_OPCODES_H_
#define REGEX_OPCODES_H_

#include "RegexCommon.h"

enum RegexOpcodes : uint8_t {
	/* STRUCTURE FOR A REGULAR EXPRESSION (regex) 'PROGRAM'.
	 *
	 * A linear list of instructions for a backtracking machine. Execution
	 * starts at index 0 and falls through to the next instruction unless an
	 * instruction names another target. BRANCH pushes a choice point, so
	 * alternation, '?', '*' and friends are all built from BRANCH and JUMP.
	 * Look-around and atomic groups run their body to the matching CLOSE
	 * instruction as a separate sub-match.
	 *
	 * The opcodes are:
	 */

	END = 1, // End of program, the match succeeded.

	// Zero width positional assertions.
	BOL = 2,           // '^'
	EOL = 3,           // '$'
	BOT = 4,           // \A
	EOT = 5,           // \z
	EOT_OR_NL = 6,     // \Z, end of text or before a final line terminator
	WORD_BOUNDARY = 7, // \b
	NOT_BOUNDARY = 8,  // \B

	// Single code point matchers. These may be the operand of REPEAT.
	EXACTLY = 9, // Match 'ch'.
	ANY_OF = 10, // Match any code point in set 'x'.
	ANY = 11,    // Match any one code point but a line terminator ('.')
	EVERY = 12,  // Same as ANY but matches line terminators.

	// Repetition of the single code point matcher that follows. Continues
	// at the instruction after that operand. Counts are in 'min' and 'max'.
	REPEAT = 13,

	// Nodes used to build complex constructs.
	BRANCH = 15,     // Continue at 'x', on failure resume at 'y'
	JUMP = 16,       // Continue at 'x'
	LOOP_MARK = 17,  // Remember the position in loop slot 'min'
	LOOP_CHECK = 18, // Continue at 'x' if nothing was consumed since LOOP_MARK

	// Back Reference node.
	BACK_REF = 19, // Match latest matched text of group 'min'

	// Various nodes used to implement parenthetical constructs.
	AHEAD_OPEN = 20,   // Begin look ahead, body ends at LOOK_CLOSE, 'x' follows
	BEHIND_OPEN = 21,  // Begin look behind of 'min' to 'max' code points
	LOOK_CLOSE = 22,   // End look-around
	ATOMIC_OPEN = 23,  // Begin atomic group, body ends at ATOMIC_CLOSE, 'x' follows
	ATOMIC_CLOSE = 24, // End atomic group

	OPEN = 25,  // Open capturing group 'min'
	CLOSE = 26, // Close capturing group 'min'
};

// Modifiers stored in RegexInstruction::flags.
enum RegexInstructionFlag : uint8_t {
	CaseFold  = 0x01, // EXACTLY, ANY_OF, BACK_REF
	Multiline = 0x02, // BOL, EOL
	UnixLines = 0x04, // ANY, BOL, EOL, EOT_OR_NL
	Negated   = 0x08, // AHEAD_OPEN, BEHIND_OPEN
	Lazy      = 0x10, // REPEAT
	Possessive = 0x20 // REPEAT
};

struct RegexInstruction {
	explicit RegexInstruction(RegexOpcodes code) : op(code), flags(0), ch(0), x(-1), y(-1), min(0), max(0) {
	}

	RegexOpcodes op;
	uint8_t      flags;
	char_type    ch;  // EXACTLY
	int          x;   // Jump target, or char set index for ANY_OF
	int          y;   // Alternative target of BRANCH
	int          min; // Counts, group number or loop slot
	int          max; // REG_INFINITY when unbounded
};

#endif
