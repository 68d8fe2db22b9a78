
#ifndef REGEX_MATCH_H_
#define REGEX_MATCH_H_

#include "Types.h"
#include "RegexCommon.h"
#include "RegexOpcodes.h"
#include "RegexOptions.h"
#include <vector>

class Regex;

/* The outcome of one successful match: the span of the whole match and of
   every capturing group. Groups that did not take part are invalid spans. */
class MatchResult {
	friend class RegexMatch;
public:
	MatchResult() {
	}

public:
	bool isValid() const {
		return !spans_.empty() && spans_[0].isValid();
	}

	// Number of capturing groups, not counting the whole match.
	int groupCount() const {
		return spans_.empty() ? 0 : static_cast<int>(spans_.size()) - 1;
	}

	// Group 0 is the whole match.
	Span span(int group = 0) const {
		if (group < 0 || static_cast<size_t>(group) >= spans_.size()) {
			return Span();
		}
		return spans_[group];
	}

	// A zero length match.
	bool isEmpty() const {
		return isValid() && spans_[0].isEmpty();
	}

	bool hasGroup(int group) const {
		return span(group).isValid();
	}

	Position start() const {
		return span(0).start;
	}

	Position end() const {
		return span(0).end;
	}

private:
	std::vector<Span> spans_;
};

/* Matching state for one compiled Regex. Not thread safe; use one RegexMatch
   per thread, they can all share the same Regex. */
class RegexMatch {
public:
	explicit RegexMatch(const Regex *regex);
	RegexMatch(const Regex *regex, unsigned long stepLimit);

private:
	RegexMatch(const RegexMatch &) = delete;
	RegexMatch &operator=(const RegexMatch &) = delete;

public:
	/**
	 * @brief ExecRE - Find the leftmost match starting at or after 'from'.
	 * @param string - Text to search, as code points.
	 * @param length - Number of code points in 'string'.
	 * @param range - Part of 'string' a match must lie within.
	 * @param from - First start position to try, inside 'range'.
	 * @param options - Anchoring and bounds behaviour for this call.
	 * @return true if a match was found, see result()
	 * @throws StepLimitExceeded when an attempt runs out of steps.
	 */
	bool ExecRE(const char_type *string, Position length, Span range, Position from, MatchingOptions options = NoMatchingOptions);

	// Same as ExecRE but the match has to start exactly at 'at'.
	bool matchAt(const char_type *string, Position length, Span range, Position at, MatchingOptions options = NoMatchingOptions) {
		return ExecRE(string, length, range, at, options | Anchored);
	}

public:
	const MatchResult &result() const {
		return result_;
	}

	// Backtracking steps allowed per attempt, 0 for no limit.
	unsigned long stepLimit() const {
		return stepLimit_;
	}

	void setStepLimit(unsigned long limit) {
		stepLimit_ = limit;
	}

private:
	struct Frame {
		enum Kind : uint8_t {
			Choice,         // Resume at 'pc' with 'pos'
			Repeat,         // REPEAT at 'pc' started at 'pos' and matched 'count' times
			RestoreOpen,    // Group 'pc' opened at 'pos' before
			RestoreCapture, // Group 'pc' held 'saved' before
			RestoreMark     // Loop slot 'pc' held 'pos' before
		};

		Kind     kind;
		int      pc;
		Position pos;
		int      count;
		Span     saved;
	};

private:
	bool attempt(Position at);
	bool match(int pc, Position pos, size_t base, Position target, Position *end);
	bool backtrack(size_t base, int *pc, Position *pos);
	void unwind(size_t base);
	void discardChoices(size_t base);
	void push(Frame::Kind kind, int pc, Position pos, int count = 0, Span saved = Span());
	void step(Position at);

private:
	bool matchOne(const RegexInstruction &in, char_type c) const;
	bool atLineStart(Position pos, uint8_t flags) const;
	bool atLineEnd(Position pos, uint8_t flags) const;
	bool atWordBoundary(Position pos) const;

private:
	const Regex *const regex_;
	unsigned long      stepLimit_;
	unsigned long      steps_;       // Backtracking steps taken by the current attempt

	const char_type *  text_;
	Position           rangeEnd_;    // Matches may not extend past this
	Position           endLimit_;    // Current limit for consuming code points
	Position           lookStart_;   // Look-around and \b can see [lookStart_, lookEnd_)
	Position           lookEnd_;
	Position           anchorStart_; // Where \A and '^' match
	Position           anchorEnd_;   // Where \z and '$' match

	std::vector<Frame>    stack_;    // Backtracking stack
	std::vector<Span>     captures_; // Last completed text of each group
	std::vector<Position> openp_;    // Where each group was last opened
	std::vector<Position> marks_;    // LOOP_MARK slots

	MatchResult           result_;
};

#endif
