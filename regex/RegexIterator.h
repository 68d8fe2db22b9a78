
#ifndef REGEX_ITERATOR_H_
#define REGEX_ITERATOR_H_

#include "RegexMatch.h"
#include "RegexOptions.h"
#include "Types.h"

class Regex;

/* Walks the successive non-overlapping matches of a Regex in a text. After a
 * match the search continues at its end, or one code point further on when
 * the match was empty, so the walk always terminates. */
class RegexIterator {
public:
	RegexIterator(const Regex *regex, const char_type *text, Position length, Span range, MatchingOptions options = NoMatchingOptions);
	RegexIterator(const Regex *regex, const char_type *text, Position length, Span range, MatchingOptions options, unsigned long stepLimit);

private:
	RegexIterator(const RegexIterator &) = delete;
	RegexIterator &operator=(const RegexIterator &) = delete;

public:
	/* Stores the next match in 'match'. Returns false once there are no
	   more. May throw StepLimitExceeded. */
	bool next(MatchResult *match);

	// Starts over at the beginning of the range.
	void reset();

	Position cursor() const {
		return cursor_;
	}

private:
	RegexMatch       matcher_;
	const char_type *text_;
	Position         length_;
	Span             range_;
	MatchingOptions  options_;
	Position         cursor_;
};

#endif
