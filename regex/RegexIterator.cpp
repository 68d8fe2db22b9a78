
#include "RegexIterator.h"
#include "Regex.h"
#include <algorithm>

//------------------------------------------------------------------------------
// Name: RegexIterator
//------------------------------------------------------------------------------
RegexIterator::RegexIterator(const Regex *regex, const char_type *text, Position length, Span range, MatchingOptions options)
	: RegexIterator(regex, text, length, range, options, Regex::DefaultStepLimit()) {
}

//------------------------------------------------------------------------------
// Name: RegexIterator
//------------------------------------------------------------------------------
RegexIterator::RegexIterator(const Regex *regex, const char_type *text, Position length, Span range, MatchingOptions options, unsigned long stepLimit)
	: matcher_(regex, stepLimit), text_(text), length_(length), range_(range), options_(options), cursor_(range.start) {
}

//------------------------------------------------------------------------------
// Name: next
//------------------------------------------------------------------------------
bool RegexIterator::next(MatchResult *match) {

	if (cursor_ > range_.end) {
		return false;
	}

	if (!matcher_.ExecRE(text_, length_, range_, cursor_, options_)) {
		cursor_ = range_.end + 1;
		return false;
	}

	*match  = matcher_.result();
	cursor_ = std::max(match->end(), match->start() + 1);
	return true;
}

//------------------------------------------------------------------------------
// Name: reset
//------------------------------------------------------------------------------
void RegexIterator::reset() {
	cursor_ = range_.start;
}
