
#include "RegexMatch.h"
#include "Regex.h"
#include "RegexException.h"
#include <climits>
#include <QtDebug>

namespace {

int repeatLimit(int max) {
	return max == REG_INFINITY ? INT_MAX : max;
}

}

//------------------------------------------------------------------------------
// Name: RegexMatch
//------------------------------------------------------------------------------
RegexMatch::RegexMatch(const Regex *regex) : RegexMatch(regex, Regex::DefaultStepLimit()) {
}

//------------------------------------------------------------------------------
// Name: RegexMatch
//------------------------------------------------------------------------------
RegexMatch::RegexMatch(const Regex *regex, unsigned long stepLimit)
	: regex_(regex), stepLimit_(stepLimit), steps_(0), text_(nullptr), rangeEnd_(0), endLimit_(0), lookStart_(0), lookEnd_(0), anchorStart_(0), anchorEnd_(0) {
}

/*----------------------------------------------------------------------*
 * ExecRE
 *
 * Tries each start position from 'from' to the end of 'range' in turn
 * and stops at the first that matches. Invalid arguments are reported
 * through qDebug and simply don't match.
 *----------------------------------------------------------------------*/
bool RegexMatch::ExecRE(const char_type *string, Position length, Span range, Position from, MatchingOptions options) {

	result_ = MatchResult();

	try {
		if (!string && length != 0) {
			throw RegexException("NULL parameter to 'ExecRE'");
		}

		if (range.start < 0 || range.end > length || range.start > range.end || from < range.start || from > range.end) {
			throw RegexException("search range [%d, %d) from %d is invalid for a text of length %d", range.start, range.end, from, length);
		}

		text_       = string;
		rangeEnd_   = range.end;

		if (options.testFlag(WithTransparentBounds)) {
			lookStart_ = 0;
			lookEnd_   = length;
		} else {
			lookStart_ = range.start;
			lookEnd_   = range.end;
		}

		if (options.testFlag(WithoutAnchoringBounds)) {
			anchorStart_ = 0;
			anchorEnd_   = length;
		} else {
			anchorStart_ = range.start;
			anchorEnd_   = range.end;
		}

		if (options.testFlag(Anchored) || regex_->options().testFlag(AnchorAtMatchingStart)) {
			return attempt(from);
		}

		// A pattern starting with \A or '^' can only match in one place.
		if (regex_->anchor_) {
			return anchorStart_ >= from && anchorStart_ <= range.end && attempt(anchorStart_);
		}

		for (Position p = from; p <= range.end; ++p) {

			// Skip positions that cannot start a match.
			if (regex_->has_match_start_ && (p == range.end || text_[p] != regex_->match_start_)) {
				continue;
			}

			if (attempt(p)) {
				return true;
			}
		}

		return false;

	} catch (const StepLimitExceeded &e) {
		qDebug("Regex: %s", e.what());
		throw;
	} catch (const RegexException &e) {
		qDebug("Regex: %s", e.what());
		return false;
	}
}

/*----------------------------------------------------------------------*
 * attempt
 *
 * Try to match the whole program starting at 'at'. The step budget
 * covers a single attempt.
 *----------------------------------------------------------------------*/
bool RegexMatch::attempt(Position at) {

	const size_t groups = static_cast<size_t>(regex_->groupCount()) + 1;

	stack_.clear();
	captures_.assign(groups, Span());
	openp_.assign(groups, -1);
	marks_.assign(static_cast<size_t>(regex_->Num_Loops), -1);
	steps_    = 0;
	endLimit_ = rangeEnd_;

	Position end;
	if (!match(0, at, 0, -1, &end)) {
		return false;
	}

	result_.spans_    = captures_;
	result_.spans_[0] = Span(at, end);
	return true;
}

/*----------------------------------------------------------------------*
 * match
 *
 * Runs the program from 'pc' until END, or until the ATOMIC_CLOSE or
 * LOOK_CLOSE ending the group whose body starts at 'pc'. Backtracking
 * never goes below 'base' on the stack. For a look-behind body 'target'
 * is where the body has to end, otherwise it is -1.
 *
 * Returns false with the stack unwound to 'base' if there's no match.
 *----------------------------------------------------------------------*/
bool RegexMatch::match(int pc, Position pos, size_t base, Position target, Position *end) {

	const std::vector<RegexInstruction> &program = regex_->program_;

	for (;;) {
		const RegexInstruction &in = program[pc];
		bool ok = true;

		switch (in.op) {
		case END:
		case ATOMIC_CLOSE:
			*end = pos;
			return true;

		case LOOK_CLOSE:
			if (target >= 0 && pos != target) {
				ok = false;
				break;
			}
			*end = pos;
			return true;

		case EXACTLY:
		case ANY_OF:
		case ANY:
		case EVERY:
			if (pos < endLimit_ && matchOne(in, text_[pos])) {
				++pos;
				++pc;
			} else {
				ok = false;
			}
			break;

		case REPEAT: {
			const RegexInstruction &operand = program[pc + 1];
			const int limit = repeatLimit(in.max);
			const int wanted = (in.flags & Lazy) ? in.min : limit;
			int count = 0;

			while (count < wanted && pos + count < endLimit_ && matchOne(operand, text_[pos + count])) {
				++count;
			}

			if (count < in.min) {
				ok = false;
				break;
			}

			if (in.flags & Lazy) {
				if (count < limit) {
					push(Frame::Repeat, pc, pos, count);
				}
			} else if (!(in.flags & Possessive) && count > in.min) {
				push(Frame::Repeat, pc, pos, count);
			}

			pos += count;
			pc += 2;
			break;
		}

		case BOL:
			if (atLineStart(pos, in.flags)) {
				++pc;
			} else {
				ok = false;
			}
			break;

		case EOL:
			if (atLineEnd(pos, in.flags)) {
				++pc;
			} else {
				ok = false;
			}
			break;

		case BOT:
			if (pos == anchorStart_) {
				++pc;
			} else {
				ok = false;
			}
			break;

		case EOT:
			if (pos == anchorEnd_) {
				++pc;
			} else {
				ok = false;
			}
			break;

		case EOT_OR_NL:
			if (atLineEnd(pos, in.flags & UnixLines)) {
				++pc;
			} else {
				ok = false;
			}
			break;

		case WORD_BOUNDARY:
			if (atWordBoundary(pos)) {
				++pc;
			} else {
				ok = false;
			}
			break;

		case NOT_BOUNDARY:
			if (!atWordBoundary(pos)) {
				++pc;
			} else {
				ok = false;
			}
			break;

		case BRANCH:
			push(Frame::Choice, in.y, pos);
			pc = in.x;
			break;

		case JUMP:
			pc = in.x;
			break;

		case LOOP_MARK:
			push(Frame::RestoreMark, in.min, marks_[in.min]);
			marks_[in.min] = pos;
			++pc;
			break;

		case LOOP_CHECK:
			pc = (pos == marks_[in.min]) ? in.x : pc + 1;
			break;

		case OPEN:
			push(Frame::RestoreOpen, in.min, openp_[in.min]);
			openp_[in.min] = pos;
			++pc;
			break;

		case CLOSE:
			push(Frame::RestoreCapture, in.min, 0, 0, captures_[in.min]);
			captures_[in.min] = Span(openp_[in.min], pos);
			++pc;
			break;

		case BACK_REF: {
			const Span captured = captures_[in.min];
			if (!captured.isValid() || pos + captured.length() > endLimit_) {
				ok = false;
				break;
			}

			for (Position i = 0; i < captured.length(); ++i) {
				const char_type a = text_[captured.start + i];
				const char_type b = text_[pos + i];
				if (a != b && !((in.flags & CaseFold) && equalsIgnoringCase(a, b))) {
					ok = false;
					break;
				}
			}

			if (ok) {
				pos += captured.length();
				++pc;
			}
			break;
		}

		case ATOMIC_OPEN: {
			const size_t mark = stack_.size();
			Position after;
			if (match(pc + 1, pos, mark, -1, &after)) {
				// Keep the capture undo records so an outer failure still
				// restores them, but forget the choices made inside.
				discardChoices(mark);
				pos = after;
				pc  = in.x;
			} else {
				ok = false;
			}
			break;
		}

		case AHEAD_OPEN:
		case BEHIND_OPEN: {
			const size_t mark        = stack_.size();
			const Position saved_end = endLimit_;
			bool found               = false;
			Position after;

			if (in.op == AHEAD_OPEN) {
				endLimit_ = lookEnd_;
				found     = match(pc + 1, pos, mark, -1, &after);
			} else {
				endLimit_ = pos;
				for (int width = in.min; width <= in.max && pos - width >= lookStart_; ++width) {
					if (match(pc + 1, pos - width, mark, pos, &after)) {
						found = true;
						break;
					}
				}
			}

			endLimit_ = saved_end;

			if (in.flags & Negated) {
				if (found) {
					unwind(mark);
					ok = false;
				} else {
					pc = in.x;
				}
			} else if (found) {
				discardChoices(mark);
				pc = in.x;
			} else {
				ok = false;
			}
			break;
		}
		}

		if (!ok && !backtrack(base, &pc, &pos)) {
			return false;
		}
	}
}

/*----------------------------------------------------------------------*
 * backtrack
 *
 * Pops the stack down to the most recent choice point above 'base',
 * undoing capture and loop changes on the way.
 *----------------------------------------------------------------------*/
bool RegexMatch::backtrack(size_t base, int *pc, Position *pos) {

	const std::vector<RegexInstruction> &program = regex_->program_;

	while (stack_.size() > base) {
		Frame &f = stack_.back();

		switch (f.kind) {
		case Frame::Choice:
			step(f.pos);
			*pc  = f.pc;
			*pos = f.pos;
			stack_.pop_back();
			return true;

		case Frame::Repeat: {
			const RegexInstruction &in      = program[f.pc];
			const RegexInstruction &operand = program[f.pc + 1];
			const int limit                 = repeatLimit(in.max);
			const int at                    = f.pc;
			const Position start            = f.pos;

			if (in.flags & Lazy) {
				const Position next = start + f.count;
				if (f.count < limit && next < endLimit_ && matchOne(operand, text_[next])) {
					const int count = ++f.count;
					if (count >= limit) {
						stack_.pop_back();
					}
					*pc  = at + 2;
					*pos = start + count;
					return true;
				}
				stack_.pop_back();
				break;
			}

			step(start + f.count);

			const int count = --f.count;
			if (count <= in.min) {
				stack_.pop_back();
			}
			*pc  = at + 2;
			*pos = start + count;
			return true;
		}

		case Frame::RestoreOpen:
			openp_[f.pc] = f.pos;
			stack_.pop_back();
			break;

		case Frame::RestoreCapture:
			captures_[f.pc] = f.saved;
			stack_.pop_back();
			break;

		case Frame::RestoreMark:
			marks_[f.pc] = f.pos;
			stack_.pop_back();
			break;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: unwind
// Desc: Drops everything above 'base', undoing the changes recorded there.
//------------------------------------------------------------------------------
void RegexMatch::unwind(size_t base) {

	while (stack_.size() > base) {
		const Frame &f = stack_.back();

		switch (f.kind) {
		case Frame::RestoreOpen:
			openp_[f.pc] = f.pos;
			break;
		case Frame::RestoreCapture:
			captures_[f.pc] = f.saved;
			break;
		case Frame::RestoreMark:
			marks_[f.pc] = f.pos;
			break;
		default:
			break;
		}

		stack_.pop_back();
	}
}

//------------------------------------------------------------------------------
// Name: discardChoices
// Desc: Removes the choice points above 'base' but keeps the undo records.
//------------------------------------------------------------------------------
void RegexMatch::discardChoices(size_t base) {

	size_t out = base;

	for (size_t i = base; i < stack_.size(); ++i) {
		if (stack_[i].kind != Frame::Choice && stack_[i].kind != Frame::Repeat) {
			stack_[out++] = stack_[i];
		}
	}

	stack_.erase(stack_.begin() + static_cast<std::ptrdiff_t>(out), stack_.end());
}

//------------------------------------------------------------------------------
// Name: push
//------------------------------------------------------------------------------
void RegexMatch::push(Frame::Kind kind, int pc, Position pos, int count, Span saved) {
	Frame f;
	f.kind  = kind;
	f.pc    = pc;
	f.pos   = pos;
	f.count = count;
	f.saved = saved;
	stack_.push_back(f);
}

//------------------------------------------------------------------------------
// Name: step
// Desc: Charged once per resumed choice point. Forward progress is free, so
//       only backtracking can exhaust the limit.
//------------------------------------------------------------------------------
void RegexMatch::step(Position at) {
	++steps_;
	if (stepLimit_ != 0 && steps_ > stepLimit_) {
		throw StepLimitExceeded(stepLimit_, at);
	}
}

//------------------------------------------------------------------------------
// Name: matchOne
// Desc: Runs one of the single code point instructions against 'c'.
//------------------------------------------------------------------------------
bool RegexMatch::matchOne(const RegexInstruction &in, char_type c) const {

	switch (in.op) {
	case EXACTLY:
		return c == in.ch || ((in.flags & CaseFold) && equalsIgnoringCase(c, in.ch));
	case ANY_OF:
		return regex_->sets_[in.x].contains(c, (in.flags & CaseFold) != 0);
	case ANY:
		return !isLineTerminator(c, (in.flags & UnixLines) != 0);
	case EVERY:
		return true;
	default:
		return false;
	}
}

//------------------------------------------------------------------------------
// Name: atLineStart
// Desc: '^'. With Multiline it also matches after a line terminator, but not
//       inside \r\n and not at the very end of the text.
//------------------------------------------------------------------------------
bool RegexMatch::atLineStart(Position pos, uint8_t flags) const {

	if (pos == anchorStart_) {
		return true;
	}

	if (!(flags & Multiline) || pos <= lookStart_ || pos >= anchorEnd_) {
		return false;
	}

	const bool unixLines = (flags & UnixLines) != 0;
	const char_type prev = text_[pos - 1];

	if (!isLineTerminator(prev, unixLines)) {
		return false;
	}

	return unixLines || prev != '\r' || text_[pos] != '\n';
}

//------------------------------------------------------------------------------
// Name: atLineEnd
// Desc: '$'. Matches at the end and before a final line terminator, or with
//       Multiline before any line terminator.
//------------------------------------------------------------------------------
bool RegexMatch::atLineEnd(Position pos, uint8_t flags) const {

	if (pos == anchorEnd_) {
		return true;
	}

	if (pos >= lookEnd_ || pos > anchorEnd_) {
		return false;
	}

	const bool unixLines = (flags & UnixLines) != 0;
	const char_type c    = text_[pos];

	if (!isLineTerminator(c, unixLines)) {
		return false;
	}

	// Never between the two halves of \r\n.
	if (!unixLines && c == '\n' && pos > lookStart_ && text_[pos - 1] == '\r') {
		return false;
	}

	if (flags & Multiline) {
		return true;
	}

	Position next = pos + 1;
	if (!unixLines && c == '\r' && next < lookEnd_ && text_[next] == '\n') {
		++next;
	}

	return next == anchorEnd_;
}

//------------------------------------------------------------------------------
// Name: atWordBoundary
//------------------------------------------------------------------------------
bool RegexMatch::atWordBoundary(Position pos) const {
	const bool before = pos > lookStart_ && isWordChar(text_[pos - 1]);
	const bool after  = pos < lookEnd_ && isWordChar(text_[pos]);
	return before != after;
}
