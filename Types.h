
#ifndef TYPES_H_
#define TYPES_H_

#include <cstdint>

// One Unicode scalar value. Text handed to the engine is always a sequence of
// these, so every offset below counts code points, not UTF-16 units.
typedef uint32_t char_type;

// A code point offset into the text being searched.
typedef int Position;

struct Span {
	Span() : start(-1), end(-1) {
	}

	Span(Position s, Position e) : start(s), end(e) {
	}

	bool isValid() const {
		return start >= 0 && end >= start;
	}

	bool isEmpty() const {
		return start == end;
	}

	int length() const {
		return isValid() ? end - start : 0;
	}

	bool operator==(const Span &rhs) const {
		return start == rhs.start && end == rhs.end;
	}

	bool operator!=(const Span &rhs) const {
		return !(*this == rhs);
	}

	Position start;
	Position end;
};

#endif
