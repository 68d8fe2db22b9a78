
#ifndef REGEX_EXCEPTION_H_
#define REGEX_EXCEPTION_H_

#include "Types.h"
#include <cstdarg>
#include <cstdio>
#include <exception>

class RegexException : public std::exception {
public:
	explicit RegexException(const char *format, ...) {
		va_list ap;
		va_start(ap, format);
		vsnprintf(error_, sizeof(error_), format, ap);
		va_end(ap);
	}

	const char *what() const noexcept {
		return error_;
	}

protected:
	RegexException() {
		error_[0] = '\0';
	}

	void setMessage(const char *format, va_list ap) {
		vsnprintf(error_, sizeof(error_), format, ap);
	}

private:
	char error_[255];
};

/* Raised while compiling a pattern. No usable Regex exists afterwards. */
class PatternError : public RegexException {
public:
	enum Kind {
		SyntaxError,
		UnsupportedFeature,
		UndefinedGroupReference
	};

public:
	PatternError() : kind_(SyntaxError), position_(-1) {
	}

	PatternError(Kind kind, int position, const char *format, ...) : kind_(kind), position_(position) {
		va_list ap;
		va_start(ap, format);
		setMessage(format, ap);
		va_end(ap);
	}

public:
	Kind kind() const {
		return kind_;
	}

	// Code point offset in the pattern where the problem was detected.
	int position() const {
		return position_;
	}

private:
	Kind kind_;
	int  position_;
};

/* Raised by the matcher when an attempt runs out of its step budget. The
 * compiled regex is unaffected; the caller may retry with a smaller range or
 * a larger budget. */
class StepLimitExceeded : public RegexException {
public:
	StepLimitExceeded(unsigned long limit, Position at)
		: RegexException("step limit of %lu exceeded matching at offset %d, please respecify expression", limit, at), limit_(limit), position_(at) {
	}

public:
	unsigned long limit() const {
		return limit_;
	}

	Position position() const {
		return position_;
	}

private:
	unsigned long limit_;
	Position      position_;
};

#endif
