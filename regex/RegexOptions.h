
#ifndef REGEX_OPTIONS_H_
#define REGEX_OPTIONS_H_

#include <QFlags>

// Compile time settings, fixed for the life of a compiled Regex.
enum RegexOption {
	NoRegexOptions             = 0x00,
	CaseInsensitive            = 0x01, // Unicode simple case folding on literals, classes and back references
	AllowCommentsAndWhitespace = 0x02, // Ignore unescaped white space and #-comments outside [...]
	IgnoreMetacharacters       = 0x04, // Treat the whole pattern as a literal string
	DotMatchesLineSeparators   = 0x08, // '.' also matches line terminators
	AnchorsMatchLines          = 0x10, // '^' and '$' also match at line boundaries
	UseUnixLineSeparators      = 0x20, // Only \n is a line terminator
	AnchorAtMatchingStart      = 0x40  // Matches must start where the search starts
};

Q_DECLARE_FLAGS(RegexOptions, RegexOption)
Q_DECLARE_OPERATORS_FOR_FLAGS(RegexOptions)

// Per call settings.
enum MatchingOption {
	NoMatchingOptions      = 0x00,
	Anchored               = 0x01, // Same as AnchorAtMatchingStart, for a single call
	WithTransparentBounds  = 0x02, // Look-around and \b may examine text outside the search range
	WithoutAnchoringBounds = 0x04  // '^' and '$' match only at the real start and end of the text
};

Q_DECLARE_FLAGS(MatchingOptions, MatchingOption)
Q_DECLARE_OPERATORS_FOR_FLAGS(MatchingOptions)

#endif
