
#ifndef REGULAR_EXPRESSION_H_
#define REGULAR_EXPRESSION_H_

#include "Types.h"
#include "regex/Regex.h"
#include "regex/RegexException.h"
#include "regex/RegexOptions.h"
#include <QList>
#include <QString>
#include <QStringList>
#include <QVector>
#include <memory>

class MatchResult;
class UnicodeText;

/* QString level convenience layer over Regex. Positions and spans are in
 * code points. Every call may throw StepLimitExceeded when a single match
 * attempt exceeds stepLimit(), and RegexException when 'range' does not lie
 * inside the text. */
class RegularExpression {
public:
	/**
	 * @brief Compiles 'pattern', logging the reason on failure.
	 * @param pattern - The pattern text.
	 * @param options - Compile time options.
	 * @param error - If not null, receives the reason when compilation fails.
	 * @return The compiled expression, null if 'pattern' is invalid.
	 */
	static std::unique_ptr<RegularExpression> compile(const QString &pattern, RegexOptions options = NoRegexOptions, PatternError *error = nullptr);

public:
	// Throws PatternError when 'pattern' is invalid.
	explicit RegularExpression(const QString &pattern, RegexOptions options = NoRegexOptions);

private:
	RegularExpression(const RegularExpression &) = delete;
	RegularExpression &operator=(const RegularExpression &) = delete;

public:
	int numberOfMatches(const QString &string, MatchingOptions options = NoMatchingOptions) const;
	int numberOfMatches(const QString &string, MatchingOptions options, Span range) const;

	// Each row holds the whole match followed by every group that took part.
	QList<QStringList> matches(const QString &string, MatchingOptions options = NoMatchingOptions) const;
	QList<QStringList> matches(const QString &string, MatchingOptions options, Span range) const;

	// Same layout as a row of matches(), empty when nothing matches.
	QStringList firstMatch(const QString &string, MatchingOptions options = NoMatchingOptions) const;
	QStringList firstMatch(const QString &string, MatchingOptions options, Span range) const;

	// An invalid Span when nothing matches.
	Span rangeOfFirstMatch(const QString &string, MatchingOptions options = NoMatchingOptions) const;
	Span rangeOfFirstMatch(const QString &string, MatchingOptions options, Span range) const;

	/* Replaces every match inside 'range' with 'replacement' expanded against
	   it. In the template $n and ${name} insert a group, \c inserts c. Text
	   outside 'range' is copied unchanged. */
	QString replaceMatches(const QString &string, MatchingOptions options, const QString &replacement) const;
	QString replaceMatches(const QString &string, MatchingOptions options, Span range, const QString &replacement) const;

	// The pieces of 'string' between successive matches.
	QStringList split(const QString &string) const;

public:
	QString pattern() const {
		return regex_->pattern();
	}

	RegexOptions options() const {
		return regex_->options();
	}

	int numberOfCaptureGroups() const {
		return regex_->groupCount();
	}

	// Names by group number, "" for unnamed groups. Entry 0 is the whole match.
	QStringList groupNames() const;

	unsigned long stepLimit() const {
		return stepLimit_;
	}

	void setStepLimit(unsigned long limit) {
		stepLimit_ = limit;
	}

public:
	// 'string' with every metacharacter escaped, for use as a literal pattern.
	static QString escapedPattern(const QString &string);

	// 'string' with '$' and '\' escaped, for use as a literal template.
	static QString escapedTemplate(const QString &string);

private:
	void checkRange(const UnicodeText &text, Span range) const;
	QList<MatchResult> allMatches(const UnicodeText &text, MatchingOptions options, Span range) const;
	QStringList matchStrings(const UnicodeText &text, const MatchResult &match) const;
	void expandTemplate(const UnicodeText &text, const MatchResult &match, const UnicodeText &replacement, QVector<uint> *out) const;

private:
	std::unique_ptr<Regex> regex_;
	unsigned long          stepLimit_;
};

#endif
