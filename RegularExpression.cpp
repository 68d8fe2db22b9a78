
#include "RegularExpression.h"
#include "UnicodeText.h"
#include "regex/RegexIterator.h"
#include "regex/RegexMatch.h"
#include <QtDebug>

namespace {

const char EscapedMetaChars[] = "\\*?+[](){}^$|./-#";

bool isAsciiDigit(uint c) {
	return c >= '0' && c <= '9';
}

void appendSpan(const UnicodeText &text, Span span, QVector<uint> *out) {
	for (Position i = span.start; i < span.end; ++i) {
		out->append(text.at(i));
	}
}

}

/*----------------------------------------------------------------------*
 * compile
 *
 * Like constructing a RegularExpression, but a bad pattern is reported
 * through qDebug and a null result instead of an exception.
 *----------------------------------------------------------------------*/
std::unique_ptr<RegularExpression> RegularExpression::compile(const QString &pattern, RegexOptions options, PatternError *error) {
	try {
		return std::unique_ptr<RegularExpression>(new RegularExpression(pattern, options));
	} catch (const PatternError &e) {
		qDebug("Error in regular expression \"%s\" at offset %d: %s", qPrintable(pattern), e.position(), e.what());
		if (error) {
			*error = e;
		}
		return nullptr;
	}
}

//------------------------------------------------------------------------------
// Name: RegularExpression
//------------------------------------------------------------------------------
RegularExpression::RegularExpression(const QString &pattern, RegexOptions options) : regex_(new Regex(pattern, options)), stepLimit_(Regex::DefaultStepLimit()) {
}

//------------------------------------------------------------------------------
// Name: numberOfMatches
//------------------------------------------------------------------------------
int RegularExpression::numberOfMatches(const QString &string, MatchingOptions options) const {
	const UnicodeText text(string);
	return allMatches(text, options, text.fullRange()).size();
}

//------------------------------------------------------------------------------
// Name: numberOfMatches
//------------------------------------------------------------------------------
int RegularExpression::numberOfMatches(const QString &string, MatchingOptions options, Span range) const {
	const UnicodeText text(string);
	return allMatches(text, options, range).size();
}

//------------------------------------------------------------------------------
// Name: matches
//------------------------------------------------------------------------------
QList<QStringList> RegularExpression::matches(const QString &string, MatchingOptions options) const {
	return matches(string, options, Span(0, UnicodeText(string).length()));
}

//------------------------------------------------------------------------------
// Name: matches
//------------------------------------------------------------------------------
QList<QStringList> RegularExpression::matches(const QString &string, MatchingOptions options, Span range) const {

	const UnicodeText text(string);
	QList<QStringList> results;

	for (const MatchResult &match : allMatches(text, options, range)) {
		results.append(matchStrings(text, match));
	}

	return results;
}

//------------------------------------------------------------------------------
// Name: firstMatch
//------------------------------------------------------------------------------
QStringList RegularExpression::firstMatch(const QString &string, MatchingOptions options) const {
	return firstMatch(string, options, Span(0, UnicodeText(string).length()));
}

//------------------------------------------------------------------------------
// Name: firstMatch
//------------------------------------------------------------------------------
QStringList RegularExpression::firstMatch(const QString &string, MatchingOptions options, Span range) const {

	const UnicodeText text(string);
	checkRange(text, range);

	RegexMatch matcher(regex_.get(), stepLimit_);
	if (!matcher.ExecRE(text.data(), text.length(), range, range.start, options)) {
		return QStringList();
	}

	return matchStrings(text, matcher.result());
}

//------------------------------------------------------------------------------
// Name: rangeOfFirstMatch
//------------------------------------------------------------------------------
Span RegularExpression::rangeOfFirstMatch(const QString &string, MatchingOptions options) const {
	return rangeOfFirstMatch(string, options, Span(0, UnicodeText(string).length()));
}

//------------------------------------------------------------------------------
// Name: rangeOfFirstMatch
//------------------------------------------------------------------------------
Span RegularExpression::rangeOfFirstMatch(const QString &string, MatchingOptions options, Span range) const {

	const UnicodeText text(string);
	checkRange(text, range);

	RegexMatch matcher(regex_.get(), stepLimit_);
	if (!matcher.ExecRE(text.data(), text.length(), range, range.start, options)) {
		return Span();
	}

	return matcher.result().span();
}

//------------------------------------------------------------------------------
// Name: replaceMatches
//------------------------------------------------------------------------------
QString RegularExpression::replaceMatches(const QString &string, MatchingOptions options, const QString &replacement) const {
	return replaceMatches(string, options, Span(0, UnicodeText(string).length()), replacement);
}

/*----------------------------------------------------------------------*
 * replaceMatches
 *
 * Builds the result in code points: the text up to each match, then
 * the expanded template in place of the match, then whatever follows
 * the last match, including text past the end of 'range'.
 *----------------------------------------------------------------------*/
QString RegularExpression::replaceMatches(const QString &string, MatchingOptions options, Span range, const QString &replacement) const {

	const UnicodeText text(string);
	const UnicodeText tmpl(replacement);
	QVector<uint> out;
	Position last = 0;

	for (const MatchResult &match : allMatches(text, options, range)) {
		appendSpan(text, Span(last, match.start()), &out);
		expandTemplate(text, match, tmpl, &out);
		last = match.end();
	}

	appendSpan(text, Span(last, text.length()), &out);
	return QString::fromUcs4(out.constData(), out.size());
}

/*----------------------------------------------------------------------*
 * split
 *
 * The first piece runs from the start of the text to the first match,
 * every later piece from the end of one match to the start of the next
 * (or the end of the text). No matches gives the whole text.
 *----------------------------------------------------------------------*/
QStringList RegularExpression::split(const QString &string) const {

	const UnicodeText text(string);
	const QList<MatchResult> found = allMatches(text, NoMatchingOptions, text.fullRange());

	if (found.isEmpty()) {
		return QStringList(string);
	}

	QStringList pieces;
	pieces.append(text.mid(Span(0, found.first().start())));

	for (int i = 0; i < found.size(); ++i) {
		const Position end = (i + 1 < found.size()) ? found[i + 1].start() : text.length();
		pieces.append(text.mid(Span(found[i].end(), end)));
	}

	return pieces;
}

//------------------------------------------------------------------------------
// Name: groupNames
//------------------------------------------------------------------------------
QStringList RegularExpression::groupNames() const {
	QStringList names;
	for (const QString &name : regex_->groupNames()) {
		names.append(name);
	}
	return names;
}

//------------------------------------------------------------------------------
// Name: escapedPattern
//------------------------------------------------------------------------------
QString RegularExpression::escapedPattern(const QString &string) {

	QString escaped;
	escaped.reserve(string.size());

	for (const QChar ch : string) {
		if (ch.unicode() < 0x80 && qstrchr(EscapedMetaChars, ch.toLatin1()) != nullptr) {
			escaped.append(QLatin1Char('\\'));
		}
		escaped.append(ch);
	}

	return escaped;
}

//------------------------------------------------------------------------------
// Name: escapedTemplate
//------------------------------------------------------------------------------
QString RegularExpression::escapedTemplate(const QString &string) {

	QString escaped;
	escaped.reserve(string.size());

	for (const QChar ch : string) {
		if (ch == QLatin1Char('\\') || ch == QLatin1Char('$')) {
			escaped.append(QLatin1Char('\\'));
		}
		escaped.append(ch);
	}

	return escaped;
}

//------------------------------------------------------------------------------
// Name: checkRange
//------------------------------------------------------------------------------
void RegularExpression::checkRange(const UnicodeText &text, Span range) const {
	if (range.start < 0 || range.end < range.start || range.end > text.length()) {
		throw RegexException("range [%d, %d) is outside of a text of length %d", range.start, range.end, text.length());
	}
}

//------------------------------------------------------------------------------
// Name: allMatches
//------------------------------------------------------------------------------
QList<MatchResult> RegularExpression::allMatches(const UnicodeText &text, MatchingOptions options, Span range) const {

	checkRange(text, range);

	QList<MatchResult> found;
	RegexIterator it(regex_.get(), text.data(), text.length(), range, options, stepLimit_);

	MatchResult match;
	while (it.next(&match)) {
		found.append(match);
	}

	return found;
}

//------------------------------------------------------------------------------
// Name: matchStrings
// Desc: The whole match, then the text of each group that took part.
//------------------------------------------------------------------------------
QStringList RegularExpression::matchStrings(const UnicodeText &text, const MatchResult &match) const {

	QStringList strings;
	strings.append(text.mid(match.span()));

	for (int group = 1; group <= match.groupCount(); ++group) {
		if (match.hasGroup(group)) {
			strings.append(text.mid(match.span(group)));
		}
	}

	return strings;
}

/*----------------------------------------------------------------------*
 * expandTemplate
 *
 * $n takes as many digits as still name an existing group, so with
 * three groups "$12" is group 1 followed by '2'. ${name} refers to a
 * named group. A backslash makes the next code point literal. Groups
 * that did not take part, or do not exist, insert nothing.
 *----------------------------------------------------------------------*/
void RegularExpression::expandTemplate(const UnicodeText &text, const MatchResult &match, const UnicodeText &replacement, QVector<uint> *out) const {

	const Position length = replacement.length();
	const int groups      = regex_->groupCount();

	Position i = 0;
	while (i < length) {
		const uint c = replacement.at(i);

		if (c == '\\' && i + 1 < length) {
			out->append(replacement.at(i + 1));
			i += 2;
			continue;
		}

		if (c == '$' && i + 1 < length && isAsciiDigit(replacement.at(i + 1))) {
			int group = replacement.at(i + 1) - '0';
			i += 2;

			while (i < length && isAsciiDigit(replacement.at(i))) {
				const int next = group * 10 + static_cast<int>(replacement.at(i) - '0');
				if (next > groups) {
					break;
				}
				group = next;
				++i;
			}

			if (group > groups) {
				qDebug("Regex: replacement refers to group %d, the pattern has %d", group, groups);
			} else if (match.hasGroup(group)) {
				appendSpan(text, match.span(group), out);
			}
			continue;
		}

		if (c == '$' && i + 1 < length && replacement.at(i + 1) == '{') {
			Position close = i + 2;
			while (close < length && replacement.at(close) != '}') {
				++close;
			}

			if (close < length) {
				const QString name = replacement.mid(Span(i + 2, close));
				const int group    = regex_->groupIndex(name);

				if (group < 0) {
					qDebug("Regex: replacement refers to unknown group name '%s'", qPrintable(name));
				} else if (match.hasGroup(group)) {
					appendSpan(text, match.span(group), out);
				}

				i = close + 1;
				continue;
			}
		}

		out->append(c);
		++i;
	}
}
