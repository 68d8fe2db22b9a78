
#include "RegularExpression.h"
#include <gtest/gtest.h>

TEST(RegularExpression, SplitOnWhitespace) {
	const RegularExpression re("\\s+");
	EXPECT_EQ(re.split("a   b c"), QStringList() << "a" << "b" << "c");
}

TEST(RegularExpression, SplitKeepsEmptyPieces) {
	const RegularExpression re(",");
	const QStringList pieces = re.split("a,b,,c,");
	EXPECT_EQ(pieces, QStringList() << "a" << "b" << "" << "c" << "");
	EXPECT_EQ(pieces.join(","), QString("a,b,,c,"));
}

TEST(RegularExpression, SplitWithoutMatches) {
	const RegularExpression re("x");
	EXPECT_EQ(re.split("abc"), QStringList() << "abc");
}

TEST(RegularExpression, FirstMatchCaseInsensitive) {
	const RegularExpression re("eternam", CaseInsensitive);
	EXPECT_EQ(re.firstMatch("Ad ETERNAM"), QStringList() << "ETERNAM");
	EXPECT_EQ(re.rangeOfFirstMatch("Ad ETERNAM"), Span(3, 10));
}

TEST(RegularExpression, WordBoundedAlternativesCaseInsensitive) {
	const RegularExpression re("\\b(a|b)(c|d)\\b", CaseInsensitive);
	EXPECT_EQ(re.numberOfMatches("Ad eternam"), 1);
	EXPECT_EQ(re.firstMatch("Ad eternam"), QStringList() << "Ad" << "A" << "d");
	EXPECT_EQ(re.rangeOfFirstMatch("Ad eternam"), Span(0, 2));
}

TEST(RegularExpression, NoMatch) {
	const RegularExpression re("z");
	EXPECT_TRUE(re.firstMatch("abc").isEmpty());
	EXPECT_FALSE(re.rangeOfFirstMatch("abc").isValid());
	EXPECT_EQ(re.numberOfMatches("abc"), 0);
	EXPECT_TRUE(re.matches("abc").isEmpty());
	EXPECT_EQ(re.replaceMatches("abc", NoMatchingOptions, "y"), QString("abc"));
}

TEST(RegularExpression, ReplaceWithGroups) {
	const RegularExpression re("(\\d+)");
	EXPECT_EQ(re.replaceMatches("x12y34", NoMatchingOptions, "[$1]"), QString("x[12]y[34]"));
	EXPECT_EQ(re.replaceMatches("x12y34", NoMatchingOptions, "<$0>"), QString("x<12>y<34>"));
}

TEST(RegularExpression, ReplaceGroupNumberTakesLongestValidPrefix) {
	const RegularExpression re("(a)(b)");
	EXPECT_EQ(re.replaceMatches("ab", NoMatchingOptions, "$12"), QString("a2"));
	EXPECT_EQ(re.replaceMatches("ab", NoMatchingOptions, "$21"), QString("b1"));
	EXPECT_EQ(re.replaceMatches("ab", NoMatchingOptions, "[$9]"), QString("[]"));
}

TEST(RegularExpression, ReplaceWithNamedGroupAndEscapes) {
	const RegularExpression re("(?<word>\\w+)");
	EXPECT_EQ(re.replaceMatches("hi there", NoMatchingOptions, "${word}!"), QString("hi! there!"));
	EXPECT_EQ(re.replaceMatches("hi", NoMatchingOptions, "\\$1\\\\"), QString("$1\\"));
	EXPECT_EQ(re.replaceMatches("hi", NoMatchingOptions, "${nope}"), QString(""));
}

TEST(RegularExpression, ReplaceInsideRange) {
	const RegularExpression re("a");
	EXPECT_EQ(re.replaceMatches("aaaa", NoMatchingOptions, Span(1, 3), "b"), QString("abba"));
}

TEST(RegularExpression, ReplaceEmptyMatches) {
	const RegularExpression re("x*");
	EXPECT_EQ(re.replaceMatches("ab", NoMatchingOptions, "-"), QString("-a-b-"));
}

TEST(RegularExpression, MatchesListsEveryMatch) {
	const RegularExpression re("(\\w)\\1");
	const QList<QStringList> found = re.matches("aabccdd");

	ASSERT_EQ(found.size(), 3);
	EXPECT_EQ(found[0], QStringList() << "aa" << "a");
	EXPECT_EQ(found[1], QStringList() << "cc" << "c");
	EXPECT_EQ(found[2], QStringList() << "dd" << "d");
	EXPECT_EQ(re.numberOfMatches("aabccdd"), found.size());
	EXPECT_EQ(re.matches("aabccdd"), found);
}

TEST(RegularExpression, MatchesOmitAbsentGroups) {
	const RegularExpression re("(a)|(b)");
	const QList<QStringList> found = re.matches("ab");

	ASSERT_EQ(found.size(), 2);
	EXPECT_EQ(found[0], QStringList() << "a" << "a");
	EXPECT_EQ(found[1], QStringList() << "b" << "b");
}

TEST(RegularExpression, RangeLimitsTheSearch) {
	const RegularExpression re("\\d");
	EXPECT_EQ(re.numberOfMatches("1a2b3", NoMatchingOptions, Span(1, 4)), 1);
	EXPECT_EQ(re.firstMatch("1a2b3", NoMatchingOptions, Span(1, 4)), QStringList() << "2");
	EXPECT_EQ(re.rangeOfFirstMatch("1a2b3", NoMatchingOptions, Span(3, 5)), Span(4, 5));
}

TEST(RegularExpression, RangeOutsideTheTextThrows) {
	const RegularExpression re("a");
	EXPECT_THROW(re.numberOfMatches("abc", NoMatchingOptions, Span(2, 4)), RegexException);
	EXPECT_THROW(re.firstMatch("abc", NoMatchingOptions, Span(-1, 1)), RegexException);
	EXPECT_THROW(re.rangeOfFirstMatch("abc", NoMatchingOptions, Span(2, 1)), RegexException);
}

TEST(RegularExpression, PositionsCountCodePoints) {
	const RegularExpression re("b");
	EXPECT_EQ(re.rangeOfFirstMatch(QString::fromUtf8("\xf0\x9f\x98\x80" "b")), Span(1, 2));
}

TEST(RegularExpression, CompileReportsErrors) {
	PatternError error;
	std::unique_ptr<RegularExpression> re = RegularExpression::compile("(ab", NoRegexOptions, &error);
	EXPECT_FALSE(re);
	EXPECT_EQ(error.kind(), PatternError::SyntaxError);
	EXPECT_EQ(error.position(), 3);

	EXPECT_FALSE(RegularExpression::compile("a\\G"));
	EXPECT_TRUE(RegularExpression::compile("a(b)") != nullptr);
	EXPECT_THROW(RegularExpression("[a"), PatternError);
}

TEST(RegularExpression, GroupInformation) {
	const RegularExpression re("(?<y>\\d+)-(\\d+)", CaseInsensitive);
	EXPECT_EQ(re.pattern(), QString("(?<y>\\d+)-(\\d+)"));
	EXPECT_EQ(re.options(), RegexOptions(CaseInsensitive));
	EXPECT_EQ(re.numberOfCaptureGroups(), 2);
	EXPECT_EQ(re.groupNames(), QStringList() << "" << "y" << "");
}

TEST(RegularExpression, EscapedPatternMatchesLiterally) {
	const QString literal("a.b*(c)$");
	const QString escaped = RegularExpression::escapedPattern(literal);
	EXPECT_EQ(escaped, QString("a\\.b\\*\\(c\\)\\$"));

	const RegularExpression re(escaped);
	EXPECT_EQ(re.rangeOfFirstMatch("xxa.b*(c)$"), Span(2, 10));
}

TEST(RegularExpression, EscapedTemplateIsInsertedLiterally) {
	const QString escaped = RegularExpression::escapedTemplate("$1\\");
	EXPECT_EQ(escaped, QString("\\$1\\\\"));

	const RegularExpression re("(x)");
	EXPECT_EQ(re.replaceMatches("x", NoMatchingOptions, escaped), QString("$1\\"));
}

TEST(RegularExpression, StepLimit) {
	RegularExpression re("(x+x+)+y");
	re.setStepLimit(10000);
	EXPECT_EQ(re.stepLimit(), 10000UL);
	EXPECT_THROW(re.numberOfMatches(QString(30, QLatin1Char('x'))), StepLimitExceeded);
	EXPECT_EQ(re.numberOfMatches("xxy"), 1);
}
