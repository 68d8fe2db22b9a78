
#include "Regex.h"
#include "RegexMatch.h"
#include "UnicodeText.h"
#include <gtest/gtest.h>
#include <QString>
#include <cstring>

namespace {

MatchResult search(const QString &pattern, const QString &string, RegexOptions options = NoRegexOptions, MatchingOptions matching = NoMatchingOptions) {
	const Regex regex(pattern, options);
	const UnicodeText text(string);
	RegexMatch matcher(&regex);
	matcher.ExecRE(text.data(), text.length(), text.fullRange(), 0, matching);
	return matcher.result();
}

MatchResult searchRange(const QString &pattern, const QString &string, Span range, MatchingOptions matching = NoMatchingOptions) {
	const Regex regex(pattern);
	const UnicodeText text(string);
	RegexMatch matcher(&regex);
	matcher.ExecRE(text.data(), text.length(), range, range.start, matching);
	return matcher.result();
}

bool found(const QString &pattern, const QString &string, RegexOptions options = NoRegexOptions) {
	return search(pattern, string, options).isValid();
}

}

TEST(RegexMatch, GreedyAndLazyRepetition) {
	EXPECT_EQ(search("a+", "aaa").span(), Span(0, 3));
	EXPECT_EQ(search("a+?", "aaa").span(), Span(0, 1));
	EXPECT_EQ(search("a{2,3}", "aaaa").span(), Span(0, 3));
	EXPECT_EQ(search("a{2,3}?", "aaaa").span(), Span(0, 2));
	EXPECT_EQ(search("a.*b", "axxbyyb").span(), Span(0, 7));
	EXPECT_EQ(search("a.*?b", "axxbyyb").span(), Span(0, 4));
}

TEST(RegexMatch, LeftmostAlternativeWins) {
	const MatchResult m = search("(a|ab)(c|bcd)(d*)", "abcd");
	EXPECT_EQ(m.span(), Span(0, 4));
	EXPECT_EQ(m.span(1), Span(0, 1));
	EXPECT_EQ(m.span(2), Span(1, 4));
	EXPECT_EQ(m.span(3), Span(4, 4));
}

TEST(RegexMatch, ComplexRepetitionBacktracks) {
	EXPECT_EQ(search("(ab){2,3}c", "abababc").span(), Span(0, 7));
	EXPECT_EQ(search("(ab){2}?", "ababab").span(), Span(0, 4));
	EXPECT_EQ(search("(?:a|b)+?c", "abbac").span(), Span(0, 5));
	EXPECT_FALSE(found("(ab){2,3}c", "abc"));
}

TEST(RegexMatch, CaptureHoldsLastIteration) {
	const MatchResult m = search("(\\w)+", "abc");
	EXPECT_EQ(m.span(1), Span(2, 3));
}

TEST(RegexMatch, UnusedGroupIsAbsent) {
	const MatchResult m = search("(a)|(b)", "b");
	ASSERT_TRUE(m.isValid());
	EXPECT_EQ(m.groupCount(), 2);
	EXPECT_FALSE(m.hasGroup(1));
	EXPECT_EQ(m.span(2), Span(0, 1));
}

TEST(RegexMatch, FailedAlternativeRestoresCaptures) {
	const MatchResult m = search("(?:(ab)c|abd)", "abd");
	ASSERT_TRUE(m.isValid());
	EXPECT_FALSE(m.hasGroup(1));

	const MatchResult n = search("(?:(a)|b)*", "ab");
	EXPECT_EQ(n.span(), Span(0, 2));
	EXPECT_EQ(n.span(1), Span(0, 1));
}

TEST(RegexMatch, BackReferences) {
	EXPECT_EQ(search("(\\w)\\1", "abccd").span(), Span(2, 4));
	EXPECT_FALSE(found("(a)?b\\1", "b"));
	EXPECT_TRUE(found("(a)\\1", "aA", CaseInsensitive));
	EXPECT_FALSE(found("(a)\\1", "aA"));
	EXPECT_EQ(search("(?<x>[a-z]+)-\\k<x>", "ab-ab").span(), Span(0, 5));
}

TEST(RegexMatch, CaseInsensitiveUsesCaseFolding) {
	EXPECT_TRUE(found("HELLO", "hello", CaseInsensitive));
	EXPECT_TRUE(found(QString::fromUtf8("\xcf\x83\xce\xb1\xcf\x82"), QString::fromUtf8("\xce\xa3\xce\x91\xce\xa3"), CaseInsensitive));
	EXPECT_TRUE(found("[a-z]+", "ABC", CaseInsensitive));
	EXPECT_FALSE(found("[^a-z]", "ABC", CaseInsensitive));
}

TEST(RegexMatch, InlineFlags) {
	EXPECT_TRUE(found("(?i)abc", "ABC"));
	EXPECT_TRUE(found("a(?i)b", "aB"));
	EXPECT_FALSE(found("a(?i)b", "AB"));
	EXPECT_TRUE(found("(?i:a)b", "Ab"));
	EXPECT_FALSE(found("(?i:a)b", "AB"));
	EXPECT_FALSE(found("(?i)a(?-i)b", "AB"));
}

TEST(RegexMatch, LineAnchors) {
	EXPECT_FALSE(found("^b", "a\nb"));
	EXPECT_EQ(search("^b", "a\nb", AnchorsMatchLines).span(), Span(2, 3));
	EXPECT_EQ(search("a$", "a\n").span(), Span(0, 1));
	EXPECT_FALSE(found("a$", "a\nb"));
	EXPECT_EQ(search("a$", "a\nb", AnchorsMatchLines).span(), Span(0, 1));
	EXPECT_EQ(search("a$", "a\r\n").span(), Span(0, 1));
	EXPECT_TRUE(found("(?m)^b", "a\r\nb"));
}

TEST(RegexMatch, TextAnchors) {
	EXPECT_FALSE(found("a\\z", "a\n"));
	EXPECT_TRUE(found("a\\Z", "a\n"));
	EXPECT_FALSE(found("\\Ab", "ab"));
	EXPECT_FALSE(found("\\Ab", "a\nb", AnchorsMatchLines));
}

TEST(RegexMatch, DotAndLineTerminators) {
	EXPECT_FALSE(found(".", "\n"));
	EXPECT_TRUE(found(".", "\n", DotMatchesLineSeparators));
	EXPECT_FALSE(found(".", QString(QChar(0x2028))));
	EXPECT_TRUE(found(".", "\r", UseUnixLineSeparators));
	EXPECT_FALSE(found(".", "\n", UseUnixLineSeparators));
	EXPECT_TRUE(found("(?s)a.b", "a\nb"));
}

TEST(RegexMatch, UnicodeClasses) {
	EXPECT_EQ(search(QString::fromUtf8("\\b\xc3\xa9"), QString::fromUtf8(" \xc3\xa9")).span(), Span(1, 2));
	EXPECT_TRUE(found("^\\d$", QString(QChar(0x0664))));
	EXPECT_EQ(search("\\p{Lu}", "aB").span(), Span(1, 2));
	EXPECT_EQ(search("\\P{L}", "ab1").span(), Span(2, 3));
	EXPECT_EQ(search("[[:digit:]]+", "ab12").span(), Span(2, 4));
	EXPECT_EQ(search("\\s+", QString::fromUtf8("a\xe2\x80\x83 b")).span(), Span(1, 3));
}

TEST(RegexMatch, CodePointsOutsideTheBmp) {
	const QString smiley = QString::fromUtf8("\xf0\x9f\x98\x80");
	EXPECT_EQ(search(".", smiley).span(), Span(0, 1));
	EXPECT_EQ(search("\\x{1F600}b", smiley + "b").span(), Span(0, 2));
	EXPECT_EQ(search("b", smiley + "b").span(), Span(1, 2));
}

TEST(RegexMatch, LookAhead) {
	EXPECT_EQ(search("foo(?=bar)", "foobaz foobar").span(), Span(7, 10));
	EXPECT_EQ(search("foo(?!bar)", "foobar foobaz").span(), Span(7, 10));
}

TEST(RegexMatch, LookBehind) {
	EXPECT_EQ(search("(?<=\\$)\\d+", "cost $42").span(), Span(6, 8));
	EXPECT_EQ(search("(?<!\\$)\\b\\d+", "$4 5").span(), Span(3, 4));
	EXPECT_EQ(search("(?<=ab|c)d", "abd").span(), Span(2, 3));
}

TEST(RegexMatch, AtomicGroupsAndPossessiveQuantifiers) {
	EXPECT_FALSE(found("(?>a+)ab", "aaab"));
	EXPECT_TRUE(found("(?:a+)ab", "aaab"));
	EXPECT_EQ(search("a++b", "aaab").span(), Span(0, 4));
	EXPECT_FALSE(found("a++ab", "aaab"));
	EXPECT_FALSE(found("(?:ab)++ab", "ababab"));
}

TEST(RegexMatch, EmptyIterationsTerminate) {
	EXPECT_EQ(search("(a*)*b", "b").span(), Span(0, 1));
	EXPECT_EQ(search("(a|)*c", "aac").span(), Span(0, 3));
	EXPECT_EQ(search("(?:\\b)*x", "x").span(), Span(0, 1));
}

TEST(RegexMatch, ZeroLengthMatchIsFlagged) {
	const MatchResult m = search("a*", "bbb");
	ASSERT_TRUE(m.isValid());
	EXPECT_TRUE(m.isEmpty());
	EXPECT_EQ(m.span(), Span(0, 0));
}

TEST(RegexMatch, LineBreakEscape) {
	EXPECT_EQ(search("a\\Rb", "a\r\nb").span(), Span(0, 4));
	EXPECT_EQ(search("a\\Rb", "a\nb").span(), Span(0, 3));
	EXPECT_FALSE(found("a\\R\\nb", "a\r\nb"));
}

TEST(RegexMatch, LiteralModes) {
	EXPECT_EQ(search("a.b", "axb a.b", IgnoreMetacharacters).span(), Span(4, 7));
	EXPECT_EQ(search("\\Q.*\\E", "x.*").span(), Span(1, 3));
	EXPECT_TRUE(found("a b # comment\n c", "abc", AllowCommentsAndWhitespace));
	EXPECT_TRUE(found("a[ ]b", "a b", AllowCommentsAndWhitespace));
	EXPECT_TRUE(found("\\x41\\u0042\\0103", "ABC"));
}

TEST(RegexMatch, AnchoredSearch) {
	EXPECT_FALSE(search("b", "abc", NoRegexOptions, Anchored).isValid());
	EXPECT_FALSE(search("b", "abc", AnchorAtMatchingStart).isValid());

	const Regex regex("b");
	const UnicodeText text("abc");
	RegexMatch matcher(&regex);
	ASSERT_TRUE(matcher.matchAt(text.data(), text.length(), text.fullRange(), 1));
	EXPECT_EQ(matcher.result().span(), Span(1, 2));
}

TEST(RegexMatch, AnchoringBounds) {
	EXPECT_EQ(searchRange("^b$", "abc", Span(1, 2)).span(), Span(1, 2));
	EXPECT_FALSE(searchRange("^b$", "abc", Span(1, 2), WithoutAnchoringBounds).isValid());
	EXPECT_FALSE(searchRange("c", "abc", Span(0, 2)).isValid());
}

TEST(RegexMatch, LineEndBeforeCarriageReturnAtRangeEnd) {
	EXPECT_EQ(searchRange("a$", "a\r\n", Span(0, 2)).span(), Span(0, 1));
	EXPECT_EQ(searchRange("a$", "a\r\n", Span(0, 3)).span(), Span(0, 1));
	EXPECT_FALSE(searchRange("a$", "a\r\nb", Span(0, 4)).isValid());
}

TEST(RegexMatch, TransparentBounds) {
	EXPECT_EQ(searchRange("\\bb", "abc", Span(1, 3)).span(), Span(1, 2));
	EXPECT_FALSE(searchRange("\\bb", "abc", Span(1, 3), WithTransparentBounds).isValid());
	EXPECT_FALSE(searchRange("b(?=c)", "abc", Span(0, 2)).isValid());
	EXPECT_EQ(searchRange("b(?=c)", "abc", Span(0, 2), WithTransparentBounds).span(), Span(1, 2));
	EXPECT_EQ(searchRange("(?<=a)b", "abc", Span(1, 3), WithTransparentBounds).span(), Span(1, 2));
	EXPECT_FALSE(searchRange("(?<=a)b", "abc", Span(1, 3)).isValid());
}

TEST(RegexMatch, InvalidRangeDoesNotMatch) {
	const Regex regex("a");
	const UnicodeText text("aaa");
	RegexMatch matcher(&regex);
	EXPECT_FALSE(matcher.ExecRE(text.data(), text.length(), Span(2, 5), 2));
	EXPECT_FALSE(matcher.result().isValid());
}

TEST(RegexMatch, StepLimit) {
	const Regex regex("(x+x+)+y");
	const UnicodeText text(QString(30, QLatin1Char('x')));
	RegexMatch matcher(&regex, 10000);

	EXPECT_THROW(matcher.ExecRE(text.data(), text.length(), text.fullRange(), 0), StepLimitExceeded);

	// The regex is still usable afterwards.
	const UnicodeText good("xxy");
	EXPECT_TRUE(matcher.ExecRE(good.data(), good.length(), good.fullRange(), 0));
	EXPECT_EQ(matcher.result().span(), Span(0, 3));
}

TEST(RegexMatch, LongLinearMatchesAreNotCharged) {
	const QString line = QLatin1Char('a') + QString(200000, QLatin1Char('x')) + QLatin1Char('z');
	const UnicodeText text(line);

	const char *patterns[] = {"\\w+", ".*", "(?:x|y)*z", "a.*z", "a[^q]*?z"};

	for (const char *pattern : patterns) {
		const Regex regex(pattern);
		RegexMatch matcher(&regex, 100);
		ASSERT_TRUE(matcher.ExecRE(text.data(), text.length(), text.fullRange(), 0)) << pattern;
		EXPECT_EQ(matcher.result().end(), text.length()) << pattern;
	}

	const Regex word("\\w+");
	RegexMatch matcher(&word);
	ASSERT_TRUE(matcher.ExecRE(text.data(), text.length(), text.fullRange(), 0));
	EXPECT_EQ(matcher.result().span(), text.fullRange());
}

TEST(RegexMatch, DefaultStepLimit) {
	const unsigned long saved = Regex::DefaultStepLimit();
	Regex::SetDefaultStepLimit(123);

	const Regex regex("a");
	RegexMatch matcher(&regex);
	EXPECT_EQ(matcher.stepLimit(), 123UL);

	Regex::SetDefaultStepLimit(saved);
	EXPECT_EQ(Regex::DefaultStepLimit(), saved);
}

TEST(RegexMatch, CompiledRegexFacts) {
	const Regex regex("(?<year>\\d{4})-(\\d\\d)");
	EXPECT_EQ(regex.groupCount(), 2);
	EXPECT_EQ(regex.groupIndex("year"), 1);
	EXPECT_EQ(regex.groupIndex("month"), -1);
	EXPECT_GT(regex.programSize(), 0);
	EXPECT_GE(Regex::unicodeVersion(), QChar::Unicode_6_0);
}

TEST(RegexMatch, ProgramSizeIsLimited) {
	const char *patterns[] = {"(?:abcdefghijklmnopq){65535}", "(?:(?:abcdefghij){1000}){1000}"};

	for (const char *pattern : patterns) {
		try {
			Regex regex(pattern);
			ADD_FAILURE() << "compiled " << pattern;
		} catch (const PatternError &e) {
			EXPECT_EQ(e.kind(), PatternError::SyntaxError) << pattern;
			EXPECT_NE(std::strstr(e.what(), "instructions"), nullptr) << e.what();
		}
	}

	EXPECT_NO_THROW(Regex("(?:abcdefghij){65535}"));
}
