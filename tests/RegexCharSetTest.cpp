
#include "RegexCharSet.h"
#include <gtest/gtest.h>
#include <QChar>

TEST(RegexCharSet, CharsAndRanges) {
	RegexCharSet set;
	set.addChar('x');
	set.addRange('a', 'f');

	EXPECT_TRUE(set.contains('a', false));
	EXPECT_TRUE(set.contains('f', false));
	EXPECT_TRUE(set.contains('x', false));
	EXPECT_FALSE(set.contains('g', false));
	EXPECT_FALSE(set.contains('A', false));
	EXPECT_TRUE(set.contains('A', true));
}

TEST(RegexCharSet, NegationIsAppliedAfterCaseFolding) {
	RegexCharSet set;
	set.addRange('a', 'z');
	set.setNegated(true);

	EXPECT_FALSE(set.contains('q', false));
	EXPECT_TRUE(set.contains('Q', false));
	EXPECT_FALSE(set.contains('Q', true));
	EXPECT_TRUE(set.contains('1', true));
}

TEST(RegexCharSet, EmptySet) {
	RegexCharSet set;
	EXPECT_TRUE(set.isEmpty());
	EXPECT_FALSE(set.contains('a', false));

	set.addClass(RegexCharSet::Digit);
	EXPECT_FALSE(set.isEmpty());
}

TEST(RegexCharSet, ShorthandClassesAreUnicodeAware) {
	RegexCharSet digits;
	digits.addClass(RegexCharSet::Digit);
	EXPECT_TRUE(digits.contains('7', false));
	EXPECT_TRUE(digits.contains(0x0664, false));
	EXPECT_FALSE(digits.contains('x', false));

	RegexCharSet word;
	word.addClass(RegexCharSet::Word);
	EXPECT_TRUE(word.contains('_', false));
	EXPECT_TRUE(word.contains(0x00e9, false));
	EXPECT_FALSE(word.contains('-', false));

	RegexCharSet notSpace;
	notSpace.addClass(RegexCharSet::Space, true);
	EXPECT_FALSE(notSpace.contains(' ', false));
	EXPECT_FALSE(notSpace.contains(0x2003, false));
	EXPECT_TRUE(notSpace.contains('a', false));
}

TEST(RegexCharSet, HorizontalAndVerticalSpace) {
	RegexCharSet h;
	h.addClass(RegexCharSet::HorizontalSpace);
	EXPECT_TRUE(h.contains('\t', false));
	EXPECT_FALSE(h.contains('\n', false));

	RegexCharSet v;
	v.addClass(RegexCharSet::VerticalSpace);
	EXPECT_TRUE(v.contains('\n', false));
	EXPECT_TRUE(v.contains(0x2028, false));
	EXPECT_FALSE(v.contains(' ', false));
}

TEST(RegexCharSet, PropertyNames) {
	RegexCharSet upper;
	ASSERT_TRUE(RegexCharSet::addProperty("Lu", false, &upper));
	EXPECT_TRUE(upper.contains('Q', false));
	EXPECT_FALSE(upper.contains('q', false));

	RegexCharSet longName;
	ASSERT_TRUE(RegexCharSet::addProperty("Uppercase Letter", false, &longName));
	EXPECT_TRUE(longName.contains(0x0391, false));

	RegexCharSet cased;
	ASSERT_TRUE(RegexCharSet::addProperty("L&", false, &cased));
	EXPECT_TRUE(cased.contains('a', false));
	EXPECT_FALSE(cased.contains(0x05d0, false));

	RegexCharSet decimal;
	ASSERT_TRUE(RegexCharSet::addProperty("gc=Nd", false, &decimal));
	EXPECT_TRUE(decimal.contains('3', false));

	RegexCharSet notLetter;
	ASSERT_TRUE(RegexCharSet::addProperty("L", true, &notLetter));
	EXPECT_TRUE(notLetter.contains('1', false));
	EXPECT_FALSE(notLetter.contains('z', false));
}

TEST(RegexCharSet, BinaryProperties) {
	RegexCharSet any;
	ASSERT_TRUE(RegexCharSet::addProperty("Any", false, &any));
	EXPECT_TRUE(any.contains(0x1f600, false));

	RegexCharSet ascii;
	ASSERT_TRUE(RegexCharSet::addProperty("ASCII", false, &ascii));
	EXPECT_TRUE(ascii.contains(0x7f, false));
	EXPECT_FALSE(ascii.contains(0x80, false));
}

TEST(RegexCharSet, UnknownPropertyIsRejected) {
	RegexCharSet set;
	EXPECT_FALSE(RegexCharSet::addProperty("NoSuchProperty", false, &set));
	EXPECT_FALSE(RegexCharSet::addPosixClass("nosuch", false, &set));
}

TEST(RegexCharSet, PosixClasses) {
	RegexCharSet alpha;
	ASSERT_TRUE(RegexCharSet::addPosixClass("alpha", false, &alpha));
	EXPECT_TRUE(alpha.contains('k', false));
	EXPECT_FALSE(alpha.contains('5', false));

	RegexCharSet xdigit;
	ASSERT_TRUE(RegexCharSet::addPosixClass("xdigit", false, &xdigit));
	EXPECT_TRUE(xdigit.contains('F', false));
	EXPECT_FALSE(xdigit.contains('g', false));
}

TEST(RegexCharSet, NestedSets) {
	RegexCharSet inner;
	inner.addRange('0', '9');
	inner.setNegated(true);

	RegexCharSet outer;
	outer.addChar('5');
	outer.addSet(inner);

	EXPECT_TRUE(outer.contains('5', false));
	EXPECT_TRUE(outer.contains('a', false));
	EXPECT_FALSE(outer.contains('6', false));
}
