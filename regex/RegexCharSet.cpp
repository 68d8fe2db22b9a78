
#include "RegexCharSet.h"
#include "RegexCommon.h"
#include <QChar>

namespace {

uint32_t bit(QChar::Category category) {
	return 1u << static_cast<int>(category);
}

const uint32_t LetterMask = bit(QChar::Letter_Uppercase) | bit(QChar::Letter_Lowercase) | bit(QChar::Letter_Titlecase) |
                            bit(QChar::Letter_Modifier) | bit(QChar::Letter_Other);

const uint32_t CasedLetterMask = bit(QChar::Letter_Uppercase) | bit(QChar::Letter_Lowercase) | bit(QChar::Letter_Titlecase);

const uint32_t MarkMask = bit(QChar::Mark_NonSpacing) | bit(QChar::Mark_SpacingCombining) | bit(QChar::Mark_Enclosing);

const uint32_t NumberMask = bit(QChar::Number_DecimalDigit) | bit(QChar::Number_Letter) | bit(QChar::Number_Other);

const uint32_t PunctuationMask = bit(QChar::Punctuation_Connector) | bit(QChar::Punctuation_Dash) | bit(QChar::Punctuation_Open) |
                                 bit(QChar::Punctuation_Close) | bit(QChar::Punctuation_InitialQuote) |
                                 bit(QChar::Punctuation_FinalQuote) | bit(QChar::Punctuation_Other);

const uint32_t SymbolMask = bit(QChar::Symbol_Math) | bit(QChar::Symbol_Currency) | bit(QChar::Symbol_Modifier) | bit(QChar::Symbol_Other);

const uint32_t SeparatorMask = bit(QChar::Separator_Space) | bit(QChar::Separator_Line) | bit(QChar::Separator_Paragraph);

const uint32_t OtherMask = bit(QChar::Other_Control) | bit(QChar::Other_Format) | bit(QChar::Other_Surrogate) |
                           bit(QChar::Other_PrivateUse) | bit(QChar::Other_NotAssigned);

struct PropertyName {
	const char *shortName;
	const char *longName;
	uint32_t    mask;
};

const PropertyName PropertyNames[] = {
	{"L",  "Letter",                LetterMask},
	{"LC", "Cased_Letter",          CasedLetterMask},
	{"L&", "L&",                    CasedLetterMask},
	{"Lu", "Uppercase_Letter",      bit(QChar::Letter_Uppercase)},
	{"Ll", "Lowercase_Letter",      bit(QChar::Letter_Lowercase)},
	{"Lt", "Titlecase_Letter",      bit(QChar::Letter_Titlecase)},
	{"Lm", "Modifier_Letter",       bit(QChar::Letter_Modifier)},
	{"Lo", "Other_Letter",          bit(QChar::Letter_Other)},
	{"M",  "Mark",                  MarkMask},
	{"Mn", "Nonspacing_Mark",       bit(QChar::Mark_NonSpacing)},
	{"Mc", "Spacing_Mark",          bit(QChar::Mark_SpacingCombining)},
	{"Me", "Enclosing_Mark",        bit(QChar::Mark_Enclosing)},
	{"N",  "Number",                NumberMask},
	{"Nd", "Decimal_Number",        bit(QChar::Number_DecimalDigit)},
	{"Nl", "Letter_Number",         bit(QChar::Number_Letter)},
	{"No", "Other_Number",          bit(QChar::Number_Other)},
	{"P",  "Punctuation",           PunctuationMask},
	{"Pc", "Connector_Punctuation", bit(QChar::Punctuation_Connector)},
	{"Pd", "Dash_Punctuation",      bit(QChar::Punctuation_Dash)},
	{"Ps", "Open_Punctuation",      bit(QChar::Punctuation_Open)},
	{"Pe", "Close_Punctuation",     bit(QChar::Punctuation_Close)},
	{"Pi", "Initial_Punctuation",   bit(QChar::Punctuation_InitialQuote)},
	{"Pf", "Final_Punctuation",     bit(QChar::Punctuation_FinalQuote)},
	{"Po", "Other_Punctuation",     bit(QChar::Punctuation_Other)},
	{"S",  "Symbol",                SymbolMask},
	{"Sm", "Math_Symbol",           bit(QChar::Symbol_Math)},
	{"Sc", "Currency_Symbol",       bit(QChar::Symbol_Currency)},
	{"Sk", "Modifier_Symbol",       bit(QChar::Symbol_Modifier)},
	{"So", "Other_Symbol",          bit(QChar::Symbol_Other)},
	{"Z",  "Separator",             SeparatorMask},
	{"Zs", "Space_Separator",       bit(QChar::Separator_Space)},
	{"Zl", "Line_Separator",        bit(QChar::Separator_Line)},
	{"Zp", "Paragraph_Separator",   bit(QChar::Separator_Paragraph)},
	{"C",  "Other",                 OtherMask},
	{"Cc", "Control",               bit(QChar::Other_Control)},
	{"Cf", "Format",                bit(QChar::Other_Format)},
	{"Cs", "Surrogate",             bit(QChar::Other_Surrogate)},
	{"Co", "Private_Use",           bit(QChar::Other_PrivateUse)},
	{"Cn", "Unassigned",            bit(QChar::Other_NotAssigned)},
};

/*--------------------------------------------------------------------*
 * looseName
 *
 * Property names compare without regard to case, white space,
 * underscores and hyphens ("Uppercase Letter" == "uppercase_letter").
 *--------------------------------------------------------------------*/
QString looseName(const QString &name) {
	QString ret;
	for (QChar ch : name) {
		if (ch == QLatin1Char('_') || ch == QLatin1Char('-') || ch.isSpace()) {
			continue;
		}
		ret += ch.toLower();
	}
	return ret;
}

bool isHexLetter(char_type c) {
	return (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}

//------------------------------------------------------------------------------
// Name: RegexCharSet
//------------------------------------------------------------------------------
RegexCharSet::RegexCharSet() : negated_(false) {
}

//------------------------------------------------------------------------------
// Name: addChar
//------------------------------------------------------------------------------
void RegexCharSet::addChar(char_type c) {
	addRange(c, c);
}

//------------------------------------------------------------------------------
// Name: addRange
//------------------------------------------------------------------------------
void RegexCharSet::addRange(char_type first, char_type last) {
	Range range;
	range.first = first;
	range.last  = last;
	ranges_.push_back(range);
}

//------------------------------------------------------------------------------
// Name: addClass
//------------------------------------------------------------------------------
void RegexCharSet::addClass(ClassKind kind, bool negated, uint32_t categories) {
	Item item;
	item.kind       = kind;
	item.negated    = negated;
	item.categories = categories;
	items_.push_back(item);
}

//------------------------------------------------------------------------------
// Name: addSet
// Desc: a nested [...] inside a class is a union member
//------------------------------------------------------------------------------
void RegexCharSet::addSet(const RegexCharSet &set) {
	subsets_.push_back(set);
}

//------------------------------------------------------------------------------
// Name: setNegated
//------------------------------------------------------------------------------
void RegexCharSet::setNegated(bool negated) {
	negated_ = negated;
}

//------------------------------------------------------------------------------
// Name: isEmpty
//------------------------------------------------------------------------------
bool RegexCharSet::isEmpty() const {
	return ranges_.empty() && items_.empty() && subsets_.empty();
}

//------------------------------------------------------------------------------
// Name: contains
// Desc: With case insensitivity a character is a member if any of its simple
//       case variants is.
//------------------------------------------------------------------------------
bool RegexCharSet::contains(char_type c, bool caseInsensitive) const {

	bool found = containsRaw(c);

	if (!found && caseInsensitive) {
		const char_type variants[] = {
			foldCase(c),
			QChar::toLower(c),
			QChar::toUpper(c),
			QChar::toTitleCase(c)
		};

		for (char_type v : variants) {
			if (v != c && containsRaw(v)) {
				found = true;
				break;
			}
		}
	}

	return negated_ ? !found : found;
}

//------------------------------------------------------------------------------
// Name: containsRaw
//------------------------------------------------------------------------------
bool RegexCharSet::containsRaw(char_type c) const {

	for (const Range &range : ranges_) {
		if (c >= range.first && c <= range.last) {
			return true;
		}
	}

	for (const Item &item : items_) {
		if (classContains(item, c) != item.negated) {
			return true;
		}
	}

	for (const RegexCharSet &set : subsets_) {
		if (set.contains(c, false)) {
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: classContains
//------------------------------------------------------------------------------
bool RegexCharSet::classContains(const Item &item, char_type c) {

	switch (item.kind) {
	case Digit:
		return isDigitChar(c);
	case Word:
		return isWordChar(c);
	case Space:
		return isSpaceChar(c);
	case HorizontalSpace:
		return isHorizontalSpace(c);
	case VerticalSpace:
		return isVerticalSpace(c);
	case Categories:
		return (item.categories & bit(QChar::category(c))) != 0;
	case AnyChar:
		return true;
	case Ascii:
		return c < 0x80;
	case Alphabetic:
		return ((LetterMask | bit(QChar::Number_Letter)) & bit(QChar::category(c))) != 0;
	case Alnum:
		return ((LetterMask | bit(QChar::Number_Letter) | bit(QChar::Number_DecimalDigit)) & bit(QChar::category(c))) != 0;
	case XDigit:
		return isDigitChar(c) || isHexLetter(c);
	case Graph:
		return !isSpaceChar(c) && ((bit(QChar::Other_Control) | bit(QChar::Other_Surrogate) | bit(QChar::Other_NotAssigned)) & bit(QChar::category(c))) == 0;
	case Print:
		return (isHorizontalSpace(c) || (!isSpaceChar(c) && ((bit(QChar::Other_Control) | bit(QChar::Other_Surrogate) | bit(QChar::Other_NotAssigned)) & bit(QChar::category(c))) == 0));
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: addProperty
//------------------------------------------------------------------------------
bool RegexCharSet::addProperty(const QString &name, bool negated, RegexCharSet *set) {

	QString key = name;

	// Accept gc=Lu and General_Category=Lu
	const int eq = key.indexOf(QLatin1Char('='));
	if (eq >= 0) {
		const QString prefix = looseName(key.left(eq));
		if (prefix != QLatin1String("gc") && prefix != QLatin1String("generalcategory")) {
			return false;
		}
		key = key.mid(eq + 1);
	}

	const QString loose = looseName(key);

	if (loose == QLatin1String("any")) {
		set->addClass(AnyChar, negated);
		return true;
	} else if (loose == QLatin1String("ascii")) {
		set->addClass(Ascii, negated);
		return true;
	} else if (loose == QLatin1String("alphabetic") || loose == QLatin1String("alpha")) {
		set->addClass(Alphabetic, negated);
		return true;
	} else if (loose == QLatin1String("whitespace") || loose == QLatin1String("space")) {
		set->addClass(Space, negated);
		return true;
	}

	for (const PropertyName &property : PropertyNames) {
		if (looseName(QLatin1String(property.shortName)) == loose || looseName(QLatin1String(property.longName)) == loose) {
			set->addClass(Categories, negated, property.mask);
			return true;
		}
	}

	return false;
}

//------------------------------------------------------------------------------
// Name: addPosixClass
//------------------------------------------------------------------------------
bool RegexCharSet::addPosixClass(const QString &name, bool negated, RegexCharSet *set) {

	if (name == QLatin1String("alpha")) {
		set->addClass(Alphabetic, negated);
	} else if (name == QLatin1String("digit")) {
		set->addClass(Digit, negated);
	} else if (name == QLatin1String("alnum")) {
		set->addClass(Alnum, negated);
	} else if (name == QLatin1String("upper")) {
		set->addClass(Categories, negated, bit(QChar::Letter_Uppercase));
	} else if (name == QLatin1String("lower")) {
		set->addClass(Categories, negated, bit(QChar::Letter_Lowercase));
	} else if (name == QLatin1String("space")) {
		set->addClass(Space, negated);
	} else if (name == QLatin1String("blank")) {
		set->addClass(HorizontalSpace, negated);
	} else if (name == QLatin1String("punct")) {
		set->addClass(Categories, negated, PunctuationMask);
	} else if (name == QLatin1String("cntrl")) {
		set->addClass(Categories, negated, bit(QChar::Other_Control));
	} else if (name == QLatin1String("xdigit")) {
		set->addClass(XDigit, negated);
	} else if (name == QLatin1String("graph")) {
		set->addClass(Graph, negated);
	} else if (name == QLatin1String("print")) {
		set->addClass(Print, negated);
	} else if (name == QLatin1String("word")) {
		set->addClass(Word, negated);
	} else {
		return false;
	}

	return true;
}
