
#include "RegexCommon.h"
#include <QChar>

//------------------------------------------------------------------------------
// Name: foldCase
// Desc: simple (one to one) Unicode case folding
//------------------------------------------------------------------------------
char_type foldCase(char_type c) {
	return QChar::toCaseFolded(c);
}

//------------------------------------------------------------------------------
// Name: equalsIgnoringCase
//------------------------------------------------------------------------------
bool equalsIgnoringCase(char_type a, char_type b) {
	return a == b || foldCase(a) == foldCase(b);
}

//------------------------------------------------------------------------------
// Name: isLineTerminator
// Desc: \n, \v, \f, \r, NEL, LINE SEPARATOR and PARAGRAPH SEPARATOR, or just
//       \n when unix line separators are requested. The \r\n pair is handled
//       by the callers, which look at both characters.
//------------------------------------------------------------------------------
bool isLineTerminator(char_type c, bool unixLines) {

	if (unixLines) {
		return c == '\n';
	}

	switch (c) {
	case 0x000a:
	case 0x000b:
	case 0x000c:
	case 0x000d:
	case 0x0085:
	case 0x2028:
	case 0x2029:
		return true;
	default:
		return false;
	}
}

//------------------------------------------------------------------------------
// Name: isWordChar
// Desc: \w, letters, marks, decimal digits and connector punctuation
//------------------------------------------------------------------------------
bool isWordChar(char_type c) {

	if (c < 0x80) {
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
	}

	if (c == 0x200c || c == 0x200d) { // ZWNJ, ZWJ
		return true;
	}

	switch (QChar::category(c)) {
	case QChar::Letter_Uppercase:
	case QChar::Letter_Lowercase:
	case QChar::Letter_Titlecase:
	case QChar::Letter_Modifier:
	case QChar::Letter_Other:
	case QChar::Mark_NonSpacing:
	case QChar::Mark_SpacingCombining:
	case QChar::Mark_Enclosing:
	case QChar::Number_DecimalDigit:
	case QChar::Punctuation_Connector:
		return true;
	default:
		return false;
	}
}

//------------------------------------------------------------------------------
// Name: isDigitChar
//------------------------------------------------------------------------------
bool isDigitChar(char_type c) {
	if (c < 0x80) {
		return c >= '0' && c <= '9';
	}

	return QChar::category(c) == QChar::Number_DecimalDigit;
}

//------------------------------------------------------------------------------
// Name: isSpaceChar
//------------------------------------------------------------------------------
bool isSpaceChar(char_type c) {
	return QChar::isSpace(c);
}

//------------------------------------------------------------------------------
// Name: isHorizontalSpace
//------------------------------------------------------------------------------
bool isHorizontalSpace(char_type c) {
	return c == '\t' || QChar::category(c) == QChar::Separator_Space;
}

//------------------------------------------------------------------------------
// Name: isVerticalSpace
//------------------------------------------------------------------------------
bool isVerticalSpace(char_type c) {
	return isLineTerminator(c, false);
}
