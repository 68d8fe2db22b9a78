
#include "UnicodeText.h"

//------------------------------------------------------------------------------
// Name: mid
//------------------------------------------------------------------------------
QString UnicodeText::mid(Span span) const {

	if (!span.isValid() || span.end > length() || span.isEmpty()) {
		return QString();
	}

	return QString::fromUcs4(codepoints_.constData() + span.start, span.length());
}

//------------------------------------------------------------------------------
// Name: mid
//------------------------------------------------------------------------------
QString UnicodeText::mid(Position start) const {
	return mid(Span(start, length()));
}
