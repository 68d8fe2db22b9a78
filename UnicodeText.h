
#ifndef UNICODE_TEXT_H_
#define UNICODE_TEXT_H_

#include "Types.h"
#include <QString>
#include <QVector>

/* A QString unpacked into code points. The regex engine indexes text by
   code point, this converts between that and QString's UTF-16. */
class UnicodeText {
public:
	UnicodeText() {
	}

	explicit UnicodeText(const QString &text) : codepoints_(text.toUcs4()) {
	}

public:
	Position length() const {
		return codepoints_.size();
	}

	bool isEmpty() const {
		return codepoints_.isEmpty();
	}

	const char_type *data() const {
		return codepoints_.constData();
	}

	char_type at(Position pos) const {
		return codepoints_.at(pos);
	}

	Span fullRange() const {
		return Span(0, length());
	}

	// Text of 'span', empty for an invalid span.
	QString mid(Span span) const;

	// Text from 'start' to the end.
	QString mid(Position start) const;

	QString toString() const {
		return mid(fullRange());
	}

private:
	QVector<uint> codepoints_;
};

#endif
