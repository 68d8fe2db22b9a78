
#ifndef REGEX_CHAR_SET_H_
#define REGEX_CHAR_SET_H_

#include "Types.h"
#include <QString>
#include <cstdint>
#include <vector>

/* A set of code points as written in a [...] class, a shorthand escape such
 * as \d, or a \p{...} property. Membership of the named classes is evaluated
 * through the QChar tables, so nothing here is limited to Latin-1. */
class RegexCharSet {
public:
	enum ClassKind {
		Digit,           // \d, [:digit:]
		Word,            // \w, [:word:]
		Space,           // \s, [:space:]
		HorizontalSpace, // \h, [:blank:]
		VerticalSpace,   // \v
		Categories,      // \p{..} general categories, see 'categories'
		AnyChar,         // \p{Any}
		Ascii,           // \p{ASCII}
		Alphabetic,      // \p{Alphabetic}, [:alpha:]
		Alnum,           // [:alnum:]
		XDigit,          // [:xdigit:]
		Graph,           // [:graph:]
		Print            // [:print:]
	};

	struct Range {
		char_type first;
		char_type last;
	};

	struct Item {
		ClassKind kind;
		bool      negated;
		uint32_t  categories; // Bit per QChar::Category, for kind == Categories
	};

public:
	RegexCharSet();

public:
	void addChar(char_type c);
	void addRange(char_type first, char_type last);
	void addClass(ClassKind kind, bool negated = false, uint32_t categories = 0);
	void addSet(const RegexCharSet &set);
	void setNegated(bool negated);

public:
	bool isEmpty() const;
	bool contains(char_type c, bool caseInsensitive) const;

public:
	/* Adds the \p{name} property to 'set'. Returns false if the name is
	   not a property this engine knows. */
	static bool addProperty(const QString &name, bool negated, RegexCharSet *set);

	/* Adds the [:name:] class to 'set'. Returns false for unknown names. */
	static bool addPosixClass(const QString &name, bool negated, RegexCharSet *set);

private:
	bool containsRaw(char_type c) const;
	static bool classContains(const Item &item, char_type c);

private:
	std::vector<Range>        ranges_;
	std::vector<Item>         items_;
	std::vector<RegexCharSet> subsets_;
	bool                      negated_;
};

#endif
