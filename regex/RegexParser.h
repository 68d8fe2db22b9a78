
#ifndef REGEX_PARSER_H_
#define REGEX_PARSER_H_

#include "RegexAst.h"
#include "RegexOptions.h"
#include "Types.h"
#include <QString>
#include <vector>

class RegexCharSet;

/* Recursive descent parser turning a pattern into a RegexAst. Precedence,
 * lowest first: alternation ('|'), concatenation, repetition, atoms.
 * Throws PatternError on the first problem found. */
class RegexParser {
public:
	RegexParser(const QString &pattern, RegexOptions options);

private:
	RegexParser(const RegexParser &) = delete;
	RegexParser &operator=(const RegexParser &) = delete;

public:
	void parse(RegexAst *ast);

private:
	int chunk(int depth);
	int alternative(int depth);
	int piece(int depth);
	int atom(int depth);
	int group(int depth);
	int escape();
	int bracketClass(int depth);
	void classBody(RegexCharSet *set, int depth);
	bool classEscape(RegexCharSet *set, char_type *single);
	int namedBackReference(const QString &name, int position);
	int quoted(int position);
	int lineBreak(int position);
	void property(RegexCharSet *set);

private:
	bool quantifier(int *min, int *max);
	bool parseCount(int *p, int *value, bool *present);
	bool shortcutEscape(char_type c, RegexCharSet *set);
	bool literalEscape(char_type c, char_type *value);
	char_type numericEscape(char_type c);
	char_type hexDigits(int minDigits, int maxDigits, int position);
	QString groupName(char_type close);
	void inlineFlags(bool *scoped);
	void skipIgnored();
	bool atEnd() const;
	char_type peek(int ahead = 0) const;
	bool lookingAt(const char *text) const;
	int newNode(NodeType type);
	int newLiteral(char_type c);
	int newAnchor(AnchorKind kind, int length, int position = -1);
	int newSetNode(const RegexCharSet &set);

private:
	std::vector<char_type> regex_;
	RegexOptions           options_;
	RegexAst *             ast_;
	int                    Reg_Parse;    // Input scan offset into regex_
	int                    Total_Paren;  // Capturing parentheses opened so far
	NodeFlags              flags_;       // Flags in effect at Reg_Parse
	bool                   extended_;    // White space and # comments are ignored
	std::vector<QString>   groupNames_;
};

#endif
