
#include "RegexParser.h"
#include "RegexCharSet.h"
#include "RegexCommon.h"
#include "RegexException.h"
#include <QVector>

namespace {

bool isAsciiDigit(char_type c) {
	return c >= '0' && c <= '9';
}

bool isAsciiAlnum(char_type c) {
	return isAsciiDigit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

int hexValue(char_type c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	if (c >= 'a' && c <= 'f') {
		return c - 'a' + 10;
	}
	if (c >= 'A' && c <= 'F') {
		return c - 'A' + 10;
	}
	return -1;
}

const char_type MaxCodePoint = 0x10ffff;

}

//------------------------------------------------------------------------------
// Name: RegexParser
//------------------------------------------------------------------------------
RegexParser::RegexParser(const QString &pattern, RegexOptions options) : options_(options), ast_(nullptr), Reg_Parse(0), Total_Paren(0), extended_(false) {
	const QVector<uint> codepoints = pattern.toUcs4();
	regex_.assign(codepoints.begin(), codepoints.end());
}

/*----------------------------------------------------------------------*
 * parse
 *
 * Fills 'ast' with the tree for the pattern given to the constructor.
 * The options seed the flags every node starts with; inline modifiers
 * may change them further down.
 *----------------------------------------------------------------------*/
void RegexParser::parse(RegexAst *ast) {

	ast_        = ast;
	Reg_Parse   = 0;
	Total_Paren = 0;
	groupNames_.assign(1, QString());

	flags_                 = NodeFlags();
	flags_.caseInsensitive = options_.testFlag(CaseInsensitive);
	flags_.dotAll          = options_.testFlag(DotMatchesLineSeparators);
	flags_.multiline       = options_.testFlag(AnchorsMatchLines);
	flags_.unixLines       = options_.testFlag(UseUnixLineSeparators);
	extended_              = options_.testFlag(AllowCommentsAndWhitespace);

	int root;

	if (options_.testFlag(IgnoreMetacharacters)) {
		std::vector<int> literals;
		for (; !atEnd(); ++Reg_Parse) {
			literals.push_back(newLiteral(peek()));
		}

		root = newNode(NodeType::Concat);
		ast_->node(root).children = literals;
		ast_->node(root).position = 0;
	} else {
		root = chunk(0);

		if (!atEnd()) {
			if (peek() == ')') {
				throw PatternError(PatternError::SyntaxError, Reg_Parse, "missing left parenthesis '('");
			}

			throw PatternError(PatternError::SyntaxError, Reg_Parse, "junk on end");
		}
	}

	ast_->setRoot(root);
	ast_->setGroupCount(Total_Paren);
	ast_->setGroupNames(groupNames_);
}

/*----------------------------------------------------------------------*
 * chunk
 *
 * Processes alternatives separated by '|' up to the end of the pattern
 * or the closing parenthesis of the enclosing group.
 *----------------------------------------------------------------------*/
int RegexParser::chunk(int depth) {

	const int position = Reg_Parse;
	const int first    = alternative(depth);

	if (atEnd() || peek() != '|') {
		return first;
	}

	std::vector<int> branches(1, first);

	while (!atEnd() && peek() == '|') {
		++Reg_Parse;
		const int next = alternative(depth);
		branches.push_back(next);
	}

	const int alt = newNode(NodeType::Alternation);
	ast_->node(alt).children = branches;
	ast_->node(alt).position = position;
	return alt;
}

/*----------------------------------------------------------------------*
 * alternative
 *
 * A sequence of pieces. An empty alternative matches the empty string.
 *----------------------------------------------------------------------*/
int RegexParser::alternative(int depth) {

	const int position = Reg_Parse;
	std::vector<int> items;

	for (;;) {
		skipIgnored();

		if (atEnd() || peek() == '|' || peek() == ')') {
			break;
		}

		const int item = piece(depth);
		items.push_back(item);
	}

	if (items.size() == 1) {
		return items[0];
	}

	const int id = newNode(items.empty() ? NodeType::Empty : NodeType::Concat);
	ast_->node(id).children = items;
	ast_->node(id).position = position;
	return id;
}

/*----------------------------------------------------------------------*
 * piece
 *
 * An atom optionally followed by a quantifier: *, +, ?, {m,n}, each of
 * which may be made lazy with '?' or possessive with '+'.
 *----------------------------------------------------------------------*/
int RegexParser::piece(int depth) {

	const int position = Reg_Parse;
	const int operand  = atom(depth);

	skipIgnored();

	int min;
	int max;
	if (!quantifier(&min, &max)) {
		return operand;
	}

	bool greedy     = true;
	bool possessive = false;

	if (!atEnd() && peek() == '?') {
		greedy = false;
		++Reg_Parse;
	} else if (!atEnd() && peek() == '+') {
		possessive = true;
		++Reg_Parse;
	}

	const int rep = newNode(NodeType::Repetition);
	{
		RegexNode &n = ast_->node(rep);
		n.children.push_back(operand);
		n.min        = min;
		n.max        = max;
		n.greedy     = greedy;
		n.possessive = possessive;
		n.position   = position;
	}

	skipIgnored();

	const int next = Reg_Parse;
	if (!atEnd() && (peek() == '*' || peek() == '+' || peek() == '?')) {
		throw PatternError(PatternError::SyntaxError, next, "nested quantifiers, %c", peek());
	}

	int dummy_min;
	int dummy_max;
	if (quantifier(&dummy_min, &dummy_max)) {
		throw PatternError(PatternError::SyntaxError, next, "nested quantifiers, {m,n}");
	}

	return rep;
}

/*----------------------------------------------------------------------*
 * quantifier
 *
 * Consumes a quantifier at Reg_Parse and reports its bounds. A '{' that
 * does not start a well formed {m}, {m,}, {,n} or {m,n} is left alone so
 * that it can be taken literally.
 *----------------------------------------------------------------------*/
bool RegexParser::quantifier(int *min, int *max) {

	if (atEnd()) {
		return false;
	}

	switch (peek()) {
	case '*':
		++Reg_Parse;
		*min = 0;
		*max = REG_INFINITY;
		return true;
	case '+':
		++Reg_Parse;
		*min = 1;
		*max = REG_INFINITY;
		return true;
	case '?':
		++Reg_Parse;
		*min = 0;
		*max = 1;
		return true;
	case '{':
		break;
	default:
		return false;
	}

	int  p = Reg_Parse + 1;
	int  low;
	int  high;
	bool has_low;
	bool has_high = false;
	bool comma    = false;

	if (!parseCount(&p, &low, &has_low)) {
		return false;
	}

	if (p < static_cast<int>(regex_.size()) && regex_[p] == ',') {
		comma = true;
		++p;
		if (!parseCount(&p, &high, &has_high)) {
			return false;
		}
	}

	if (p >= static_cast<int>(regex_.size()) || regex_[p] != '}' || (!has_low && !comma)) {
		return false;
	}

	if (!has_low) {
		low = 0;
	}

	if (!comma) {
		high = low;
	} else if (!has_high) {
		high = REG_INFINITY;
	}

	if (high != REG_INFINITY && low > high) {
		throw PatternError(PatternError::SyntaxError, Reg_Parse, "{%d,%d} is an invalid range", low, high);
	}

	Reg_Parse = p + 1;
	*min      = low;
	*max      = high;
	return true;
}

//------------------------------------------------------------------------------
// Name: parseCount
// Desc: Reads an optional decimal count starting at *p. Fails only when the
//       text at *p cannot be part of a {m,n} construct.
//------------------------------------------------------------------------------
bool RegexParser::parseCount(int *p, int *value, bool *present) {

	unsigned long count = 0;
	int digits          = 0;
	const int start     = *p;

	while (*p < static_cast<int>(regex_.size()) && isAsciiDigit(regex_[*p])) {
		count = count * 10 + (regex_[*p] - '0');
		if (count > REG_MAX_COUNT) {
			throw PatternError(PatternError::SyntaxError, start, "operand of {m,n} > %lu", REG_MAX_COUNT);
		}
		++*p;
		++digits;
	}

	*present = digits != 0;
	*value   = static_cast<int>(count);
	return true;
}

/*----------------------------------------------------------------------*
 * atom
 *
 * Process one regex item at the lowest level.
 *----------------------------------------------------------------------*/
int RegexParser::atom(int depth) {

	const char_type c = peek();

	switch (c) {
	case '(':
		return group(depth);

	case '[':
		return bracketClass(depth);

	case '.': {
		const int id = newNode(NodeType::Any);
		++Reg_Parse;
		return id;
	}

	case '^':
		return newAnchor(AnchorKind::LineStart, 1);

	case '$':
		return newAnchor(AnchorKind::LineEnd, 1);

	case '\\':
		return escape();

	case '*':
	case '+':
	case '?':
		throw PatternError(PatternError::SyntaxError, Reg_Parse, "%c follows nothing", c);

	case '{': {
		const int position = Reg_Parse;
		int min;
		int max;
		if (quantifier(&min, &max)) {
			throw PatternError(PatternError::SyntaxError, position, "{m,n} follows nothing");
		}
		break;
	}

	default:
		break;
	}

	const int id = newLiteral(c);
	++Reg_Parse;
	return id;
}

/*----------------------------------------------------------------------*
 * group
 *
 * Everything starting with '(': capturing and named groups, (?:...),
 * atomic groups, look-around and inline modifiers.
 *----------------------------------------------------------------------*/
int RegexParser::group(int depth) {

	const int position = Reg_Parse;

	if (depth >= MaxNestingDepth) {
		throw PatternError(PatternError::SyntaxError, position, "parentheses nested deeper than %d", MaxNestingDepth);
	}

	++Reg_Parse; // Skip '('

	const NodeFlags saved_flags    = flags_;
	const bool      saved_extended = extended_;

	NodeType type      = NodeType::Group;
	bool     capturing = true;
	bool     behind    = false;
	bool     negated   = false;
	QString  name;

	if (!atEnd() && peek() == '?') {
		++Reg_Parse;
		capturing = false;

		if (atEnd()) {
			throw PatternError(PatternError::SyntaxError, Reg_Parse, "missing right parenthesis ')'");
		}

		const char_type c = peek();

		switch (c) {
		case ':':
			++Reg_Parse;
			break;

		case '>':
			++Reg_Parse;
			type = NodeType::Atomic;
			break;

		case '=':
		case '!':
			++Reg_Parse;
			type    = NodeType::LookAround;
			negated = (c == '!');
			break;

		case '<':
			if (peek(1) == '=' || peek(1) == '!') {
				type    = NodeType::LookAround;
				behind  = true;
				negated = (peek(1) == '!');
				Reg_Parse += 2;
			} else {
				++Reg_Parse;
				name      = groupName('>');
				capturing = true;
			}
			break;

		case '\'':
			++Reg_Parse;
			name      = groupName('\'');
			capturing = true;
			break;

		case 'P':
			if (peek(1) == '<') {
				Reg_Parse += 2;
				name      = groupName('>');
				capturing = true;
			} else if (peek(1) == '=') {
				Reg_Parse += 2;
				return namedBackReference(groupName(')'), position);
			} else if (peek(1) == '>') {
				throw PatternError(PatternError::UnsupportedFeature, position, "recursive patterns are not supported");
			} else {
				throw PatternError(PatternError::SyntaxError, Reg_Parse, "invalid grouping syntax, \"(?P...)\"");
			}
			break;

		case 'R':
		case '&':
		case '+':
			throw PatternError(PatternError::UnsupportedFeature, position, "recursive patterns are not supported");

		case '(':
			throw PatternError(PatternError::UnsupportedFeature, position, "conditional patterns are not supported");

		case '|':
			throw PatternError(PatternError::UnsupportedFeature, position, "branch reset groups are not supported");

		default:
			if (isAsciiDigit(c) || (c == '-' && isAsciiDigit(peek(1)))) {
				throw PatternError(PatternError::UnsupportedFeature, position, "recursive patterns are not supported");
			}

			bool scoped;
			inlineFlags(&scoped);

			if (!scoped) {
				// (?i) and friends: the new flags stay in effect until the
				// enclosing group closes.
				const int id = newNode(NodeType::Empty);
				ast_->node(id).position = position;
				return id;
			}
			break;
		}
	}

	int index = 0;
	if (capturing) {
		if (Total_Paren >= NSUBEXP) {
			throw PatternError(PatternError::SyntaxError, position, "number of ()'s > %d", NSUBEXP);
		}

		if (!name.isEmpty()) {
			for (const QString &existing : groupNames_) {
				if (existing == name) {
					throw PatternError(PatternError::SyntaxError, position, "duplicate group name '%s'", qPrintable(name));
				}
			}
		}

		index = ++Total_Paren;
		groupNames_.push_back(name);
	}

	const int body = chunk(depth + 1);

	if (atEnd() || peek() != ')') {
		throw PatternError(PatternError::SyntaxError, Reg_Parse, "missing right parenthesis ')'");
	}

	++Reg_Parse;

	flags_    = saved_flags;
	extended_ = saved_extended;

	if (behind) {
		long min;
		long max;
		ast_->widthRange(body, &min, &max);

		if (max == REG_INFINITY) {
			throw PatternError(PatternError::UnsupportedFeature, position, "look-behind does not have a bounded size");
		}

		if (max > static_cast<long>(REG_MAX_COUNT)) {
			throw PatternError(PatternError::UnsupportedFeature, position, "max. look-behind size is too large (>%lu)", REG_MAX_COUNT);
		}
	}

	const int id = newNode(type);
	RegexNode &n = ast_->node(id);
	n.children.push_back(body);
	n.capturing  = capturing;
	n.groupIndex = index;
	n.name       = name;
	n.behind     = behind;
	n.negated    = negated;
	n.position   = position;
	return id;
}

//------------------------------------------------------------------------------
// Name: inlineFlags
// Desc: Reads modifier letters after "(?". Sets 'scoped' when they end with
//       ':' and so apply to a group body rather than to the rest of the
//       enclosing group.
//------------------------------------------------------------------------------
void RegexParser::inlineFlags(bool *scoped) {

	NodeFlags flags    = flags_;
	bool      extended = extended_;
	bool      on       = true;

	for (;;) {
		if (atEnd()) {
			throw PatternError(PatternError::SyntaxError, Reg_Parse, "missing right parenthesis ')'");
		}

		const char_type c = peek();
		++Reg_Parse;

		switch (c) {
		case 'i':
			flags.caseInsensitive = on;
			break;
		case 'm':
			flags.multiline = on;
			break;
		case 's':
			flags.dotAll = on;
			break;
		case 'x':
			extended = on;
			break;
		case 'd':
			flags.unixLines = on;
			break;
		case 'w':
			// Unicode word boundaries are what \b always does here.
			break;
		case '-':
			if (!on) {
				throw PatternError(PatternError::SyntaxError, Reg_Parse - 1, "invalid grouping syntax, \"(?-...-...)\"");
			}
			on = false;
			break;
		case ')':
		case ':':
			*scoped   = (c == ':');
			flags_    = flags;
			extended_ = extended;
			return;
		default:
			if (c < 0x80) {
				throw PatternError(PatternError::SyntaxError, Reg_Parse - 1, "invalid grouping syntax, \"(?%c...)\"", static_cast<char>(c));
			}
			throw PatternError(PatternError::SyntaxError, Reg_Parse - 1, "invalid grouping syntax");
		}
	}
}

//------------------------------------------------------------------------------
// Name: groupName
// Desc: Reads a group name and the delimiter that ends it.
//------------------------------------------------------------------------------
QString RegexParser::groupName(char_type close) {

	const int start = Reg_Parse;

	while (!atEnd() && peek() != close) {
		const char_type c = peek();
		if (!isWordChar(c) || (Reg_Parse == start && isAsciiDigit(c))) {
			throw PatternError(PatternError::SyntaxError, Reg_Parse, "invalid character in group name");
		}
		++Reg_Parse;
	}

	if (atEnd()) {
		throw PatternError(PatternError::SyntaxError, start, "group name is missing its closing '%c'", static_cast<char>(close));
	}

	if (Reg_Parse == start) {
		throw PatternError(PatternError::SyntaxError, start, "empty group name");
	}

	const QString name = QString::fromUcs4(&regex_[start], Reg_Parse - start);
	++Reg_Parse; // Skip the delimiter
	return name;
}

/*----------------------------------------------------------------------*
 * escape
 *
 * A backslash sequence outside of a [...] class.
 *----------------------------------------------------------------------*/
int RegexParser::escape() {

	const int position = Reg_Parse;

	++Reg_Parse; // Skip '\'

	if (atEnd()) {
		throw PatternError(PatternError::SyntaxError, position, "trailing backslash");
	}

	const char_type c = peek();

	switch (c) {
	case 'b':
		return newAnchor(AnchorKind::WordBoundary, 1, position);
	case 'B':
		return newAnchor(AnchorKind::NotWordBoundary, 1, position);
	case 'A':
		return newAnchor(AnchorKind::TextStart, 1, position);
	case 'z':
		return newAnchor(AnchorKind::TextEnd, 1, position);
	case 'Z':
		return newAnchor(AnchorKind::TextEndOrLine, 1, position);

	case 'G':
	case 'K':
	case 'X':
		throw PatternError(PatternError::UnsupportedFeature, position, "\\%c is not supported", static_cast<char>(c));

	case 'N':
		if (peek(1) == '{') {
			throw PatternError(PatternError::UnsupportedFeature, position, "\\N{name} is not supported");
		} else {
			// Any character but a line terminator, whatever (?s) says.
			const int id = newNode(NodeType::Any);
			ast_->node(id).flags.dotAll = false;
			ast_->node(id).position     = position;
			++Reg_Parse;
			return id;
		}

	case 'k': {
		++Reg_Parse;
		char_type close;
		switch (peek()) {
		case '<':
			close = '>';
			break;
		case '{':
			close = '}';
			break;
		case '\'':
			close = '\'';
			break;
		default:
			throw PatternError(PatternError::SyntaxError, position, "\\k must be followed by a group name");
		}
		++Reg_Parse;
		return namedBackReference(groupName(close), position);
	}

	case 'R':
		++Reg_Parse;
		return lineBreak(position);

	case 'Q':
		++Reg_Parse;
		return quoted(position);

	case 'E': {
		// A \E without \Q is ignored.
		const int id = newNode(NodeType::Empty);
		++Reg_Parse;
		return id;
	}

	case 'p':
	case 'P': {
		RegexCharSet set;
		property(&set);
		const int id = newSetNode(set);
		ast_->node(id).position = position;
		return id;
	}

	default:
		break;
	}

	if (c >= '1' && c <= '9') {
		int index = c - '0';
		++Reg_Parse;

		// Take more digits only while they still name a group that exists.
		while (!atEnd() && isAsciiDigit(peek())) {
			const int next = index * 10 + static_cast<int>(peek() - '0');
			if (next > Total_Paren) {
				break;
			}
			index = next;
			++Reg_Parse;
		}

		if (index > Total_Paren) {
			throw PatternError(PatternError::UndefinedGroupReference, position, "\\%d is an illegal back reference", index);
		}

		const int id = newNode(NodeType::Backreference);
		ast_->node(id).groupIndex = index;
		ast_->node(id).position   = position;
		return id;
	}

	RegexCharSet set;
	if (shortcutEscape(c, &set)) {
		const int id = newSetNode(set);
		ast_->node(id).position = position;
		++Reg_Parse;
		return id;
	}

	char_type value;
	if (literalEscape(c, &value)) {
		++Reg_Parse;
	} else if (c == 'x' || c == 'u' || c == 'U' || c == 'c' || c == '0') {
		value = numericEscape(c);
	} else if (isAsciiAlnum(c)) {
		throw PatternError(PatternError::SyntaxError, position, "\\%c is an invalid escape sequence", static_cast<char>(c));
	} else {
		value = c;
		++Reg_Parse;
	}

	const int id = newLiteral(value);
	ast_->node(id).position = position;
	return id;
}

//------------------------------------------------------------------------------
// Name: namedBackReference
//------------------------------------------------------------------------------
int RegexParser::namedBackReference(const QString &name, int position) {

	for (size_t i = 1; i < groupNames_.size(); ++i) {
		if (groupNames_[i] == name) {
			const int id = newNode(NodeType::Backreference);
			ast_->node(id).groupIndex = static_cast<int>(i);
			ast_->node(id).position   = position;
			return id;
		}
	}

	throw PatternError(PatternError::UndefinedGroupReference, position, "reference to undefined group name '%s'", qPrintable(name));
}

//------------------------------------------------------------------------------
// Name: quoted
// Desc: \Q...\E, everything in between is literal. A missing \E quotes the
//       rest of the pattern.
//------------------------------------------------------------------------------
int RegexParser::quoted(int position) {

	std::vector<int> literals;

	while (!atEnd() && !lookingAt("\\E")) {
		literals.push_back(newLiteral(peek()));
		++Reg_Parse;
	}

	if (!atEnd()) {
		Reg_Parse += 2;
	}

	if (literals.size() == 1) {
		return literals[0];
	}

	const int id = newNode(literals.empty() ? NodeType::Empty : NodeType::Concat);
	ast_->node(id).children = literals;
	ast_->node(id).position = position;
	return id;
}

//------------------------------------------------------------------------------
// Name: lineBreak
// Desc: \R, the same as (?>\r\n|[\n\x0b\f\r\x85\x{2028}\x{2029}])
//------------------------------------------------------------------------------
int RegexParser::lineBreak(int position) {

	const int cr = newLiteral('\r');
	const int lf = newLiteral('\n');

	const int crlf = newNode(NodeType::Concat);
	ast_->node(crlf).children.push_back(cr);
	ast_->node(crlf).children.push_back(lf);

	RegexCharSet set;
	set.addRange(0x0a, 0x0d);
	set.addChar(0x85);
	set.addRange(0x2028, 0x2029);
	const int single = newSetNode(set);
	ast_->node(single).flags.caseInsensitive = false;

	const int alt = newNode(NodeType::Alternation);
	ast_->node(alt).children.push_back(crlf);
	ast_->node(alt).children.push_back(single);

	const int id = newNode(NodeType::Atomic);
	ast_->node(id).children.push_back(alt);
	ast_->node(id).position = position;
	return id;
}

//------------------------------------------------------------------------------
// Name: shortcutEscape
// Desc: \d \w \s \h \v and their negations.
//------------------------------------------------------------------------------
bool RegexParser::shortcutEscape(char_type c, RegexCharSet *set) {

	RegexCharSet::ClassKind kind;

	switch (c) {
	case 'd':
	case 'D':
		kind = RegexCharSet::Digit;
		break;
	case 'w':
	case 'W':
		kind = RegexCharSet::Word;
		break;
	case 's':
	case 'S':
		kind = RegexCharSet::Space;
		break;
	case 'h':
	case 'H':
		kind = RegexCharSet::HorizontalSpace;
		break;
	case 'v':
	case 'V':
		kind = RegexCharSet::VerticalSpace;
		break;
	default:
		return false;
	}

	set->addClass(kind, c >= 'A' && c <= 'Z');
	return true;
}

//------------------------------------------------------------------------------
// Name: literalEscape
//------------------------------------------------------------------------------
bool RegexParser::literalEscape(char_type c, char_type *value) {

	switch (c) {
	case 'a':
		*value = 0x07;
		return true;
	case 'e':
		*value = 0x1b;
		return true;
	case 'f':
		*value = 0x0c;
		return true;
	case 'n':
		*value = 0x0a;
		return true;
	case 'r':
		*value = 0x0d;
		return true;
	case 't':
		*value = 0x09;
		return true;
	default:
		return false;
	}
}

/*----------------------------------------------------------------------*
 * numericEscape
 *
 * \xhh, \x{h..}, \uhhhh, \Uhhhhhhhh, \cX and \0ooo. Reg_Parse points at
 * the letter following the backslash.
 *----------------------------------------------------------------------*/
char_type RegexParser::numericEscape(char_type c) {

	const int position = Reg_Parse - 1;
	char_type value    = 0;

	++Reg_Parse;

	switch (c) {
	case 'x':
		if (!atEnd() && peek() == '{') {
			++Reg_Parse;
			value = hexDigits(1, 8, position);
			if (atEnd() || peek() != '}') {
				throw PatternError(PatternError::SyntaxError, position, "missing right brace '}' in \\x{...}");
			}
			++Reg_Parse;
		} else {
			value = hexDigits(1, 2, position);
		}
		break;

	case 'u':
		value = hexDigits(4, 4, position);
		break;

	case 'U':
		value = hexDigits(8, 8, position);
		break;

	case 'c':
		if (atEnd() || peek() >= 0x80) {
			throw PatternError(PatternError::SyntaxError, position, "\\c must be followed by an ASCII character");
		}
		value = peek();
		if (value >= 'a' && value <= 'z') {
			value -= 'a' - 'A';
		}
		value ^= 0x40;
		++Reg_Parse;
		break;

	case '0':
		for (int digits = 0; digits < 3 && !atEnd() && peek() >= '0' && peek() <= '7'; ++digits) {
			value = value * 8 + (peek() - '0');
			++Reg_Parse;
		}
		break;

	default:
		throw PatternError(PatternError::SyntaxError, position, "internal error #1, 'numericEscape'");
	}

	if (value > MaxCodePoint) {
		throw PatternError(PatternError::SyntaxError, position, "code point 0x%X is out of range", value);
	}

	return value;
}

//------------------------------------------------------------------------------
// Name: hexDigits
//------------------------------------------------------------------------------
char_type RegexParser::hexDigits(int minDigits, int maxDigits, int position) {

	char_type value = 0;
	int digits      = 0;

	while (digits < maxDigits && !atEnd() && hexValue(peek()) >= 0) {
		value = value * 16 + hexValue(peek());
		++Reg_Parse;
		++digits;
	}

	if (digits < minDigits) {
		throw PatternError(PatternError::SyntaxError, position, "invalid hexadecimal escape");
	}

	return value;
}

//------------------------------------------------------------------------------
// Name: property
// Desc: \p{Name}, \P{Name}, \p{^Name} or the one letter form \pL. Reg_Parse
//       points at the 'p'.
//------------------------------------------------------------------------------
void RegexParser::property(RegexCharSet *set) {

	const int position = Reg_Parse - 1;
	bool negated       = (peek() == 'P');
	QString name;

	++Reg_Parse;

	if (atEnd()) {
		throw PatternError(PatternError::SyntaxError, position, "\\p must be followed by a property name");
	}

	if (peek() == '{') {
		const int start = ++Reg_Parse;
		while (!atEnd() && peek() != '}') {
			++Reg_Parse;
		}

		if (atEnd()) {
			throw PatternError(PatternError::SyntaxError, position, "missing right brace '}' in \\p{...}");
		}

		name = QString::fromUcs4(&regex_[start], Reg_Parse - start);
		++Reg_Parse;

		if (name.startsWith(QLatin1Char('^'))) {
			negated = !negated;
			name.remove(0, 1);
		}
	} else {
		name = QString::fromUcs4(&regex_[Reg_Parse], 1);
		++Reg_Parse;
	}

	if (!RegexCharSet::addProperty(name, negated, set)) {
		throw PatternError(PatternError::UnsupportedFeature, position, "unknown property name \\p{%s}", qPrintable(name));
	}
}

/*----------------------------------------------------------------------*
 * bracketClass
 *
 * [...] including negation, ranges, nested classes and [:name:] items.
 *----------------------------------------------------------------------*/
int RegexParser::bracketClass(int depth) {

	const int position = Reg_Parse;

	RegexCharSet set;
	classBody(&set, depth);

	const int id = newSetNode(set);
	ast_->node(id).position = position;
	return id;
}

//------------------------------------------------------------------------------
// Name: classBody
// Desc: Reg_Parse points at the opening '['. White space is significant in
//       here even in extended mode.
//------------------------------------------------------------------------------
void RegexParser::classBody(RegexCharSet *set, int depth) {

	const int open = Reg_Parse;

	if (depth >= MaxNestingDepth) {
		throw PatternError(PatternError::SyntaxError, open, "classes nested deeper than %d", MaxNestingDepth);
	}

	++Reg_Parse; // Skip '['

	if (!atEnd() && peek() == '^') {
		set->setNegated(true);
		++Reg_Parse;
	}

	// A ']' right after the opening bracket is taken literally.
	bool first = true;

	for (;;) {
		if (atEnd()) {
			throw PatternError(PatternError::SyntaxError, open, "missing right ']'");
		}

		const char_type c = peek();

		if (c == ']' && !first) {
			++Reg_Parse;
			return;
		}

		first = false;

		if (c == '[') {
			if (peek(1) == ':') {
				const int start = Reg_Parse;
				Reg_Parse += 2;

				bool negated = false;
				if (!atEnd() && peek() == '^') {
					negated = true;
					++Reg_Parse;
				}

				const int name_start = Reg_Parse;
				while (!atEnd() && !lookingAt(":]")) {
					++Reg_Parse;
				}

				if (atEnd()) {
					throw PatternError(PatternError::SyntaxError, start, "missing ':]' in POSIX class");
				}

				const QString name = QString::fromUcs4(&regex_[name_start], Reg_Parse - name_start);
				Reg_Parse += 2;

				if (!RegexCharSet::addPosixClass(name, negated, set)) {
					throw PatternError(PatternError::SyntaxError, start, "unknown POSIX class [:%s:]", qPrintable(name));
				}
			} else {
				RegexCharSet nested;
				classBody(&nested, depth + 1);
				set->addSet(nested);
			}
			continue;
		}

		if (c == '&' && peek(1) == '&') {
			throw PatternError(PatternError::UnsupportedFeature, Reg_Parse, "class intersection '&&' is not supported");
		}

		if (c == '-' && peek(1) == '-') {
			throw PatternError(PatternError::UnsupportedFeature, Reg_Parse, "class subtraction '--' is not supported");
		}

		char_type low;
		if (c == '\\') {
			++Reg_Parse;
			if (!classEscape(set, &low)) {
				continue;
			}
		} else {
			low = c;
			++Reg_Parse;
		}

		if (!atEnd() && peek() == '-' && Reg_Parse + 1 < static_cast<int>(regex_.size()) && peek(1) != ']' && peek(1) != '-') {
			const int dash = Reg_Parse;
			++Reg_Parse;

			char_type high;
			if (peek() == '[') {
				throw PatternError(PatternError::SyntaxError, dash, "invalid [] range");
			} else if (peek() == '\\') {
				++Reg_Parse;
				if (!classEscape(set, &high)) {
					throw PatternError(PatternError::SyntaxError, dash, "class escape is not allowed as range operand");
				}
			} else {
				high = peek();
				++Reg_Parse;
			}

			if (high < low) {
				throw PatternError(PatternError::SyntaxError, dash, "invalid [] range");
			}

			set->addRange(low, high);
		} else {
			set->addChar(low);
		}
	}
}

//------------------------------------------------------------------------------
// Name: classEscape
// Desc: A backslash sequence inside [...]. Returns true and sets 'single'
//       for escapes standing for one code point. Anything else is added to
//       'set' directly.
//------------------------------------------------------------------------------
bool RegexParser::classEscape(RegexCharSet *set, char_type *single) {

	const int position = Reg_Parse - 1;

	if (atEnd()) {
		throw PatternError(PatternError::SyntaxError, position, "trailing backslash");
	}

	const char_type c = peek();

	if (shortcutEscape(c, set)) {
		++Reg_Parse;
		return false;
	}

	switch (c) {
	case 'p':
	case 'P':
		property(set);
		return false;

	case 'Q':
		++Reg_Parse;
		while (!atEnd() && !lookingAt("\\E")) {
			set->addChar(peek());
			++Reg_Parse;
		}
		if (!atEnd()) {
			Reg_Parse += 2;
		}
		return false;

	case 'b':
		++Reg_Parse;
		*single = 0x08;
		return true;

	case 'x':
	case 'u':
	case 'U':
	case 'c':
	case '0':
		*single = numericEscape(c);
		return true;

	default:
		break;
	}

	if (literalEscape(c, single)) {
		++Reg_Parse;
		return true;
	}

	if (isAsciiAlnum(c)) {
		throw PatternError(PatternError::SyntaxError, position, "\\%c is an invalid char class escape sequence", static_cast<char>(c));
	}

	*single = c;
	++Reg_Parse;
	return true;
}

//------------------------------------------------------------------------------
// Name: skipIgnored
// Desc: Skips (?#...) comments, and in extended mode white space and #
//       comments running to the end of the line.
//------------------------------------------------------------------------------
void RegexParser::skipIgnored() {

	for (;;) {
		if (lookingAt("(?#")) {
			const int start = Reg_Parse;
			while (!atEnd() && peek() != ')') {
				++Reg_Parse;
			}

			if (atEnd()) {
				throw PatternError(PatternError::SyntaxError, start, "missing right parenthesis ')' in comment");
			}

			++Reg_Parse;
			continue;
		}

		if (!extended_ || atEnd()) {
			return;
		}

		const char_type c = peek();
		if (isSpaceChar(c)) {
			++Reg_Parse;
		} else if (c == '#') {
			while (!atEnd() && !isLineTerminator(peek(), false)) {
				++Reg_Parse;
			}
		} else {
			return;
		}
	}
}

//------------------------------------------------------------------------------
// Name: atEnd
//------------------------------------------------------------------------------
bool RegexParser::atEnd() const {
	return Reg_Parse >= static_cast<int>(regex_.size());
}

//------------------------------------------------------------------------------
// Name: peek
// Desc: The code point 'ahead' places past Reg_Parse, 0 past the end.
//------------------------------------------------------------------------------
char_type RegexParser::peek(int ahead) const {
	const size_t p = static_cast<size_t>(Reg_Parse + ahead);
	return p < regex_.size() ? regex_[p] : 0;
}

//------------------------------------------------------------------------------
// Name: lookingAt
//------------------------------------------------------------------------------
bool RegexParser::lookingAt(const char *text) const {
	for (int i = 0; text[i] != '\0'; ++i) {
		const size_t p = static_cast<size_t>(Reg_Parse + i);
		if (p >= regex_.size() || regex_[p] != static_cast<char_type>(text[i])) {
			return false;
		}
	}
	return true;
}

//------------------------------------------------------------------------------
// Name: newNode
//------------------------------------------------------------------------------
int RegexParser::newNode(NodeType type) {
	RegexNode n;
	n.type     = type;
	n.flags    = flags_;
	n.position = Reg_Parse;
	return ast_->addNode(n);
}

//------------------------------------------------------------------------------
// Name: newLiteral
//------------------------------------------------------------------------------
int RegexParser::newLiteral(char_type c) {
	const int id = newNode(NodeType::Literal);
	ast_->node(id).ch = c;
	return id;
}

//------------------------------------------------------------------------------
// Name: newAnchor
// Desc: Creates an anchor at 'position' and moves past its 'length' code
//       points. The anchor starts at Reg_Parse when no position is given.
//------------------------------------------------------------------------------
int RegexParser::newAnchor(AnchorKind kind, int length, int position) {
	const int id = newNode(NodeType::Anchor);
	ast_->node(id).anchor = kind;
	if (position >= 0) {
		ast_->node(id).position = position;
	}
	Reg_Parse += length;
	return id;
}

//------------------------------------------------------------------------------
// Name: newSetNode
//------------------------------------------------------------------------------
int RegexParser::newSetNode(const RegexCharSet &set) {
	const int index = ast_->addSet(set);
	const int id    = newNode(NodeType::CharClass);
	ast_->node(id).setIndex = index;
	return id;
}
