
#ifndef REGEX_AST_H_
#define REGEX_AST_H_

#include "RegexCharSet.h"
#include "Types.h"
#include <QString>
#include <vector>

enum class NodeType {
	Empty,         // Matches the empty string
	Literal,       // A single code point
	CharClass,     // [...], \d, \p{..}, ...
	Any,           // '.'
	Concat,        // children in sequence
	Alternation,   // children as alternatives, leftmost preferred
	Repetition,    // child{min,max}
	Group,         // (...), (?:...), (?<name>...)
	Atomic,        // (?>...)
	LookAround,    // (?=...), (?!...), (?<=...), (?<!...)
	Anchor,        // zero width positional assertions
	Backreference  // \1, \k<name>
};

enum class AnchorKind {
	LineStart,     // '^'
	LineEnd,       // '$'
	TextStart,     // \A
	TextEnd,       // \z
	TextEndOrLine, // \Z, end of text or before a final line terminator
	WordBoundary,  // \b
	NotWordBoundary // \B
};

/* The flags in effect where a node was written. Inline modifiers such as
   (?i) change them part way through a pattern, so they live on the node. */
struct NodeFlags {
	NodeFlags() : caseInsensitive(false), dotAll(false), multiline(false), unixLines(false) {
	}

	bool caseInsensitive;
	bool dotAll;
	bool multiline;
	bool unixLines;
};

struct RegexNode {
	RegexNode() : type(NodeType::Empty), ch(0), setIndex(-1), min(0), max(0), greedy(true), possessive(false),
	              capturing(false), groupIndex(0), anchor(AnchorKind::LineStart), behind(false), negated(false), position(0) {
	}

	NodeType         type;
	std::vector<int> children;    // Node ids, see RegexAst::node()
	char_type        ch;          // Literal
	int              setIndex;    // CharClass: index into RegexAst::sets()
	int              min;         // Repetition
	int              max;         // Repetition, REG_INFINITY when unbounded
	bool             greedy;      // Repetition
	bool             possessive;  // Repetition
	bool             capturing;   // Group
	int              groupIndex;  // Group (1-based when capturing), Backreference
	QString          name;        // Group name
	AnchorKind       anchor;      // Anchor
	bool             behind;      // LookAround
	bool             negated;     // LookAround
	NodeFlags        flags;
	int              position;    // Offset of the node in the pattern
};

/* Arena of parse tree nodes. Nodes refer to each other by index, so the tree
   can be built and rearranged without owning pointers. */
class RegexAst {
public:
	RegexAst();

public:
	int addNode(const RegexNode &node);
	int addSet(const RegexCharSet &set);

	RegexNode &node(int id) {
		return nodes_[id];
	}

	const RegexNode &node(int id) const {
		return nodes_[id];
	}

	const RegexCharSet &set(int index) const {
		return sets_[index];
	}

	const std::vector<RegexCharSet> &sets() const {
		return sets_;
	}

	int size() const {
		return static_cast<int>(nodes_.size());
	}

	int root() const {
		return root_;
	}

	void setRoot(int id) {
		root_ = id;
	}

	int groupCount() const {
		return groupCount_;
	}

	void setGroupCount(int count) {
		groupCount_ = count;
	}

	const std::vector<QString> &groupNames() const {
		return groupNames_;
	}

	void setGroupNames(const std::vector<QString> &names) {
		groupNames_ = names;
	}

public:
	/* Smallest and largest number of code points 'id' can consume.
	   'max' is REG_INFINITY when unbounded. */
	void widthRange(int id, long *min, long *max) const;

	/* True if the subtree can match without consuming anything. */
	bool canBeEmpty(int id) const;

	QString dump() const;

private:
	void dumpNode(int id, int depth, QString *out) const;

private:
	std::vector<RegexNode>    nodes_;
	std::vector<RegexCharSet> sets_;
	std::vector<QString>      groupNames_; // Index 0 unused, "" for unnamed groups
	int                       root_;
	int                       groupCount_;
};

#endif
