
#include "RegexAst.h"
#include "RegexCommon.h"

namespace {

// Widths above REG_MAX_COUNT saturate here so nested counts cannot overflow.
const long WidthCap = static_cast<long>(REG_MAX_COUNT) + 1;

long capWidth(long w) {
	return (w > WidthCap) ? WidthCap : w;
}

long addWidth(long a, long b) {
	if (a == REG_INFINITY || b == REG_INFINITY) {
		return REG_INFINITY;
	}
	return capWidth(a + b);
}

long mulWidth(long width, long count) {
	if (width == 0 || count == 0) {
		return 0;
	}
	if (width > WidthCap / count) {
		return WidthCap;
	}
	return capWidth(width * count);
}

const char *nodeTypeName(NodeType type) {
	switch (type) {
	case NodeType::Empty:         return "Empty";
	case NodeType::Literal:       return "Literal";
	case NodeType::CharClass:     return "CharClass";
	case NodeType::Any:           return "Any";
	case NodeType::Concat:        return "Concat";
	case NodeType::Alternation:   return "Alternation";
	case NodeType::Repetition:    return "Repetition";
	case NodeType::Group:         return "Group";
	case NodeType::Atomic:        return "Atomic";
	case NodeType::LookAround:    return "LookAround";
	case NodeType::Anchor:        return "Anchor";
	case NodeType::Backreference: return "Backreference";
	}
	return "?";
}

}

//------------------------------------------------------------------------------
// Name: RegexAst
//------------------------------------------------------------------------------
RegexAst::RegexAst() : root_(-1), groupCount_(0) {
}

//------------------------------------------------------------------------------
// Name: addNode
//------------------------------------------------------------------------------
int RegexAst::addNode(const RegexNode &node) {
	nodes_.push_back(node);
	return static_cast<int>(nodes_.size()) - 1;
}

//------------------------------------------------------------------------------
// Name: addSet
//------------------------------------------------------------------------------
int RegexAst::addSet(const RegexCharSet &set) {
	sets_.push_back(set);
	return static_cast<int>(sets_.size()) - 1;
}

//------------------------------------------------------------------------------
// Name: widthRange
// Desc: Used to bound look-behind. Back references have no static width, so
//       they make the upper bound infinite.
//------------------------------------------------------------------------------
void RegexAst::widthRange(int id, long *min, long *max) const {

	const RegexNode &n = nodes_[id];

	switch (n.type) {
	case NodeType::Empty:
	case NodeType::Anchor:
	case NodeType::LookAround:
		*min = 0;
		*max = 0;
		break;

	case NodeType::Literal:
	case NodeType::CharClass:
	case NodeType::Any:
		*min = 1;
		*max = 1;
		break;

	case NodeType::Backreference:
		*min = 0;
		*max = REG_INFINITY;
		break;

	case NodeType::Group:
	case NodeType::Atomic:
		widthRange(n.children[0], min, max);
		break;

	case NodeType::Concat:
		*min = 0;
		*max = 0;
		for (int child : n.children) {
			long child_min;
			long child_max;
			widthRange(child, &child_min, &child_max);
			*min = addWidth(*min, child_min);
			*max = addWidth(*max, child_max);
		}
		break;

	case NodeType::Alternation:
		*min = -1;
		*max = 0;
		for (int child : n.children) {
			long child_min;
			long child_max;
			widthRange(child, &child_min, &child_max);
			if (*min < 0 || child_min < *min) {
				*min = child_min;
			}
			if (*max != REG_INFINITY && (child_max == REG_INFINITY || child_max > *max)) {
				*max = child_max;
			}
		}
		if (*min < 0) {
			*min = 0;
		}
		break;

	case NodeType::Repetition: {
		long child_min;
		long child_max;
		widthRange(n.children[0], &child_min, &child_max);
		*min = mulWidth(child_min, n.min);
		if (n.max == REG_INFINITY) {
			*max = (child_max == 0) ? 0 : REG_INFINITY;
		} else if (child_max == REG_INFINITY) {
			*max = REG_INFINITY;
		} else {
			*max = mulWidth(child_max, n.max);
		}
		break;
	}
	}
}

//------------------------------------------------------------------------------
// Name: canBeEmpty
//------------------------------------------------------------------------------
bool RegexAst::canBeEmpty(int id) const {
	long min;
	long max;
	widthRange(id, &min, &max);
	return min == 0;
}

//------------------------------------------------------------------------------
// Name: dump
// Desc: Indented, one node per line. Used by the tests to check the shape of
//       the tree.
//------------------------------------------------------------------------------
QString RegexAst::dump() const {
	QString out;
	if (root_ >= 0) {
		dumpNode(root_, 0, &out);
	}
	return out;
}

//------------------------------------------------------------------------------
// Name: dumpNode
//------------------------------------------------------------------------------
void RegexAst::dumpNode(int id, int depth, QString *out) const {

	const RegexNode &n = nodes_[id];

	*out += QString(depth * 2, QLatin1Char(' '));
	*out += QLatin1String(nodeTypeName(n.type));

	switch (n.type) {
	case NodeType::Literal:
		*out += QLatin1Char(' ');
		*out += QString::fromUcs4(&n.ch, 1);
		break;
	case NodeType::Repetition:
		*out += QString::fromLatin1(" {%1,%2}%3").arg(n.min).arg(n.max == REG_INFINITY ? QString() : QString::number(n.max)).arg(n.possessive ? QLatin1String("+") : (n.greedy ? QLatin1String("") : QLatin1String("?")));
		break;
	case NodeType::Group:
		if (n.capturing) {
			*out += QString::fromLatin1(" #%1").arg(n.groupIndex);
			if (!n.name.isEmpty()) {
				*out += QString::fromLatin1(" <%1>").arg(n.name);
			}
		}
		break;
	case NodeType::Backreference:
		*out += QString::fromLatin1(" \\%1").arg(n.groupIndex);
		break;
	case NodeType::LookAround:
		*out += n.behind ? QLatin1String(" behind") : QLatin1String(" ahead");
		if (n.negated) {
			*out += QLatin1String(" negated");
		}
		break;
	default:
		break;
	}

	*out += QLatin1Char('\n');

	for (int child : n.children) {
		dumpNode(child, depth + 1, out);
	}
}
