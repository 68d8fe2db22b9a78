
#include "Regex.h"
#include "RegexAst.h"
#include "RegexCommon.h"
#include "RegexParser.h"
#include <QtDebug>

const unsigned long Regex::DefaultStepBudget;
std::atomic<unsigned long> Regex::DefaultStepLimit_(Regex::DefaultStepBudget);

/*----------------------------------------------------------------------*
 * Regex
 *
 * Compiles a regular expression into the internal format used by
 * RegexMatch. The pattern is parsed into a RegexAst first and the tree
 * is then lowered into a flat program.
 *
 * Beware that the optimization code at the end knows about the shape
 * of the tree produced by RegexParser.
 *----------------------------------------------------------------------*/
Regex::Regex(const QString &exp, RegexOptions options)
	: regex_(exp), options_(options), Total_Paren(0), Num_Loops(0), match_start_(0), has_match_start_(false), anchor_(false), ast_(nullptr), Reg_Position(0) {

	RegexAst ast;
	RegexParser parser(exp, options);
	parser.parse(&ast);

	Total_Paren = ast.groupCount();
	groupNames_ = ast.groupNames();
	sets_       = ast.sets();

	ast_ = &ast;

	compileNode(ast.root());
	emit_node(END);

	/*----------------------------------------*
	* Dig out information for optimizations. *
	*----------------------------------------*/

	has_match_start_ = firstLiteral(ast.root(), &match_start_);
	anchor_          = startsAnchored(ast.root());

	ast_ = nullptr;
}

//------------------------------------------------------------------------------
// Name: groupIndex
//------------------------------------------------------------------------------
int Regex::groupIndex(const QString &name) const {
	for (size_t i = 1; i < groupNames_.size(); ++i) {
		if (!name.isEmpty() && groupNames_[i] == name) {
			return static_cast<int>(i);
		}
	}
	return -1;
}

/*----------------------------------------------------------------------*
 * compileNode
 *
 * Emit the code for one node of the tree and everything below it.
 *----------------------------------------------------------------------*/
void Regex::compileNode(int id) {

	const RegexNode &n = ast_->node(id);
	const uint8_t fold = n.flags.caseInsensitive ? CaseFold : 0;

	Reg_Position = n.position;

	switch (n.type) {
	case NodeType::Empty:
		break;

	case NodeType::Literal:
		program_[emit_node(EXACTLY, fold)].ch = n.ch;
		break;

	case NodeType::CharClass:
		program_[emit_node(ANY_OF, fold)].x = n.setIndex;
		break;

	case NodeType::Any:
		if (n.flags.dotAll) {
			emit_node(EVERY);
		} else {
			emit_node(ANY, n.flags.unixLines ? UnixLines : 0);
		}
		break;

	case NodeType::Concat:
		for (int child : n.children) {
			compileNode(child);
		}
		break;

	case NodeType::Alternation: {
		// BRANCH alt1, next; alt1; JUMP end; next: BRANCH alt2, ...; altN; end:
		std::vector<int> jumps;

		for (size_t i = 0; i < n.children.size(); ++i) {
			if (i + 1 == n.children.size()) {
				compileNode(n.children[i]);
				break;
			}

			const int branch = emit_node(BRANCH);
			program_[branch].x = branch + 1;
			compileNode(n.children[i]);
			jumps.push_back(emit_node(JUMP));
			program_[branch].y = programSize();
		}

		for (int jump : jumps) {
			program_[jump].x = programSize();
		}
		break;
	}

	case NodeType::Group:
		if (n.capturing) {
			program_[emit_node(OPEN)].min = n.groupIndex;
			compileNode(n.children[0]);
			program_[emit_node(CLOSE)].min = n.groupIndex;
		} else {
			compileNode(n.children[0]);
		}
		break;

	case NodeType::Atomic: {
		const int open = emit_node(ATOMIC_OPEN);
		compileNode(n.children[0]);
		emit_node(ATOMIC_CLOSE);
		program_[open].x = programSize();
		break;
	}

	case NodeType::LookAround: {
		const int open = emit_node(n.behind ? BEHIND_OPEN : AHEAD_OPEN, n.negated ? Negated : 0);
		if (n.behind) {
			long min;
			long max;
			ast_->widthRange(n.children[0], &min, &max);
			program_[open].min = static_cast<int>(min);
			program_[open].max = static_cast<int>(max);
		}
		compileNode(n.children[0]);
		emit_node(LOOK_CLOSE);
		program_[open].x = programSize();
		break;
	}

	case NodeType::Anchor: {
		const uint8_t lines = (n.flags.multiline ? Multiline : 0) | (n.flags.unixLines ? UnixLines : 0);
		switch (n.anchor) {
		case AnchorKind::LineStart:
			emit_node(BOL, lines);
			break;
		case AnchorKind::LineEnd:
			emit_node(EOL, lines);
			break;
		case AnchorKind::TextStart:
			emit_node(BOT);
			break;
		case AnchorKind::TextEnd:
			emit_node(EOT);
			break;
		case AnchorKind::TextEndOrLine:
			emit_node(EOT_OR_NL, lines & UnixLines);
			break;
		case AnchorKind::WordBoundary:
			emit_node(WORD_BOUNDARY);
			break;
		case AnchorKind::NotWordBoundary:
			emit_node(NOT_BOUNDARY);
			break;
		}
		break;
	}

	case NodeType::Backreference:
		program_[emit_node(BACK_REF, fold)].min = n.groupIndex;
		break;

	case NodeType::Repetition:
		compileRepetition(id);
		break;
	}
}

/*----------------------------------------------------------------------*
 * compileRepetition
 *
 * Single code point operands get a REPEAT instruction that the matcher
 * runs in a tight loop. Anything else is expanded into BRANCH/JUMP
 * code, with the operand copied once per required iteration.
 *----------------------------------------------------------------------*/
void Regex::compileRepetition(int id) {

	const RegexNode &n = ast_->node(id);
	const int child    = n.children[0];

	if (n.max == 0) {
		return;
	}

	if (isSimple(child)) {
		const int repeat = emit_node(REPEAT, (n.greedy ? 0 : Lazy) | (n.possessive ? Possessive : 0));
		program_[repeat].min = n.min;
		program_[repeat].max = n.max;
		compileNode(child);
		return;
	}

	if (n.possessive) {
		const int open = emit_node(ATOMIC_OPEN);
		compileLoop(child, n.min, n.max, true);
		emit_node(ATOMIC_CLOSE);
		program_[open].x = programSize();
		return;
	}

	compileLoop(child, n.min, n.max, n.greedy);
}

//------------------------------------------------------------------------------
// Name: compileLoop
//------------------------------------------------------------------------------
void Regex::compileLoop(int child, int min, int max, bool greedy) {

	for (int i = 0; i < min; ++i) {
		compileNode(child);
	}

	if (max == REG_INFINITY) {
		// loop: BRANCH body, out; body: [LOOP_MARK] child [LOOP_CHECK out] JUMP loop; out:
		// An iteration that consumed nothing leaves the loop, so it cannot
		// spin forever.
		const bool mayBeEmpty = ast_->canBeEmpty(child);
		const int slot        = mayBeEmpty ? Num_Loops++ : -1;

		const int loop = emit_node(BRANCH);
		const int body = programSize();

		if (mayBeEmpty) {
			program_[emit_node(LOOP_MARK)].min = slot;
		}

		compileNode(child);

		int check = -1;
		if (mayBeEmpty) {
			check = emit_node(LOOP_CHECK);
			program_[check].min = slot;
		}

		program_[emit_node(JUMP)].x = loop;

		const int out = programSize();
		program_[loop].x = greedy ? body : out;
		program_[loop].y = greedy ? out : body;

		if (check != -1) {
			program_[check].x = out;
		}
		return;
	}

	// Optional copies: BRANCH body1, out; body1; BRANCH body2, out; body2; ... out:
	std::vector<int> branches;
	for (int i = min; i < max; ++i) {
		branches.push_back(emit_node(BRANCH));
		compileNode(child);
	}

	const int out = programSize();
	for (int branch : branches) {
		program_[branch].x = greedy ? branch + 1 : out;
		program_[branch].y = greedy ? out : branch + 1;
	}
}

/*----------------------------------------------------------------------*
 * emit_node
 *
 * Append an instruction and return its index.
 *----------------------------------------------------------------------*/
int Regex::emit_node(RegexOpcodes op_code, uint8_t flags) {

	if (program_.size() >= MaxProgramSize) {
		throw PatternError(PatternError::SyntaxError, Reg_Position, "regex > %lu instructions", static_cast<unsigned long>(MaxProgramSize));
	}

	RegexInstruction instruction(op_code);
	instruction.flags = flags;
	program_.push_back(instruction);
	return static_cast<int>(program_.size()) - 1;
}

//------------------------------------------------------------------------------
// Name: isSimple
// Desc: True for operands that always consume exactly one code point.
//------------------------------------------------------------------------------
bool Regex::isSimple(int id) const {

	const RegexNode &n = ast_->node(id);

	switch (n.type) {
	case NodeType::Literal:
	case NodeType::CharClass:
	case NodeType::Any:
		return true;
	case NodeType::Group:
		return !n.capturing && isSimple(n.children[0]);
	default:
		return false;
	}
}

//------------------------------------------------------------------------------
// Name: firstLiteral
// Desc: Finds a code point every match has to start with. Zero width items in
//       front of it do not matter since they consume nothing.
//------------------------------------------------------------------------------
bool Regex::firstLiteral(int id, char_type *c) const {

	const RegexNode &n = ast_->node(id);

	switch (n.type) {
	case NodeType::Literal:
		if (n.flags.caseInsensitive) {
			return false;
		}
		*c = n.ch;
		return true;

	case NodeType::Group:
	case NodeType::Atomic:
		return firstLiteral(n.children[0], c);

	case NodeType::Repetition:
		return n.min > 0 && firstLiteral(n.children[0], c);

	case NodeType::Concat:
		for (int child : n.children) {
			const NodeType type = ast_->node(child).type;
			if (type == NodeType::Anchor || type == NodeType::LookAround || type == NodeType::Empty) {
				continue;
			}
			return firstLiteral(child, c);
		}
		return false;

	default:
		return false;
	}
}

//------------------------------------------------------------------------------
// Name: startsAnchored
// Desc: True if every match must start at the start of the text, i.e. the
//       pattern begins with \A or with '^' outside of multiline mode.
//------------------------------------------------------------------------------
bool Regex::startsAnchored(int id) const {

	const RegexNode &n = ast_->node(id);

	switch (n.type) {
	case NodeType::Anchor:
		return n.anchor == AnchorKind::TextStart || (n.anchor == AnchorKind::LineStart && !n.flags.multiline);

	case NodeType::Group:
	case NodeType::Atomic:
		return startsAnchored(n.children[0]);

	case NodeType::Concat:
		for (int child : n.children) {
			if (ast_->node(child).type != NodeType::Empty) {
				return startsAnchored(child);
			}
		}
		return false;

	default:
		return false;
	}
}

//------------------------------------------------------------------------------
// Name: SetDefaultStepLimit
//------------------------------------------------------------------------------
void Regex::SetDefaultStepLimit(unsigned long limit) {
	qDebug("Regex: default step limit changed from %lu to %lu", DefaultStepLimit_.load(), limit);
	DefaultStepLimit_.store(limit);
}

//------------------------------------------------------------------------------
// Name: DefaultStepLimit
//------------------------------------------------------------------------------
unsigned long Regex::DefaultStepLimit() {
	return DefaultStepLimit_.load();
}

//------------------------------------------------------------------------------
// Name: unicodeVersion
//------------------------------------------------------------------------------
QChar::UnicodeVersion Regex::unicodeVersion() {
	return QChar::currentUnicodeVersion();
}
