
#ifndef REGEX_H_
#define REGEX_H_

#include <atomic>
#include <vector>
#include <QChar>
#include <QString>
#include "Types.h"
#include "RegexCharSet.h"
#include "RegexException.h"
#include "RegexOpcodes.h"
#include "RegexOptions.h"

class RegexAst;

/* The compiled form of a regular expression. 'program_' is the code run by
   RegexMatch. A Regex is immutable once constructed, so one instance may be
   shared by any number of threads, each with its own RegexMatch. */
class Regex {
	friend class RegexMatch;
public:
	// Backtracking steps a single match attempt may take unless told otherwise.
	static const unsigned long DefaultStepBudget = 10000000UL;

public:
	/**
	 * @brief Compiles a regular expression into the internal format used by RegexMatch.
	 * @param exp - String containing the pattern.
	 * @param options - Compile time options.
	 * @throws PatternError when 'exp' is not a valid pattern.
	 */
	Regex(const QString &exp, RegexOptions options = NoRegexOptions);

private:
	Regex(const Regex &) = delete;
	Regex &operator=(const Regex &) = delete;

public:
	QString pattern() const {
		return regex_;
	}

	RegexOptions options() const {
		return options_;
	}

	// Number of capturing groups, not counting the whole match.
	int groupCount() const {
		return Total_Paren;
	}

	// Names by group number. Index 0 is unused, unnamed groups are empty.
	const std::vector<QString> &groupNames() const {
		return groupNames_;
	}

	// Number of the group called 'name', or -1.
	int groupIndex(const QString &name) const;

	int programSize() const {
		return static_cast<int>(program_.size());
	}

public:
	/* Changes the step budget used by matchers that are not given one. Takes
	   effect for matches started afterwards. */
	static void SetDefaultStepLimit(unsigned long limit);
	static unsigned long DefaultStepLimit();

	/* Version of the Unicode tables behind case folding, \w, \p{..} and
	   friends. These come from QtCore. */
	static QChar::UnicodeVersion unicodeVersion();

private:
	// for CompileRE
	void compileNode(int id);
	void compileRepetition(int id);
	void compileLoop(int child, int min, int max, bool greedy);
	int emit_node(RegexOpcodes op_code, uint8_t flags = 0);
	bool isSimple(int id) const;
	bool firstLiteral(int id, char_type *c) const;
	bool startsAnchored(int id) const;

private:
	std::vector<RegexInstruction> program_;
	std::vector<RegexCharSet>     sets_;
	std::vector<QString>          groupNames_;
	QString                       regex_;
	RegexOptions                  options_;
	int                           Total_Paren; // Capturing parentheses, (), counter.
	int                           Num_Loops;   // LOOP_MARK slots used by the program.
	char_type                     match_start_;     // Code point every match starts with, if has_match_start_
	bool                          has_match_start_;
	bool                          anchor_;          // Matches can only start where '^' or \A match

	const RegexAst *              ast_;             // Only valid while compiling
	int                           Reg_Position;     // Pattern offset of the node being compiled

	static std::atomic<unsigned long> DefaultStepLimit_;
};

#endif
