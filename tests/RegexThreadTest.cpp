
#include "Regex.h"
#include "RegexIterator.h"
#include "RegexMatch.h"
#include "UnicodeText.h"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace {

const int ThreadCount = 8;
const int Rounds      = 50;

std::vector<Span> collect(const Regex *regex, const UnicodeText *text) {
	std::vector<Span> spans;
	for (int round = 0; round < Rounds; ++round) {
		RegexIterator it(regex, text->data(), text->length(), text->fullRange());
		MatchResult m;
		while (it.next(&m)) {
			if (round == 0) {
				spans.push_back(m.span());
				spans.push_back(m.span(1));
			}
		}
	}
	return spans;
}

}

TEST(RegexThreads, SharedRegexGivesIdenticalResults) {
	const Regex regex("(?i)(\\w+)(?=\\s|$)", NoRegexOptions);
	QString line;
	for (int i = 0; i < 200; ++i) {
		line += QString::fromUtf8("Word\xc3\xa9%1 ").arg(i);
	}
	const UnicodeText text(line);

	const std::vector<Span> expected = collect(&regex, &text);
	ASSERT_EQ(expected.size(), 400u);

	std::vector<std::vector<Span>> results(ThreadCount);
	std::vector<std::thread> threads;

	for (int i = 0; i < ThreadCount; ++i) {
		threads.push_back(std::thread([&regex, &text, &results, i]() {
			results[i] = collect(&regex, &text);
		}));
	}

	for (std::thread &t : threads) {
		t.join();
	}

	for (int i = 0; i < ThreadCount; ++i) {
		EXPECT_EQ(results[i], expected) << "thread " << i;
	}
}

TEST(RegexThreads, SharedRegexWithSeparateMatchers) {
	const Regex regex("(a+)+b");
	const UnicodeText hit("xaaab");
	const UnicodeText miss("aaaaaaaaaaaaaaaa");

	std::vector<int> found(ThreadCount, -1);
	std::vector<std::thread> threads;

	for (int i = 0; i < ThreadCount; ++i) {
		threads.push_back(std::thread([&regex, &hit, &miss, &found, i]() {
			RegexMatch matcher(&regex);
			const UnicodeText &text = (i % 2 == 0) ? hit : miss;
			found[i] = matcher.ExecRE(text.data(), text.length(), text.fullRange(), 0) ? matcher.result().start() : -1;
		}));
	}

	for (std::thread &t : threads) {
		t.join();
	}

	for (int i = 0; i < ThreadCount; ++i) {
		EXPECT_EQ(found[i], (i % 2 == 0) ? 1 : -1) << "thread " << i;
	}
}
