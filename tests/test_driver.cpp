#include "doctest.h"

#include "core/driver.h"
#include "core/payloads/numeral.h"
#include "rules/helpers.h"
#include "support.h"

#include <algorithm>
#include <set>
#include <sstream>

namespace {

RuleSet counting_rules() {
	using namespace Rules;

	return RuleSet(std::vector<RuleRef>{
		make_rule("digit", {regex_item("\\d")}, [] (const Captures &c) {
			return integer(c.group(0)[0] - '0');
		}),
		make_rule("sum", {number(), regex_item("\\+"), number()}, [] (const Captures &c) {
			return numeral(c.get<NumeralData>(0).value + c.get<NumeralData>(2).value);
		}),
		make_rule("product", {number(), regex_item("\\*"), number()}, [] (const Captures &c) {
			return numeral(c.get<NumeralData>(0).value * c.get<NumeralData>(2).value);
		})
	});
}

std::vector<std::string> token_forms(const TokenPool &pool) {
	std::vector<std::string> forms;
	for (const TokenRef &token : pool.tokens()) {
		forms.push_back(token->debugform());
	}
	return forms;
}

// span and payload of each token, whichever rule made it.
std::set<std::string> token_values(const TokenPool &pool) {
	std::set<std::string> values;
	for (const TokenRef &token : pool.tokens()) {
		std::ostringstream s;
		s << token->span.begin << ".." << token->span.end << " " << token->payload->debugform();
		values.insert(s.str());
	}
	return values;
}

} // namespace

TEST_CASE("driver runs to a fixpoint") {
	const RuleSet rules = counting_rules();
	const EngineOptions options;
	const Document document("2*3");

	TokenPool pool(document.length());
	const ParseStatistics statistics = PassDriver(rules, options, std::make_shared<NoOutput>()).run(document, pool);

	// digits, then the product, then a pass that adds nothing.
	CHECK(statistics.passes == 3);
	CHECK_FALSE(statistics.exhausted);
	CHECK(statistics.tokens == pool.size());
	CHECK(pool.size() == 3);

	const TokenRef &product = pool.tokens().back();
	CHECK(product->span == (Span{0, 3}));
	CHECK(product->as<NumeralData>()->value == 6);
	CHECK(product->pass == 2);
}

TEST_CASE("passes are bounded by the number of rules") {
	const RuleSet rules = counting_rules();
	const EngineOptions options;
	const Document document("1+2+3+4+5");

	TokenPool pool(document.length());
	const ParseStatistics statistics = PassDriver(rules, options, std::make_shared<NoOutput>()).run(document, pool);

	// pass 3 joins two sums of pass 2 into four terms; all five would
	// need a fourth pass.
	CHECK(statistics.passes == 3);

	bool four_terms = false;
	for (const TokenRef &token : pool.tokens()) {
		CHECK(token->span != (Span{0, 9}));
		if (token->span == Span{0, 7}) {
			CHECK(token->as<NumeralData>()->value == 10);
			CHECK(token->pass == 3);
			four_terms = true;
		}
	}
	CHECK(four_terms);
}

TEST_CASE("driver is deterministic") {
	const RuleSet rules = counting_rules();
	const Document document("1+2+3+4 and 5+6");

	EngineOptions sequential;
	sequential.parallel = false;
	TokenPool a(document.length());
	PassDriver(rules, sequential, std::make_shared<NoOutput>()).run(document, a);

	EngineOptions parallel;
	TokenPool b(document.length());
	PassDriver(rules, parallel, std::make_shared<NoOutput>()).run(document, b);

	CHECK(token_forms(a) == token_forms(b));
}

TEST_CASE("driver ignores the order of rules") {
	const std::shared_ptr<const RuleRegistry> registry = default_registry();
	const RuleSet rules = registry->rules("en", registry->closure(DimensionSet()));
	std::vector<RuleRef> reversed(rules.begin(), rules.end());
	std::reverse(reversed.begin(), reversed.end());
	const RuleSet backwards(reversed);

	const Document document("tomorrow at 5pm I pay $20 for twenty one cups of sugar");

	EngineOptions options;
	options.parallel = false;

	TokenPool a(document.length());
	const ParseStatistics forward = PassDriver(rules, options, std::make_shared<NoOutput>()).run(document, a);

	TokenPool b(document.length());
	PassDriver(backwards, options, std::make_shared<NoOutput>()).run(document, b);

	CHECK_FALSE(forward.exhausted);
	CHECK(a.size() > 10);
	CHECK(a.size() == b.size());
	CHECK(token_values(a) == token_values(b));
}

TEST_CASE("pass budget") {
	const RuleSet rules = counting_rules();
	const Document document("1+2+3");
	const auto output = std::make_shared<TestOutput>();

	EngineOptions options;
	options.max_passes = 1;

	TokenPool pool(document.length());
	const ParseStatistics statistics = PassDriver(rules, options, output).run(document, pool);

	CHECK(statistics.passes == 1);
	CHECK(statistics.exhausted);
	CHECK(pool.size() == 3);
	CHECK(output->test_line("PassDriver::budget: pass budget of 1 reached, keeping 3 tokens"));
	CHECK(output->test_empty());
}

TEST_CASE("invocation budget") {
	const RuleSet rules = counting_rules();
	const Document document("1+2+3");
	const auto output = std::make_shared<TestOutput>();

	// pass 1 tries the digit rule at the 5 text starts, pass 2 would try
	// the sum and product rules at the 3 digits each.
	EngineOptions options;
	options.max_invocations = 6;

	TokenPool pool(document.length());
	const ParseStatistics statistics = PassDriver(rules, options, output).run(document, pool);

	CHECK(statistics.passes == 1);
	CHECK(statistics.invocations == 5);
	CHECK(statistics.exhausted);
	CHECK(pool.size() == 3);
	CHECK(output->contains("budget"));
}

TEST_CASE("trace") {
	const RuleSet rules = counting_rules();
	const Document document("7");
	const auto output = std::make_shared<TestOutput>();

	EngineOptions options;
	options.trace = true;

	TokenPool pool(document.length());
	PassDriver(rules, options, output).run(document, pool);

	CHECK(output->test_line("PassDriver::pass: pass 1 tried 1 offsets and added 1 tokens"));
	CHECK(output->test_line("PassDriver::pass: pass 2 tried 2 offsets and added 0 tokens"));
	CHECK(output->test_empty());
}

TEST_CASE("exceptions in rules reach the caller") {
	const RuleSet rules(std::vector<RuleRef>{
		make_rule("broken", {regex_item("x")}, [] (const Captures&) -> PayloadRef {
			throw std::runtime_error("broken rule");
		}),
		make_rule("digit", {regex_item("\\d")}, [] (const Captures&) {
			return Rules::integer(1);
		})
	});

	const EngineOptions options;
	const Document document("x 1");
	TokenPool pool(document.length());

	CHECK_THROWS_WITH(
		PassDriver(rules, options, std::make_shared<NoOutput>()).run(document, pool),
		"broken rule");
}
