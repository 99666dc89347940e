// @formatter:off

#include "doctest.h"

#include "core/matcher.h"
#include "core/payloads/numeral.h"
#include "rules/helpers.h"

namespace {

RuleRef digits_rule() {
	return make_rule("digits", {regex_item("\\d+")}, [] (const Captures &c) {
		return Rules::parse_decimal(c.group(0)) ? Rules::numeral(*Rules::parse_decimal(c.group(0))) : PayloadRef();
	});
}

RuleRef sum_rule() {
	return make_rule("sum", {Rules::number(), regex_item("plus"), Rules::number()}, [] (const Captures &c) {
		return Rules::numeral(c.get<NumeralData>(0).value + c.get<NumeralData>(2).value);
	});
}

struct Fixture {
	Document document;
	TokenPool pool;
	TextScanner scanner;
	EngineOptions options;

	Fixture(const std::string &text) : document(text), pool(document.length()), scanner(document) {
	}

	std::vector<TokenRef> run(const Rule &rule, index_t offset, uint16_t pass = 1) {
		const MatchContext context{document, pool, scanner, options, pass};
		std::vector<TokenRef> out;
		Matcher matcher(context, rule, out);
		matcher(offset);
		return out;
	}
};

} // namespace

TEST_CASE("match text rule") {
	Fixture f("12 plus 30");
	const RuleRef rule = digits_rule();

	const std::vector<TokenRef> found = f.run(*rule, 8);
	REQUIRE(found.size() == 1);
	CHECK(found[0]->span == (Span{8, 10}));
	CHECK(found[0]->as<NumeralData>()->value == 30);
	CHECK(found[0]->rule == rule.get());
	CHECK(found[0]->pass == 1);

	CHECK(f.run(*rule, 2).empty());
}

TEST_CASE("match token rule") {
	Fixture f("12 plus 30");
	const RuleRef digits = digits_rule();
	const RuleRef sum = sum_rule();

	for (index_t offset : {0, 8}) {
		for (const TokenRef &token : f.run(*digits, offset)) {
			f.pool.insert(token);
		}
	}

	const std::vector<TokenRef> found = f.run(*sum, 0, 2);
	REQUIRE(found.size() == 1);
	CHECK(found[0]->span == (Span{0, 10}));
	CHECK(found[0]->as<NumeralData>()->value == 42);
	CHECK(found[0]->pass == 2);
}

TEST_CASE("strict adjacency") {
	Fixture f("12 plus 30");
	f.options.adjacency = Adjacency::Strict;

	const RuleRef digits = digits_rule();
	for (index_t offset : {0, 8}) {
		for (const TokenRef &token : f.run(*digits, offset)) {
			f.pool.insert(token);
		}
	}

	CHECK(f.run(*sum_rule(), 0, 2).empty());

	// with the white space inside the regex it matches again.
	const RuleRef spaced = make_rule("spaced sum", {Rules::number(), regex_item("\\s+plus\\s+"), Rules::number()},
		[] (const Captures &c) {
			return Rules::numeral(c.get<NumeralData>(0).value + c.get<NumeralData>(2).value);
		});
	CHECK(f.run(*spaced, 0, 2).size() == 1);
}

TEST_CASE("match explores every token at an offset") {
	Fixture f("5");

	f.pool.insert(std::make_shared<const Token>(Span{0, 1}, Rules::integer(5)));
	f.pool.insert(std::make_shared<const Token>(Span{0, 1}, Rules::numeral(5, 1)));

	const RuleRef rule = make_rule("double", {Rules::number()}, [] (const Captures &c) {
		return Rules::numeral(c.get<NumeralData>(0).value * 2, c.get<NumeralData>(0).grain);
	});

	CHECK(f.run(*rule, 0).size() == 2);
}

TEST_CASE("production declines") {
	Fixture f("7");
	const RuleRef rule = make_rule("never", {regex_item("\\d")}, [] (const Captures&) {
		return PayloadRef();
	});
	CHECK(f.run(*rule, 0).empty());
}

TEST_CASE("dangling item does not match") {
	Fixture f("-");
	const RuleRef rule = make_rule("negative", {regex_item("-"), Rules::number()}, [] (const Captures &c) {
		return Rules::negate(c.get<NumeralData>(1));
	});
	CHECK(f.run(*rule, 0).empty());
}

TEST_CASE("regex match payloads are rejected") {
	Fixture f("7");
	const RuleRef rule = make_rule("leak", {regex_item("\\d")}, [] (const Captures &c) {
		return c.token(0)->payload;
	});
	CHECK_THROWS_AS(f.run(*rule, 0), std::logic_error);
}
