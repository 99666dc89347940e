#include "doctest.h"

#include "core/resolver.h"
#include "core/payloads/numeral.h"
#include "core/payloads/measure.h"
#include "rules/helpers.h"

namespace {

RuleRef dummy_rule(const std::string &name, bool latent = false) {
	const Production production = [] (const Captures&) {
		return PayloadRef();
	};
	return latent ?
		make_latent_rule(name, {regex_item("x")}, production) :
		make_rule(name, {regex_item("x")}, production);
}

class Selection {
private:
	RuleSet m_rules;
	ValueConverters m_converters;
	std::vector<ResolvedToken> m_candidates;

public:
	EngineOptions options;

	Selection() : m_converters(ValueConverters::defaults()) {
	}

	void add(const RuleRef &rule, Span span, const PayloadRef &payload) {
		m_rules.add(rule);
		const TokenRef token = std::make_shared<const Token>(span, payload, rule.get(), 1, rule->latent);
		const ResolvedValueRef value = m_converters.convert(*token, ResolutionContext(), options);
		REQUIRE(bool(value));
		m_candidates.push_back(ResolvedToken{token, value, m_candidates.size()});
	}

	std::vector<Span> select(const DimensionSet &dimensions = DimensionSet()) const {
		std::vector<Span> spans;
		for (const ResolvedToken &t : Resolver(m_rules, m_converters, options).select(m_candidates, dimensions)) {
			spans.push_back(t.token->span);
		}
		return spans;
	}

	std::vector<std::string> rules(const DimensionSet &dimensions = DimensionSet()) const {
		std::vector<std::string> names;
		for (const ResolvedToken &t : Resolver(m_rules, m_converters, options).select(m_candidates, dimensions)) {
			names.push_back(t.token->rule->name);
		}
		return names;
	}
};

PayloadRef distance(long value) {
	return std::make_shared<const MeasureData>(Dimension::Distance, mpq_class(value), "metre");
}

} // namespace

TEST_CASE("longer span wins") {
	Selection s;
	s.add(dummy_rule("short"), Span{0, 3}, Rules::integer(100));
	s.add(dummy_rule("long"), Span{0, 4}, Rules::integer(100000));

	CHECK(s.select() == (std::vector<Span>{{0, 4}}));
}

TEST_CASE("contained tokens are dropped across dimensions") {
	Selection s;
	s.add(dummy_rule("number"), Span{0, 1}, Rules::integer(5));
	s.add(dummy_rule("distance"), Span{0, 3}, distance(5));

	CHECK(s.select() == (std::vector<Span>{{0, 3}}));
}

TEST_CASE("non-overlapping tokens are all kept") {
	Selection s;
	s.add(dummy_rule("b"), Span{4, 6}, Rules::integer(2));
	s.add(dummy_rule("a"), Span{0, 3}, Rules::integer(1));

	CHECK(s.select() == (std::vector<Span>{{0, 3}, {4, 6}}));
}

TEST_CASE("equal length overlaps") {
	const RuleRef first = dummy_rule("first");
	const RuleRef second = dummy_rule("second");

	SUBCASE("earlier start wins") {
		Selection s;
		s.add(second, Span{2, 6}, Rules::integer(2));
		s.add(first, Span{0, 4}, Rules::integer(1));
		CHECK(s.select() == (std::vector<Span>{{0, 4}}));
	}

	SUBCASE("declaration order") {
		Selection s;
		s.add(first, Span{0, 4}, Rules::integer(1));
		s.add(second, Span{0, 4}, Rules::integer(2));
		CHECK(s.rules() == (std::vector<std::string>{"first"}));
	}

	SUBCASE("reverse declaration order") {
		Selection s;
		s.options.tie_break = TieBreak::ReverseDeclarationOrder;
		s.add(first, Span{0, 4}, Rules::integer(1));
		s.add(second, Span{0, 4}, Rules::integer(2));
		CHECK(s.rules() == (std::vector<std::string>{"second"}));
	}
}

TEST_CASE("equal spans of different dimensions") {
	Selection s;
	s.add(dummy_rule("number"), Span{0, 2}, Rules::integer(12));
	s.add(dummy_rule("distance"), Span{0, 2}, distance(12));

	CHECK(s.select().size() == 2);
	CHECK(s.select({Dimension::Numeral, Dimension::Distance}).size() == 2);

	// a single requested dimension allows no overlap at all.
	CHECK(s.select({Dimension::Distance}).size() == 1);
}

TEST_CASE("partial overlaps of different dimensions") {
	Selection s;
	s.add(dummy_rule("number"), Span{0, 4}, Rules::integer(12));
	s.add(dummy_rule("distance"), Span{2, 7}, distance(3));

	CHECK(s.select() == (std::vector<Span>{{2, 7}}));

	s.options.cross_dimension_overlap = true;
	CHECK(s.select() == (std::vector<Span>{{0, 4}, {2, 7}}));
}

TEST_CASE("latent tokens") {
	const RuleRef latent = dummy_rule("latent", true);

	SUBCASE("kept when alone") {
		Selection s;
		s.add(latent, Span{0, 4}, Rules::integer(2015));
		CHECK(s.rules() == (std::vector<std::string>{"latent"}));
	}

	SUBCASE("dropped when overlapped by a shorter token") {
		Selection s;
		s.add(latent, Span{0, 4}, Rules::integer(2015));
		s.add(dummy_rule("solid"), Span{3, 5}, distance(5));
		CHECK(s.rules() == (std::vector<std::string>{"solid"}));
	}

	SUBCASE("dropped on request") {
		Selection s;
		s.options.with_latent = false;
		s.add(latent, Span{0, 4}, Rules::integer(2015));
		CHECK(s.select().empty());
	}
}

TEST_CASE("candidates skip other dimensions and bare units") {
	const Document document("$ 5");
	TokenPool pool(document.length());

	const RuleRef rule = dummy_rule("any");
	pool.insert(std::make_shared<const Token>(Span{0, 1}, Rules::unit_only(Dimension::Finance, "USD"), rule.get()));
	pool.insert(std::make_shared<const Token>(Span{2, 3}, Rules::integer(5), rule.get()));

	const RuleSet rules(std::vector<RuleRef>{rule});
	const ValueConverters converters = ValueConverters::defaults();
	const EngineOptions options;
	const Resolver resolver(rules, converters, options);

	ResolutionContext context;
	CHECK(resolver.candidates(pool, context).size() == 1);

	context.dimensions = DimensionSet{Dimension::Finance};
	CHECK(resolver.candidates(pool, context).empty());
}
