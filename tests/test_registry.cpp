#include "doctest.h"

#include "core/registry.h"
#include "rules/rules.h"

namespace {

RuleRef named(const std::string &name) {
	return make_rule(name, {regex_item("x")}, [] (const Captures&) {
		return PayloadRef();
	});
}

std::vector<std::string> names(const RuleSet &rules) {
	std::vector<std::string> result;
	for (const RuleRef &rule : rules) {
		result.push_back(rule->name);
	}
	return result;
}

} // namespace

TEST_CASE("locale fallback") {
	RuleRegistry registry;
	registry.add("en", Dimension::Numeral, {named("a")});
	registry.add("pt_BR", Dimension::Numeral, {named("b")});

	CHECK(registry.resolve_locale("en") == "en");
	CHECK(registry.resolve_locale("EN-gb") == "en");
	CHECK(registry.resolve_locale("pt-br") == "pt_BR");
	CHECK_THROWS_AS(registry.resolve_locale("pt"), UnknownLocaleError);
	CHECK_THROWS_AS(registry.resolve_locale("fr_FR"), UnknownLocaleError);

	CHECK(registry.locales() == (std::vector<std::string>{"en", "pt_BR"}));
}

TEST_CASE("rules by dimension") {
	RuleRegistry registry;
	registry.add("en", Dimension::Ordinal, {named("ordinal")});
	registry.add("en", Dimension::Numeral, {named("one"), named("two")});
	registry.add_common(Dimension::Email, {named("email")});

	CHECK(names(registry.rules("en", DimensionSet())) ==
		(std::vector<std::string>{"one", "two", "ordinal", "email"}));
	CHECK(names(registry.rules("en", {Dimension::Ordinal})) == (std::vector<std::string>{"ordinal"}));
	CHECK(names(registry.rules("en_US", {Dimension::Email})) == (std::vector<std::string>{"email"}));

	const DimensionSet dimensions = registry.dimensions("en");
	CHECK(dimensions.size() == 3);
	CHECK(dimensions.contains(Dimension::Email));
}

TEST_CASE("dependency closure") {
	RuleRegistry registry;
	registry.add_dependency(Dimension::Time, Dimension::Duration);
	registry.add_dependency(Dimension::Duration, Dimension::Numeral);

	const DimensionSet closure = registry.closure({Dimension::Time});
	CHECK(closure.size() == 3);
	CHECK(closure.contains(Dimension::Numeral));
	CHECK(registry.closure(DimensionSet()).empty());
}

TEST_CASE("malformed tables fail to load") {
	const auto output = std::make_shared<TestOutput>();
	RuleRegistry registry(output);

	CHECK_THROWS_AS(registry.load("en", Dimension::Numeral, [] () {
		return std::vector<RuleRef>{make_rule("broken", {regex_item("[a-")}, [] (const Captures&) {
			return PayloadRef();
		})};
	}), RuleSetError);

	CHECK(output->contains("load"));
	CHECK_THROWS_AS(registry.resolve_locale("en"), UnknownLocaleError);

	CHECK_THROWS_AS(registry.load_common(Dimension::Url, [] () {
		return std::vector<RuleRef>{make_rule("empty", {}, [] (const Captures&) {
			return PayloadRef();
		})};
	}), RuleSetError);
}

TEST_CASE("default rules") {
	RuleRegistry registry;
	register_default_rules(registry);

	CHECK(registry.locales() == (std::vector<std::string>{"en", "nb", "nl"}));

	const DimensionSet en = registry.dimensions("en");
	for (Dimension d : {
		Dimension::Numeral, Dimension::Ordinal, Dimension::Time, Dimension::TimeGrain,
		Dimension::Duration, Dimension::Distance, Dimension::Temperature, Dimension::Volume,
		Dimension::Quantity, Dimension::Finance, Dimension::Email, Dimension::Url,
		Dimension::PhoneNumber}) {

		CHECK(en.contains(d));
	}

	const DimensionSet nb = registry.dimensions("nb_NO");
	CHECK(nb.contains(Dimension::Numeral));
	CHECK(nb.contains(Dimension::Email));
	CHECK_FALSE(nb.contains(Dimension::Time));

	const DimensionSet time = registry.closure({Dimension::Time});
	CHECK(time.contains(Dimension::Numeral));
	CHECK(time.contains(Dimension::Ordinal));
	CHECK(time.contains(Dimension::Duration));
	CHECK(time.contains(Dimension::TimeGrain));
	CHECK_FALSE(time.contains(Dimension::Finance));
}
