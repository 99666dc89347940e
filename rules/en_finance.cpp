#include "rules.h"

namespace {

using namespace Rules;

// symbols and names, mapped to ISO codes ("cent" stays a unit of its own).
const std::vector<std::pair<std::string, std::string>> currencies = {
	{"\\$|dollars?|usd|bucks?", "USD"},
	{"€|euros?|eur", "EUR"},
	{"£|pounds?( sterling)?|gbp", "GBP"},
	{"cents?|¢", "cent"},
	{"kroner|kr|nok", "NOK"},
	{"inr|rs\\.?|rupees?", "INR"}
};

bool without_value(const MeasureData &money) {
	return !money.value;
}

bool whole_amount(const MeasureData &money) {
	return money.value && money.unit != "cent";
}

bool in_cents(const MeasureData &money) {
	return money.value && money.unit == "cent";
}

PayloadRef amount(const MeasureData &money, const mpq_class &value) {
	return money.with_value(value);
}

PayloadRef add_cents(const MeasureData &money, const MeasureData &cents) {
	mpq_class value(*money.value + *cents.value / 100);
	value.canonicalize();
	return money.with_value(value);
}

} // namespace

void Rules::EnglishFinance::initialize() {
	add(Dimension::Finance, [] () {
		std::vector<RuleRef> rules;

		for (const auto &currency : currencies) {
			const std::string code = currency.second;
			rules.push_back(make_rule("currency " + code, {regex_item(currency.first)}, [code] (const Captures&) {
				return unit_only(Dimension::Finance, code);
			}));
		}

		rules.push_back(make_rule("<amount> <unit>", {
			number(),
			measure_with(Dimension::Finance, "currency", without_value)},
			[] (const Captures &c) {
				return amount(c.get<MeasureData>(1), c.get<NumeralData>(0).value);
			}));

		rules.push_back(make_rule("<unit> <amount>", {
			measure_with(Dimension::Finance, "currency", without_value),
			number()},
			[] (const Captures &c) {
				return amount(c.get<MeasureData>(0), c.get<NumeralData>(1).value);
			}));

		rules.push_back(make_rule("intersect (X cents)", {
			measure_with(Dimension::Finance, "amount", whole_amount),
			measure_with(Dimension::Finance, "cents", in_cents)},
			[] (const Captures &c) {
				return add_cents(c.get<MeasureData>(0), c.get<MeasureData>(1));
			}));

		rules.push_back(make_rule("intersect (and X cents)", {
			measure_with(Dimension::Finance, "amount", whole_amount),
			regex_item("and"),
			measure_with(Dimension::Finance, "cents", in_cents)},
			[] (const Captures &c) {
				return add_cents(c.get<MeasureData>(0), c.get<MeasureData>(2));
			}));

		rules.push_back(make_rule("about <amount-of-money>", {
			regex_item("about|approx(\\.|imately)?|close to|near( to)?|around|almost"),
			measure_with(Dimension::Finance, "amount", whole_amount)},
			[] (const Captures &c) {
				return c.token(1)->payload;
			}));

		return rules;
	});
}
