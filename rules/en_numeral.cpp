#include "rules.h"

namespace {

using namespace Rules;

const std::vector<std::pair<std::string, int64_t>> zero_to_nineteen = {
	{"zero", 0}, {"naught", 0}, {"nought", 0}, {"nil", 0}, {"none", 0},
	{"one", 1}, {"two", 2}, {"three", 3}, {"four", 4}, {"five", 5},
	{"six", 6}, {"seven", 7}, {"eight", 8}, {"nine", 9}, {"ten", 10},
	{"eleven", 11}, {"twelve", 12}, {"thirteen", 13}, {"fourteen", 14},
	{"fifteen", 15}, {"sixteen", 16}, {"seventeen", 17}, {"eighteen", 18},
	{"nineteen", 19}
};

const std::vector<std::pair<std::string, int64_t>> tens = {
	{"twenty", 20}, {"thirty", 30}, {"forty", 40}, {"fourty", 40},
	{"fifty", 50}, {"sixty", 60}, {"seventy", 70}, {"eighty", 80},
	{"ninety", 90}
};

// mapped to the exponent.
const std::vector<std::pair<std::string, int64_t>> powers_of_ten = {
	{"hundred", 2}, {"hundreds", 2}, {"thousand", 3}, {"thousands", 3},
	{"million", 6}, {"millions", 6}, {"billion", 9}, {"billions", 9}
};

const std::vector<int64_t> round_tens = {20, 30, 40, 50, 60, 70, 80, 90};

PayloadRef parse_number(const std::string &text, char separator, const std::string &ignore) {
	const optional<mpq_class> value = parse_decimal(text, separator, ignore);
	if (!value) {
		return PayloadRef();
	}
	return numeral(*value);
}

bool above_grain_one(const NumeralData &number) {
	return number.grain && *number.grain > 1;
}

bool not_multipliable(const NumeralData &number) {
	return !number.multipliable;
}

bool without_grain(const NumeralData &number) {
	return !number.grain;
}

} // namespace

void Rules::EnglishNumerals::initialize() {
	add(Dimension::Numeral, [] () {
		return std::vector<RuleRef>{
			make_rule("integer (0..19)", {literal_set(zero_to_nineteen)}, [] (const Captures &c) {
				return integer(c.literal(0));
			}),

			make_rule("integer (20..90)", {literal_set(tens)}, [] (const Captures &c) {
				return integer(c.literal(0));
			}),

			make_rule("integer 21..99", {one_of(round_tens), number_between(1, 10)}, [] (const Captures &c) {
				return numeral(c.get<NumeralData>(0).value + c.get<NumeralData>(1).value);
			}),

			make_rule("integer 21..99 (with dash)", {one_of(round_tens), regex_item("-"), number_between(1, 10)},
				[] (const Captures &c) {
					return numeral(c.get<NumeralData>(0).value + c.get<NumeralData>(2).value);
				}),

			make_rule("integer (numeric)", {regex_item("(\\d{1,18})")}, [] (const Captures &c) {
				return parse_number(c.group(0), '.', "");
			}),

			make_rule("integer with thousands separator ,", {regex_item("(\\d{1,3}(,\\d\\d\\d){1,5})")},
				[] (const Captures &c) {
					return parse_number(c.group(0), '.', ",");
				}),

			make_rule("decimal number", {regex_item("(\\d*\\.\\d+)")}, [] (const Captures &c) {
				return parse_number(c.group(0), '.', "");
			}),

			make_rule("decimal with thousands separator", {regex_item("(\\d+(,\\d\\d\\d)+\\.\\d+)")},
				[] (const Captures &c) {
					return parse_number(c.group(0), '.', ",");
				}),

			make_rule("powers of tens", {literal_set(powers_of_ten)}, [] (const Captures &c) {
				const int exponent = int(c.literal(0));
				return numeral(power_of_ten(exponent), exponent, true);
			}),

			make_rule("a few", {regex_item("(a )?few")}, [] (const Captures&) {
				return integer(3);
			}),

			make_rule("a couple", {regex_item("(a )?(couple|pair)( of)?")}, [] (const Captures&) {
				return integer(2);
			}),

			make_rule("dozen", {regex_item("dozens?")}, [] (const Captures&) {
				return numeral(12, 1, true);
			}),

			make_rule("intersect", {
				number_with("grain > 1", above_grain_one),
				number_with("not multipliable", not_multipliable)},
				[] (const Captures &c) {
					return add_under_grain(c.get<NumeralData>(0), c.get<NumeralData>(1));
				}),

			make_rule("intersect (with and)", {
				number_with("grain > 1", above_grain_one),
				regex_item("and"),
				number_with("not multipliable", not_multipliable)},
				[] (const Captures &c) {
					return add_under_grain(c.get<NumeralData>(0), c.get<NumeralData>(2));
				}),

			make_rule("compose by multiplication", {number(), number_with("multipliable", is_multipliable)},
				[] (const Captures &c) {
					return multiply(c.get<NumeralData>(0), c.get<NumeralData>(1));
				}),

			make_rule("numbers suffixes (K, M, G)", {number(), regex_item("([kmg])(?=[\\W\\$€]|$)")},
				[] (const Captures &c) {
					return scale_by_suffix(c.get<NumeralData>(0), c.group(1));
				}),

			make_rule("numbers prefix with -, negative or minus", {
				regex_item("-|minus\\s?|negative\\s?"),
				number_with("not negative", [] (const NumeralData &n) {
					return n.value >= 0;
				})},
				[] (const Captures &c) {
					return negate(c.get<NumeralData>(1));
				}),

			make_rule("number dot number", {
				number_with("no grain", without_grain),
				regex_item("dot|point"),
				number_with("no grain", without_grain)},
				[] (const Captures &c) {
					return numeral(c.get<NumeralData>(0).value + decimals_to_fraction(c.get<NumeralData>(2).value));
				})
		};
	});
}
