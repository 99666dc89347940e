#include "rules.h"

namespace {

using namespace Rules;

const std::vector<std::pair<std::string, int64_t>> zero_to_nineteen = {
	{"null", 0}, {"ingen", 0}, {"intet", 0},
	{"en", 1}, {"ett", 1}, {"én", 1},
	{"to", 2}, {"tre", 3}, {"fire", 4}, {"fem", 5}, {"seks", 6},
	{"sju", 7}, {"syv", 7}, {"åtte", 8}, {"ni", 9}, {"ti", 10},
	{"elleve", 11}, {"tolv", 12}, {"tretten", 13}, {"fjorten", 14},
	{"femten", 15}, {"seksten", 16}, {"søtten", 17}, {"sytten", 17},
	{"atten", 18}, {"nitten", 19}
};

const std::vector<std::pair<std::string, int64_t>> tens = {
	{"tyve", 20}, {"tjue", 20}, {"tredve", 30}, {"førti", 40},
	{"femti", 50}, {"seksti", 60}, {"sytti", 70}, {"åtti", 80},
	{"nitti", 90}
};

// mapped to the exponent.
const std::vector<std::pair<std::string, int64_t>> powers_of_ten = {
	{"hundre", 2}, {"hundrede", 2}, {"tuse", 3}, {"tusen", 3},
	{"million", 6}, {"millioner", 6}
};

PayloadRef parse_number(const std::string &text, char separator, const std::string &ignore) {
	const optional<mpq_class> value = parse_decimal(text, separator, ignore);
	return value ? numeral(*value) : PayloadRef();
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

void Rules::NorwegianNumerals::initialize() {
	add(Dimension::Numeral, [] () {
		return std::vector<RuleRef>{
			make_rule("a pair", {regex_item("et par")}, [] (const Captures&) {
				return numeral(2, 1);
			}),

			make_rule("decimal number", {regex_item("(\\d*,\\d+)")}, [] (const Captures &c) {
				return parse_number(c.group(0), ',', "");
			}),

			make_rule("decimal with thousands separator", {regex_item("(\\d+(\\.\\d\\d\\d)+,\\d+)")},
				[] (const Captures &c) {
					return parse_number(c.group(0), ',', ".");
				}),

			make_rule("dozen", {regex_item("dusin")}, [] (const Captures&) {
				return numeral(12, 1, true);
			}),

			make_rule("few", {regex_item("(noen )?få")}, [] (const Captures&) {
				return integer(3);
			}),

			make_rule("integer (0..19)", {literal_set(zero_to_nineteen)}, [] (const Captures &c) {
				return integer(c.literal(0));
			}),

			make_rule("integer (20..90)", {literal_set(tens)}, [] (const Captures &c) {
				return integer(c.literal(0));
			}),

			make_rule("integer 21..99", {one_of({20, 30, 40, 50, 60, 70, 80, 90}), number_between(1, 10)},
				[] (const Captures &c) {
					return numeral(c.get<NumeralData>(0).value + c.get<NumeralData>(1).value);
				}),

			make_rule("integer (numeric)", {regex_item("(\\d{1,18})")}, [] (const Captures &c) {
				return parse_number(c.group(0), ',', "");
			}),

			make_rule("integer with thousands separator .", {regex_item("(\\d{1,3}(\\.\\d\\d\\d){1,5})")},
				[] (const Captures &c) {
					return parse_number(c.group(0), ',', ".");
				}),

			make_rule("intersect", {
				number_with("grain > 1", above_grain_one),
				number_with("not multipliable", not_multipliable)},
				[] (const Captures &c) {
					return add_under_grain(c.get<NumeralData>(0), c.get<NumeralData>(1));
				}),

			make_rule("intersect (with and)", {
				number_with("grain > 1", above_grain_one),
				regex_item("og"),
				number_with("not multipliable", not_multipliable)},
				[] (const Captures &c) {
					return add_under_grain(c.get<NumeralData>(0), c.get<NumeralData>(2));
				}),

			make_rule("compose by multiplication", {number(), number_with("multipliable", is_multipliable)},
				[] (const Captures &c) {
					return multiply(c.get<NumeralData>(0), c.get<NumeralData>(1));
				}),

			make_rule("number dot number", {number(), regex_item("komma"), number_with("no grain", without_grain)},
				[] (const Captures &c) {
					return numeral(c.get<NumeralData>(0).value + decimals_to_fraction(c.get<NumeralData>(2).value));
				}),

			make_rule("numbers prefix with -, negative or minus", {
				regex_item("-|minus\\s?|negativ\\s?"),
				number()},
				[] (const Captures &c) {
					return negate(c.get<NumeralData>(1));
				}),

			make_rule("numbers suffixes (K, M, G)", {number(), regex_item("([kmg])(?=[\\W\\$€]|$)")},
				[] (const Captures &c) {
					return scale_by_suffix(c.get<NumeralData>(0), c.group(1));
				}),

			make_rule("powers of tens", {literal_set(powers_of_ten)}, [] (const Captures &c) {
				const int exponent = int(c.literal(0));
				return numeral(power_of_ten(exponent), exponent, true);
			}),

			make_rule("single", {regex_item("enkelt")}, [] (const Captures&) {
				return numeral(1, 1);
			})
		};
	});
}
