#include "rules.h"

#include <algorithm>
#include <cctype>

namespace {

using namespace Rules;

const std::vector<std::pair<std::string, int64_t>> zero_to_nineteen = {
	{"niks", 0}, {"nul", 0}, {"geen", 0},
	{"één", 1}, {"een", 1},
	{"twee", 2}, {"drie", 3}, {"vier", 4}, {"vijf", 5}, {"zes", 6},
	{"zeven", 7}, {"acht", 8}, {"negen", 9}, {"tien", 10},
	{"elf", 11}, {"twaalf", 12}, {"dertien", 13}, {"veertien", 14},
	{"vijftien", 15}, {"zestien", 16}, {"zeventien", 17},
	{"achtien", 18}, {"negentien", 19}
};

const std::vector<std::pair<std::string, int64_t>> tens = {
	{"twintig", 20}, {"dertig", 30}, {"veertig", 40}, {"vijftig", 50},
	{"zestig", 60}, {"zeventig", 70}, {"tachtig", 80}, {"negentig", 90}
};

const std::vector<std::pair<std::string, int64_t>> powers_of_ten = {
	{"honderd", 2}, {"duizend", 3}, {"miljoen", 6}
};

int64_t lookup(const std::vector<std::pair<std::string, int64_t>> &table, std::string word) {
	std::transform(word.begin(), word.end(), word.begin(), [] (unsigned char c) {
		return std::tolower(c);
	});
	for (const auto &entry : table) {
		if (entry.first == word) {
			return entry.second;
		}
	}
	throw std::logic_error("unknown numeral word: " + word);
}

PayloadRef parse_number(const std::string &text, char separator, const std::string &ignore) {
	const optional<mpq_class> value = parse_decimal(text, separator, ignore);
	return value ? numeral(*value) : PayloadRef();
}

bool above_grain_one(const NumeralData &number) {
	return number.grain && *number.grain > 1;
}

bool without_grain(const NumeralData &number) {
	return !number.grain;
}

} // namespace

void Rules::DutchNumerals::initialize() {
	add(Dimension::Numeral, [] () {
		return std::vector<RuleRef>{
			make_rule("integer (0..19)", {literal_set(zero_to_nineteen)}, [] (const Captures &c) {
				return integer(c.literal(0));
			}),

			make_rule("ten", {regex_item("tien")}, [] (const Captures&) {
				return numeral(10, 1);
			}),

			make_rule("integer (20..90)", {literal_set(tens)}, [] (const Captures &c) {
				return integer(c.literal(0));
			}),

			// "eenentwintig", "vijfenveertig".
			make_rule("integer ([2-9][1-9])", {regex_item(
				"(een|twee|drie|vier|vijf|zes|zeven|acht|negen)(?:e|ë)n"
				"(twintig|dertig|veertig|vijftig|zestig|zeventig|tachtig|negentig)")},
				[] (const Captures &c) {
					return integer(lookup(zero_to_nineteen, c.group(0, 0)) + lookup(tens, c.group(0, 1)));
				}),

			make_rule("numbers en", {number_between(1, 10), regex_item("en"), one_of({20, 30, 40, 50, 60, 70, 80, 90})},
				[] (const Captures &c) {
					return numeral(c.get<NumeralData>(0).value + c.get<NumeralData>(2).value);
				}),

			make_rule("few", {regex_item("meerdere")}, [] (const Captures&) {
				return integer(3);
			}),

			make_rule("couple", {regex_item("(een )?paar")}, [] (const Captures&) {
				return integer(2);
			}),

			make_rule("dozen", {regex_item("dozijn")}, [] (const Captures&) {
				return numeral(12, 1, true);
			}),

			make_rule("powers of tens", {literal_set(powers_of_ten)}, [] (const Captures &c) {
				const int exponent = int(c.literal(0));
				return numeral(power_of_ten(exponent), exponent, true);
			}),

			make_rule("integer (numeric)", {regex_item("(\\d{1,18})")}, [] (const Captures &c) {
				return parse_number(c.group(0), ',', "");
			}),

			make_rule("integer with thousands separator .", {regex_item("(\\d{1,3}(\\.\\d\\d\\d){1,5})")},
				[] (const Captures &c) {
					return parse_number(c.group(0), ',', ".");
				}),

			make_rule("decimal number", {regex_item("(\\d*,\\d+)")}, [] (const Captures &c) {
				return parse_number(c.group(0), ',', "");
			}),

			make_rule("decimal with thousands separator", {regex_item("(\\d+(\\.\\d\\d\\d)+,\\d+)")},
				[] (const Captures &c) {
					return parse_number(c.group(0), ',', ".");
				}),

			make_rule("intersect", {number_with("grain > 1", above_grain_one), number()},
				[] (const Captures &c) {
					return add_under_grain(c.get<NumeralData>(0), c.get<NumeralData>(1));
				}),

			make_rule("compose by multiplication", {number(), number_with("multipliable", is_multipliable)},
				[] (const Captures &c) {
					return multiply(c.get<NumeralData>(0), c.get<NumeralData>(1));
				}),

			make_rule("number comma number", {number(), regex_item("komma"), number_with("no grain", without_grain)},
				[] (const Captures &c) {
					return numeral(c.get<NumeralData>(0).value + decimals_to_fraction(c.get<NumeralData>(2).value));
				}),

			make_rule("numbers suffixes (K, M, G)", {number(), regex_item("([kmg])(?=[\\W\\$€]|$)")},
				[] (const Captures &c) {
					return scale_by_suffix(c.get<NumeralData>(0), c.group(1));
				}),

			make_rule("numbers prefix with -, negative or minus", {
				regex_item("-|minus|min|negatief"),
				number()},
				[] (const Captures &c) {
					return negate(c.get<NumeralData>(1));
				})
		};
	});
}
