#include "rules.h"

#include <cstdlib>

namespace {

using namespace Rules;

const std::vector<std::pair<std::string, int64_t>> ordinals = {
	{"first", 1}, {"second", 2}, {"third", 3}, {"fourth", 4}, {"fifth", 5},
	{"sixth", 6}, {"seventh", 7}, {"eighth", 8}, {"ninth", 9}, {"tenth", 10},
	{"eleventh", 11}, {"twelfth", 12}, {"thirteenth", 13}, {"fourteenth", 14},
	{"fifteenth", 15}, {"sixteenth", 16}, {"seventeenth", 17},
	{"eighteenth", 18}, {"nineteenth", 19}, {"twentieth", 20},
	{"thirtieth", 30}, {"fortieth", 40}, {"fiftieth", 50}, {"sixtieth", 60},
	{"seventieth", 70}, {"eightieth", 80}, {"ninetieth", 90}
};

const std::vector<std::pair<std::string, int64_t>> tens = {
	{"twenty", 20}, {"thirty", 30}, {"forty", 40}, {"fifty", 50},
	{"sixty", 60}, {"seventy", 70}, {"eighty", 80}, {"ninety", 90}
};

PayloadRef ordinal_value(int64_t value) {
	return make_payload<OrdinalData>(value);
}

} // namespace

void Rules::EnglishOrdinals::initialize() {
	add(Dimension::Ordinal, [] () {
		return std::vector<RuleRef>{
			make_rule("ordinals (first..twentieth, thirtieth, ...)", {literal_set(ordinals)}, [] (const Captures &c) {
				return ordinal_value(c.literal(0));
			}),

			make_rule("ordinals (composite, e.g. eighty-seven)", {
				literal_set(tens),
				regex_item("[\\s\\-]+"),
				ordinal()},
				[] (const Captures &c) -> PayloadRef {
					const int64_t units = c.get<OrdinalData>(2).value;
					if (units < 1 || units > 9) {
						return PayloadRef();
					}
					return ordinal_value(c.literal(0) + units);
				}),

			make_rule("ordinal (digits)", {regex_item("0*(\\d+) ?(st|nd|rd|th)")}, [] (const Captures &c) -> PayloadRef {
				const std::string &digits = c.group(0);
				if (digits.size() > 18) {
					return PayloadRef();
				}
				return ordinal_value(std::strtoll(digits.c_str(), nullptr, 10));
			})
		};
	});
}
