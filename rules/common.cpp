#include "rules.h"

#include <cctype>

namespace {

using namespace Rules;

PayloadRef text_value(Dimension dimension, const std::string &value) {
	return make_payload<TextData>(dimension, value);
}

// "+33", "01 46-64.79 98", "ext 12" becomes "(+33) 0146647998 ext 12".
PayloadRef phone_number(const std::string &country, const std::string &number, const std::string &extension) {
	std::string digits;
	for (const char c : number) {
		if (std::isdigit(static_cast<unsigned char>(c))) {
			digits.push_back(c);
		}
	}

	if (digits.size() < 7 || digits.size() > 15) {
		return PayloadRef();
	}

	std::string value;
	if (!country.empty()) {
		value = "(+" + country + ") ";
	}
	value += digits;
	if (!extension.empty()) {
		value += " ext " + extension;
	}

	return text_value(Dimension::PhoneNumber, value);
}

} // namespace

void Rules::Common::initialize() {
	add(Dimension::Email, [] () {
		return std::vector<RuleRef>{
			make_rule("email", {regex_item("([\\w\\._+-]+@[\\w_-]+(\\.[\\w_-]+)+)")}, [] (const Captures &c) {
				return text_value(Dimension::Email, c.group(0));
			})
		};
	});

	add(Dimension::Url, [] () {
		return std::vector<RuleRef>{
			make_rule("url", {regex_item(
				"((([a-zA-Z]+)://)?(w{2,3}[0-9]*\\.)?(([\\w_-]+\\.)+[a-z]{2,4})(:(\\d+))?(/[^?\\s#]*)?(\\?[^\\s#]+)?)")},
				[] (const Captures &c) {
					return text_value(Dimension::Url, c.group(0));
				})
		};
	});

	add(Dimension::PhoneNumber, [] () {
		return std::vector<RuleRef>{
			make_rule("phone number", {regex_item(
				"(?:\\(?\\+(\\d{1,2})\\)?[\\s\\-\\.]*)?"
				"([\\d(]{1,20}(?:[\\-)\\s\\.]*\\d{1,20}){0,20})"
				"(?:\\s*e?xt?\\.?\\s*(\\d{1,20}))?")},
				[] (const Captures &c) {
					return phone_number(c.group(0, 0), c.group(0, 1), c.group(0, 2));
				})
		};
	});
}
