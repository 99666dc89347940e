#include "helpers.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace Rules {

	PayloadRef numeral(const mpq_class &value, const optional<int> &grain, bool multipliable) {
		return make_payload<NumeralData>(value, grain, multipliable);
	}

	PayloadRef integer(int64_t value) {
		return numeral(mpq_class(long(value)));
	}

	mpq_class power_of_ten(int exponent) {
		mpz_class p;
		mpz_ui_pow_ui(p.get_mpz_t(), 10, (unsigned long)std::abs(exponent));
		if (exponent >= 0) {
			return mpq_class(p);
		} else {
			mpq_class q(mpz_class(1), p);
			q.canonicalize();
			return q;
		}
	}

	optional<mpq_class> parse_decimal(const std::string &text, char separator, const std::string &ignore) {
		mpz_class digits(0);
		int decimals = 0;
		bool fraction = false;
		bool any = false;

		for (const char c : text) {
			if (std::isdigit((unsigned char)c)) {
				digits = digits * 10 + (c - '0');
				if (fraction) {
					decimals++;
				}
				any = true;
			} else if (c == separator && !fraction) {
				fraction = true;
			} else if (ignore.find(c) == std::string::npos) {
				return optional<mpq_class>();
			}
		}

		if (!any) {
			return optional<mpq_class>();
		}

		mpq_class value(digits);
		value /= power_of_ten(decimals);
		value.canonicalize();
		return value;
	}

	mpq_class decimals_to_fraction(const mpq_class &value) {
		if (value <= 0) {
			return mpq_class(0);
		}
		mpq_class multiplier(1);
		while (!(value < multiplier)) {
			multiplier *= 10;
		}
		mpq_class fraction(value / multiplier);
		fraction.canonicalize();
		return fraction;
	}

	PayloadRef multiply(const NumeralData &a, const NumeralData &b) {
		mpq_class product(a.value * b.value);
		product.canonicalize();

		if (!b.grain) {
			return numeral(product);
		} else if (b.value > a.value) {
			return numeral(product, *b.grain);
		} else {
			return PayloadRef();
		}
	}

	PayloadRef add_under_grain(const NumeralData &a, const NumeralData &b) {
		if (!a.grain || !(power_of_ten(*a.grain) > b.value)) {
			return PayloadRef();
		}
		mpq_class sum(a.value + b.value);
		sum.canonicalize();
		return numeral(sum);
	}

	PayloadRef scale_by_suffix(const NumeralData &number, const std::string &suffix) {
		std::string s(suffix);
		std::transform(s.begin(), s.end(), s.begin(), [] (char c) {
			return char(std::tolower((unsigned char)c));
		});

		int exponent;
		if (s == "k") {
			exponent = 3;
		} else if (s == "m") {
			exponent = 6;
		} else if (s == "g") {
			exponent = 9;
		} else {
			return PayloadRef();
		}

		mpq_class value(number.value * power_of_ten(exponent));
		value.canonicalize();
		return numeral(value);
	}

	PayloadRef negate(const NumeralData &number) {
		return numeral(-number.value);
	}

	bool is_multipliable(const NumeralData &number) {
		return number.multipliable;
	}

	PatternItemRef number() {
		return dimension_item(Dimension::Numeral);
	}

	PatternItemRef number_with(const std::string &name, const std::function<bool(const NumeralData&)> &f) {
		return predicate_item(Dimension::Numeral, [f] (const Payload &payload) {
			const NumeralData *number = payload.as<NumeralData>();
			return number && f(*number);
		}, name);
	}

	PatternItemRef number_between(int64_t low, int64_t high) {
		return numeric_range(mpq_class(long(low)), mpq_class(long(high)));
	}

	PatternItemRef one_of(const std::vector<int64_t> &values) {
		std::string name("one of");
		for (const int64_t v : values) {
			name += " " + std::to_string(v);
		}
		return number_with(name, [values] (const NumeralData &number) {
			return number.is_integer() && std::any_of(values.begin(), values.end(), [&number] (int64_t v) {
				return number.value == mpq_class(long(v));
			});
		});
	}

	PatternItemRef ordinal() {
		return dimension_item(Dimension::Ordinal);
	}

	PayloadRef measure(Dimension dimension, const mpq_class &value, const std::string &unit) {
		return make_payload<MeasureData>(dimension, value, unit);
	}

	PayloadRef unit_only(Dimension dimension, const std::string &unit) {
		return make_payload<MeasureData>(dimension, optional<mpq_class>(), unit);
	}

	PatternItemRef measure_with(
		Dimension dimension,
		const std::string &name,
		const std::function<bool(const MeasureData&)> &f) {

		return predicate_item(dimension, [f] (const Payload &payload) {
			const MeasureData *measure = payload.as<MeasureData>();
			return measure && f(*measure);
		}, name);
	}

	RuleRef unit_rule(Dimension dimension, const std::string &unit, const std::string &regex) {
		return make_rule("<number> " + unit, {number(), regex_item(regex)}, [dimension, unit] (const Captures &c) {
			return measure(dimension, c.get<NumeralData>(0).value, unit);
		});
	}

	PatternItemRef grain() {
		return dimension_item(Dimension::TimeGrain);
	}

	PatternItemRef duration() {
		return dimension_item(Dimension::Duration);
	}

	PatternItemRef any_time() {
		return dimension_item(Dimension::Time);
	}

	PatternItemRef time_with(const std::string &name, const std::function<bool(const TimeData&)> &f) {
		return predicate_item(Dimension::Time, [f] (const Payload &payload) {
			const TimeData *time = payload.as<TimeData>();
			return time && f(*time);
		}, name);
	}

	PayloadRef time_fields(const TimeFields &fields) {
		return TimeData::with_fields(fields);
	}

} // end namespace Rules
