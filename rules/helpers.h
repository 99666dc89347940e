#ifndef CDUCKLING_RULES_HELPERS_H
#define CDUCKLING_RULES_HELPERS_H

#include "core/types.h"
#include "core/rule.h"
#include "core/registry.h"
#include "core/payloads/numeral.h"
#include "core/payloads/measure.h"
#include "core/payloads/time.h"
#include "core/payloads/text.h"

namespace Rules {

	// a group of rule tables for one locale; an empty locale means the
	// rules apply to every locale.
	class Unit {
	private:
		RuleRegistry &m_registry;
		const std::string m_locale;

	protected:
		inline void add(Dimension dimension, const RuleTable &table) const {
			if (m_locale.empty()) {
				m_registry.load_common(dimension, table);
			} else {
				m_registry.load(m_locale, dimension, table);
			}
		}

	public:
		inline Unit(RuleRegistry &registry, const std::string &locale) :
			m_registry(registry), m_locale(locale) {
		}
	};

	// numerals

	PayloadRef numeral(const mpq_class &value, const optional<int> &grain = optional<int>(), bool multipliable = false);

	PayloadRef integer(int64_t value);

	mpq_class power_of_ten(int exponent);

	// digits with an optional fractional part after separator; the
	// characters in ignore (thousands separators) are skipped.
	optional<mpq_class> parse_decimal(
		const std::string &text,
		char separator = '.',
		const std::string &ignore = std::string());

	// 5 -> 0.5, 25 -> 0.25, 0 -> 0.
	mpq_class decimals_to_fraction(const mpq_class &value);

	// declines unless a magnitude multiplier exceeds the multiplicand.
	PayloadRef multiply(const NumeralData &a, const NumeralData &b);

	// "hundred" + "five": declines unless 10^grain of a exceeds b.
	PayloadRef add_under_grain(const NumeralData &a, const NumeralData &b);

	// k, m, g.
	PayloadRef scale_by_suffix(const NumeralData &number, const std::string &suffix);

	PayloadRef negate(const NumeralData &number);

	bool is_multipliable(const NumeralData &number);

	PatternItemRef number();

	PatternItemRef number_with(const std::string &name, const std::function<bool(const NumeralData&)> &f);

	// low <= value < high.
	PatternItemRef number_between(int64_t low, int64_t high);

	PatternItemRef one_of(const std::vector<int64_t> &values);

	PatternItemRef ordinal();

	// measures

	PayloadRef measure(Dimension dimension, const mpq_class &value, const std::string &unit);

	// a measure still lacking its value, e.g. a bare currency sign.
	PayloadRef unit_only(Dimension dimension, const std::string &unit);

	PatternItemRef measure_with(
		Dimension dimension,
		const std::string &name,
		const std::function<bool(const MeasureData&)> &f);

	// "<number> <unit>" for one unit spelled as the given regex.
	RuleRef unit_rule(Dimension dimension, const std::string &unit, const std::string &regex);

	// time

	PatternItemRef grain();

	PatternItemRef duration();

	PatternItemRef any_time();

	PatternItemRef time_with(const std::string &name, const std::function<bool(const TimeData&)> &f);

	PayloadRef time_fields(const TimeFields &fields);

} // end namespace Rules

#endif // CDUCKLING_RULES_HELPERS_H
