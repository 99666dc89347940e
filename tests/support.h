#ifndef CDUCKLING_TESTS_SUPPORT_H
#define CDUCKLING_TESTS_SUPPORT_H

#include <limits>

#include "core/engine.h"
#include "core/resolve/value.h"
#include "rules/rules.h"

// 2013-02-12T04:30:00Z, a tuesday.
constexpr UDate test_reference = 1360643400000.0;

inline std::shared_ptr<const RuleRegistry> default_registry() {
	static const std::shared_ptr<const RuleRegistry> registry = [] () {
		auto r = std::make_shared<RuleRegistry>();
		register_default_rules(*r);
		return std::shared_ptr<const RuleRegistry>(r);
	}();
	return registry;
}

inline ResolutionContext context_for(
	const std::string &locale,
	const DimensionSet &dimensions = DimensionSet(),
	const std::string &timezone = "UTC") {

	ResolutionContext context;
	context.locale = locale;
	context.reference = test_reference;
	context.timezone = timezone;
	context.dimensions = dimensions;
	return context;
}

inline std::vector<Entity> parse(
	const std::string &text,
	const DimensionSet &dimensions = DimensionSet(),
	const std::string &locale = "en",
	const EngineOptions &options = EngineOptions()) {

	const Engine engine(default_registry(), options);
	return engine.parse(text, context_for(locale, dimensions)).entities;
}

// the value of the one entity found, or NaN.
inline double single_number(const std::string &text, const std::string &locale = "en") {
	const std::vector<Entity> entities = parse(text, {Dimension::Numeral}, locale);
	if (entities.size() != 1 || !entities[0].value->as<NumberValue>()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return entities[0].value->as<NumberValue>()->value;
}

// the single entity spanning all of text, if any.
inline const Entity *whole(const std::vector<Entity> &entities, const std::string &text) {
	if (entities.size() != 1 || entities[0].text != text) {
		return nullptr;
	}
	return &entities[0];
}

#endif // CDUCKLING_TESTS_SUPPORT_H
