#include "rules.h"

void register_default_rules(RuleRegistry &registry) {
	for (Dimension d : {
		Dimension::Ordinal,
		Dimension::Distance,
		Dimension::Temperature,
		Dimension::Volume,
		Dimension::Quantity,
		Dimension::Finance,
		Dimension::Duration,
		Dimension::Time}) {

		registry.add_dependency(d, Dimension::Numeral);
	}

	registry.add_dependency(Dimension::Duration, Dimension::TimeGrain);
	registry.add_dependency(Dimension::Time, Dimension::Ordinal);
	registry.add_dependency(Dimension::Time, Dimension::Duration);
	registry.add_dependency(Dimension::Time, Dimension::TimeGrain);

	Rules::Common(registry).initialize();

	Rules::EnglishNumerals(registry).initialize();
	Rules::EnglishOrdinals(registry).initialize();
	Rules::EnglishMeasures(registry).initialize();
	Rules::EnglishFinance(registry).initialize();
	Rules::EnglishTime(registry).initialize();

	Rules::NorwegianNumerals(registry).initialize();
	Rules::DutchNumerals(registry).initialize();
}
