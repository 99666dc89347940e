#ifndef CDUCKLING_RULES_H
#define CDUCKLING_RULES_H

#include "helpers.h"

namespace Rules {

	class EnglishNumerals : public Unit {
	public:
		EnglishNumerals(RuleRegistry &registry) : Unit(registry, "en") {
		}

		void initialize();
	};

	class EnglishOrdinals : public Unit {
	public:
		EnglishOrdinals(RuleRegistry &registry) : Unit(registry, "en") {
		}

		void initialize();
	};

	// temperature, distance, volume and quantity.
	class EnglishMeasures : public Unit {
	public:
		EnglishMeasures(RuleRegistry &registry) : Unit(registry, "en") {
		}

		void initialize();
	};

	class EnglishFinance : public Unit {
	public:
		EnglishFinance(RuleRegistry &registry) : Unit(registry, "en") {
		}

		void initialize();
	};

	// time grains, durations and times.
	class EnglishTime : public Unit {
	public:
		EnglishTime(RuleRegistry &registry) : Unit(registry, "en") {
		}

		void initialize();
	};

	class NorwegianNumerals : public Unit {
	public:
		NorwegianNumerals(RuleRegistry &registry) : Unit(registry, "nb") {
		}

		void initialize();
	};

	class DutchNumerals : public Unit {
	public:
		DutchNumerals(RuleRegistry &registry) : Unit(registry, "nl") {
		}

		void initialize();
	};

	// email, url and phone number rules for every locale.
	class Common : public Unit {
	public:
		Common(RuleRegistry &registry) : Unit(registry, "") {
		}

		void initialize();
	};

} // end namespace Rules

// the dimension dependencies, the common rules and all locale tables.
void register_default_rules(RuleRegistry &registry);

#endif // CDUCKLING_RULES_H
