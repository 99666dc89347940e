#ifndef CDUCKLING_REGISTRY_H
#define CDUCKLING_REGISTRY_H

#include <map>

#include "types.h"
#include "rule.h"
#include "output.h"

using RuleTable = std::function<std::vector<RuleRef>()>;

// which rules apply to a request: rules per locale and dimension, rules
// shared by all locales, and the dimensions each dimension is built from.
// filled once at startup and read only afterwards.
class RuleRegistry {
private:
	typedef std::map<Dimension, std::vector<RuleRef>> DimensionRules;

	std::map<std::string, DimensionRules> m_locales;
	DimensionRules m_common;
	std::map<Dimension, DimensionSet> m_dependencies;
	OutputRef m_output;

	static void append(DimensionRules &rules, Dimension dimension, const std::vector<RuleRef> &table);

public:
	RuleRegistry(const OutputRef &output = OutputRef());

	// builds a rule table; a malformed table is logged and rethrown.
	void load(const std::string &locale, Dimension dimension, const RuleTable &table);

	void load_common(Dimension dimension, const RuleTable &table);

	void add(const std::string &locale, Dimension dimension, const std::vector<RuleRef> &rules);

	void add_common(Dimension dimension, const std::vector<RuleRef> &rules);

	// tokens of dimension are composed from tokens of other.
	void add_dependency(Dimension dimension, Dimension other);

	// the dimensions plus everything they transitively depend on.
	DimensionSet closure(const DimensionSet &dimensions) const;

	// the registered locale serving the given one: "en_GB" falls back
	// to "en". throws UnknownLocaleError.
	std::string resolve_locale(const std::string &locale) const;

	std::vector<std::string> locales() const;

	// all dimensions with rules for a registered locale.
	DimensionSet dimensions(const std::string &locale) const;

	// the rules for a registered locale and the given dimensions (all
	// dimensions if empty): the locale rules, then the common ones, each
	// ordered by dimension.
	RuleSet rules(const std::string &locale, const DimensionSet &dimensions) const;
};

#endif // CDUCKLING_REGISTRY_H
