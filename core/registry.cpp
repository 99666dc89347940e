#include "registry.h"

#include <algorithm>
#include <cctype>

namespace {

// "EN-us" -> "en_US"
std::string canonical_locale(const std::string &locale) {
	std::string s(locale);
	std::replace(s.begin(), s.end(), '-', '_');

	const auto sep = s.find('_');
	for (size_t i = 0; i < s.size(); i++) {
		if (sep == std::string::npos || i < sep) {
			s[i] = char(std::tolower((unsigned char)s[i]));
		} else {
			s[i] = char(std::toupper((unsigned char)s[i]));
		}
	}

	return s;
}

} // namespace

RuleRegistry::RuleRegistry(const OutputRef &output) : m_output(output) {
}

void RuleRegistry::append(DimensionRules &rules, Dimension dimension, const std::vector<RuleRef> &table) {
	for (const RuleRef &rule : table) {
		if (!rule) {
			throw RuleSetError(std::string("null rule in table for ") + dimension_name(dimension));
		}
	}
	std::vector<RuleRef> &target = rules[dimension];
	target.insert(target.end(), table.begin(), table.end());
}

void RuleRegistry::load(const std::string &locale, Dimension dimension, const RuleTable &table) {
	try {
		add(locale, dimension, table());
	} catch (const RuleSetError &error) {
		message(m_output, "RuleSet", "load", "rules for `1` in locale `2` failed to load: `3`",
			dimension_name(dimension), locale, error.what());
		throw;
	}
}

void RuleRegistry::load_common(Dimension dimension, const RuleTable &table) {
	try {
		add_common(dimension, table());
	} catch (const RuleSetError &error) {
		message(m_output, "RuleSet", "load", "common rules for `1` failed to load: `2`",
			dimension_name(dimension), error.what());
		throw;
	}
}

void RuleRegistry::add(const std::string &locale, Dimension dimension, const std::vector<RuleRef> &rules) {
	append(m_locales[canonical_locale(locale)], dimension, rules);
}

void RuleRegistry::add_common(Dimension dimension, const std::vector<RuleRef> &rules) {
	append(m_common, dimension, rules);
}

void RuleRegistry::add_dependency(Dimension dimension, Dimension other) {
	m_dependencies[dimension].insert(other);
}

DimensionSet RuleRegistry::closure(const DimensionSet &dimensions) const {
	DimensionSet result(dimensions);
	std::vector<Dimension> work;
	dimensions.each([&work] (Dimension d) {
		work.push_back(d);
	});

	while (!work.empty()) {
		const Dimension d = work.back();
		work.pop_back();

		const auto i = m_dependencies.find(d);
		if (i == m_dependencies.end()) {
			continue;
		}
		i->second.each([&result, &work] (Dimension other) {
			if (!result.contains(other)) {
				result.insert(other);
				work.push_back(other);
			}
		});
	}

	return result;
}

std::string RuleRegistry::resolve_locale(const std::string &locale) const {
	const std::string canonical = canonical_locale(locale);
	if (m_locales.find(canonical) != m_locales.end()) {
		return canonical;
	}

	const auto sep = canonical.find('_');
	if (sep != std::string::npos) {
		const std::string language = canonical.substr(0, sep);
		if (m_locales.find(language) != m_locales.end()) {
			return language;
		}
	}

	throw UnknownLocaleError("no rules for locale " + locale);
}

std::vector<std::string> RuleRegistry::locales() const {
	std::vector<std::string> names;
	for (const auto &locale : m_locales) {
		names.push_back(locale.first);
	}
	return names;
}

DimensionSet RuleRegistry::dimensions(const std::string &locale) const {
	DimensionSet result;

	const auto i = m_locales.find(resolve_locale(locale));
	for (const auto &entry : i->second) {
		result.insert(entry.first);
	}
	for (const auto &entry : m_common) {
		result.insert(entry.first);
	}

	return result;
}

RuleSet RuleRegistry::rules(const std::string &locale, const DimensionSet &dimensions) const {
	const DimensionRules &local = m_locales.find(resolve_locale(locale))->second;

	RuleSet set;

	const auto wanted = [&dimensions] (Dimension d) {
		return dimensions.empty() || dimensions.contains(d);
	};

	for (const auto &entry : local) {
		if (wanted(entry.first)) {
			set.add(entry.second);
		}
	}
	for (const auto &entry : m_common) {
		if (wanted(entry.first)) {
			set.add(entry.second);
		}
	}

	return set;
}
