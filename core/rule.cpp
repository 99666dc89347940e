#include "rule.h"
#include "payloads/text.h"

#include <limits>

const std::string &Captures::group(size_t i, size_t g) const {
	const GroupMatchData &match = get<GroupMatchData>(i);
	if (g >= match.groups.size()) {
		throw std::runtime_error("capture " + std::to_string(i) + " has no group " + std::to_string(g));
	}
	return match.groups[g];
}

int64_t Captures::literal(size_t i) const {
	return get<LiteralData>(i).value;
}

Rule::Rule(
	const std::string &name_,
	const std::vector<PatternItemRef> &pattern_,
	const Production &production_,
	bool latent_) :

	name(name_),
	pattern(pattern_),
	production(production_),
	latent(latent_) {

	if (pattern.empty()) {
		throw RuleSetError("rule \"" + name + "\" has an empty pattern");
	}
	for (const PatternItemRef &item : pattern) {
		if (!item) {
			throw RuleSetError("rule \"" + name + "\" has a null pattern item");
		}
	}
	if (!production) {
		throw RuleSetError("rule \"" + name + "\" has no production");
	}
}

bool Rule::is_text_only() const {
	for (const PatternItemRef &item : pattern) {
		if (!item->is_text()) {
			return false;
		}
	}
	return true;
}

optional<Dimension> Rule::first_dimension() const {
	const PatternItem &first = *pattern.front();

	switch (first.type) {
		case PatternItem::RegexType:
		case PatternItem::LiteralSetType:
			return optional<Dimension>();
		case PatternItem::PredicateType:
			return static_cast<const PredicateItem&>(first).dimension();
		case PatternItem::NumericRangeType:
			return Dimension::Numeral;
		default:
			throw UnhandledVariantError("unknown pattern item type in rule \"" + name + "\"");
	}
}

RuleRef make_rule(
	const std::string &name,
	const std::vector<PatternItemRef> &pattern,
	const Production &production) {

	return std::make_shared<const Rule>(name, pattern, production, false);
}

RuleRef make_latent_rule(
	const std::string &name,
	const std::vector<PatternItemRef> &pattern,
	const Production &production) {

	return std::make_shared<const Rule>(name, pattern, production, true);
}

RuleSet::RuleSet(const std::vector<RuleRef> &rules) {
	add(rules);
}

void RuleSet::add(const RuleRef &rule) {
	if (!rule) {
		throw RuleSetError("null rule in rule set");
	}
	if (m_order.find(rule.get()) != m_order.end()) {
		return;
	}
	m_order[rule.get()] = m_rules.size();
	m_rules.push_back(rule);
}

void RuleSet::add(const std::vector<RuleRef> &rules) {
	for (const RuleRef &rule : rules) {
		add(rule);
	}
}

size_t RuleSet::order(const Rule *rule) const {
	const auto i = m_order.find(rule);
	if (i != m_order.end()) {
		return i->second;
	} else {
		return std::numeric_limits<size_t>::max();
	}
}
