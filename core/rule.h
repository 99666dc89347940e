#ifndef CDUCKLING_RULE_H
#define CDUCKLING_RULE_H

#include <unordered_map>

#include "types.h"
#include "token.h"
#include "pattern.h"

// the tokens matched by a rule's pattern items, in pattern order. text
// items contribute transient RegexMatch tokens carrying their captures.
class Captures {
private:
	std::vector<TokenRef> m_tokens;

public:
	inline size_t size() const {
		return m_tokens.size();
	}

	inline const Token &operator[](size_t i) const {
		return *m_tokens[i];
	}

	inline const TokenRef &token(size_t i) const {
		return m_tokens[i];
	}

	template<typename T>
	inline const T &get(size_t i) const {
		const T *payload = m_tokens.at(i)->as<T>();
		if (!payload) {
			throw std::runtime_error("capture " + std::to_string(i) + " has an unexpected payload: " +
				m_tokens[i]->payload->debugform());
		}
		return *payload;
	}

	// capture group g of the regex item at position i.
	const std::string &group(size_t i, size_t g = 0) const;

	// mapped value of the literal set item at position i.
	int64_t literal(size_t i) const;

	inline Span span() const {
		return Span{m_tokens.front()->span.begin, m_tokens.back()->span.end};
	}

	inline void push_back(const TokenRef &token) {
		m_tokens.push_back(token);
	}

	inline void pop_back() {
		m_tokens.pop_back();
	}

	inline void reserve(size_t n) {
		m_tokens.reserve(n);
	}
};

// returns the new token's payload, or null to decline the match.
using Production = std::function<PayloadRef(const Captures&)>;

class Rule {
public:
	// for diagnostics only.
	const std::string name;

	const std::vector<PatternItemRef> pattern;
	const Production production;

	// tokens of latent rules are low-confidence candidates, dropped by the
	// resolver whenever a non-latent token overlaps them.
	const bool latent;

	Rule(
		const std::string &name,
		const std::vector<PatternItemRef> &pattern,
		const Production &production,
		bool latent = false);

	inline const PatternItem &item(size_t i) const {
		return *pattern[i];
	}

	inline bool starts_with_text() const {
		return pattern.front()->is_text();
	}

	// a rule without token items depends on the document only, so it can
	// produce nothing new after the first pass.
	bool is_text_only() const;

	// the dimension any token matched by the first item must have, if the
	// first item is a token item.
	optional<Dimension> first_dimension() const;
};

RuleRef make_rule(
	const std::string &name,
	const std::vector<PatternItemRef> &pattern,
	const Production &production);

RuleRef make_latent_rule(
	const std::string &name,
	const std::vector<PatternItemRef> &pattern,
	const Production &production);

// the rules active for one parse, in declaration order.
class RuleSet {
private:
	std::vector<RuleRef> m_rules;
	std::unordered_map<const Rule*, size_t> m_order;

public:
	inline RuleSet() {
	}

	RuleSet(const std::vector<RuleRef> &rules);

	void add(const RuleRef &rule);

	void add(const std::vector<RuleRef> &rules);

	inline size_t size() const {
		return m_rules.size();
	}

	inline bool empty() const {
		return m_rules.empty();
	}

	inline const Rule &operator[](size_t i) const {
		return *m_rules[i];
	}

	inline std::vector<RuleRef>::const_iterator begin() const {
		return m_rules.begin();
	}

	inline std::vector<RuleRef>::const_iterator end() const {
		return m_rules.end();
	}

	// declaration index of a rule; rules from outside this set sort last.
	size_t order(const Rule *rule) const;
};

#endif // CDUCKLING_RULE_H
