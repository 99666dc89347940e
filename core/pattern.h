// @formatter:off

#ifndef CDUCKLING_PATTERN_H
#define CDUCKLING_PATTERN_H

#include <unordered_map>
#include <gmpxx.h>

#include "unicode/regex.h"
#include "unicode/unistr.h"

#include "types.h"
#include "hash.h"
#include "token.h"

class TextScanner;

struct TextMatch {
	Span span;
	PayloadRef payload;
};

// one atomic matcher in a rule's sequence. text items (regex, literal
// set) match a slice of the document, token items (predicate, numeric
// range) match a single token already in the pool.
class PatternItem {
public:
	enum Type {
		RegexType,
		LiteralSetType,
		PredicateType,
		NumericRangeType
	};

	const Type type;

	inline PatternItem(Type type_) : type(type_) {
	}

	virtual ~PatternItem() {
	}

	inline bool is_text() const {
		switch (type) {
			case RegexType:
			case LiteralSetType:
				return true;
			case PredicateType:
			case NumericRangeType:
				return false;
			default:
				throw UnhandledVariantError("unknown pattern item type");
		}
	}

	virtual std::string name() const = 0;
};

class TextPatternItem : public PatternItem {
public:
	using PatternItem::PatternItem;

	// attempts a match starting exactly at offset.
	virtual optional<TextMatch> match(
		const Document &document,
		index_t offset,
		TextScanner &scanner) const = 0;
};

class TokenPatternItem : public PatternItem {
public:
	using PatternItem::PatternItem;

	virtual bool accepts(const Token &token) const = 0;
};

class RegexItem : public TextPatternItem {
private:
	const std::string m_source;
	std::unique_ptr<icu::RegexPattern> m_pattern;
	int32_t m_groups;

public:
	RegexItem(const std::string &source, uint32_t flags);

	inline const icu::RegexPattern &pattern() const {
		return *m_pattern;
	}

	virtual optional<TextMatch> match(
		const Document &document,
		index_t offset,
		TextScanner &scanner) const;

	virtual std::string name() const;
};

class LiteralSetItem : public TextPatternItem {
private:
	// longest forms first, so "seventeen" wins over "seven".
	std::vector<std::pair<icu::UnicodeString, int64_t>> m_literals;

public:
	LiteralSetItem(const std::vector<std::pair<std::string, int64_t>> &literals);

	virtual optional<TextMatch> match(
		const Document &document,
		index_t offset,
		TextScanner &scanner) const;

	virtual std::string name() const;
};

using PayloadPredicate = std::function<bool(const Payload&)>;

class PredicateItem : public TokenPatternItem {
private:
	const Dimension m_dimension;
	const PayloadPredicate m_predicate;
	const std::string m_name;

public:
	inline PredicateItem(
		Dimension dimension,
		const PayloadPredicate &predicate,
		const std::string &name) :

		TokenPatternItem(PredicateType),
		m_dimension(dimension),
		m_predicate(predicate),
		m_name(name) {
	}

	inline Dimension dimension() const {
		return m_dimension;
	}

	virtual bool accepts(const Token &token) const {
		return token.dimension() == m_dimension && (!m_predicate || m_predicate(*token.payload));
	}

	virtual std::string name() const;
};

// a numeral token with low <= value < high.
class NumericRangeItem : public TokenPatternItem {
private:
	const mpq_class m_low;
	const mpq_class m_high;

public:
	NumericRangeItem(const mpq_class &low, const mpq_class &high);

	virtual bool accepts(const Token &token) const;

	virtual std::string name() const;
};

// per-worker scratch state for text items: one ICU matcher per regex
// item (RegexMatcher is not thread safe) and a cache, so each text item
// runs at most once per offset in a parse.
class TextScanner {
private:
	struct Key {
		const PatternItem *item;
		index_t offset;

		inline bool operator==(const Key &key) const {
			return item == key.item && offset == key.offset;
		}
	};

	struct KeyHash {
		inline size_t operator()(const Key &key) const {
			return hash_pair(std::hash<const void*>()(key.item), hash_t(key.offset));
		}
	};

	const Document &m_document;
	std::unordered_map<const RegexItem*, std::unique_ptr<icu::RegexMatcher>> m_matchers;
	std::unordered_map<Key, optional<TextMatch>, KeyHash> m_cache;
	size_t m_evaluations;

public:
	inline TextScanner(const Document &document) : m_document(document), m_evaluations(0) {
	}

	inline const Document &document() const {
		return m_document;
	}

	icu::RegexMatcher &matcher(const RegexItem &item);

	const optional<TextMatch> &match(const TextPatternItem &item, index_t offset);

	// number of actual (uncached) text item evaluations so far.
	inline size_t evaluations() const {
		return m_evaluations;
	}
};

PatternItemRef regex_item(const std::string &source, uint32_t flags = UREGEX_CASE_INSENSITIVE);

PatternItemRef literal_set(const std::vector<std::pair<std::string, int64_t>> &literals);

PatternItemRef dimension_item(Dimension dimension);

PatternItemRef predicate_item(Dimension dimension, const PayloadPredicate &predicate, const std::string &name);

PatternItemRef numeric_range(const mpq_class &low, const mpq_class &high);

#endif // CDUCKLING_PATTERN_H
