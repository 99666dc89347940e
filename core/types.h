// @formatter:off

#ifndef CDUCKLING_TYPES_H
#define CDUCKLING_TYPES_H

#include <string>
#include <stdint.h>
#include <functional>
#include <vector>
#include <memory>
#include <bitset>
#include <stdexcept>

#include <experimental/optional>

using std::experimental::optional;
using std::experimental::nullopt;

// offsets into a document are UTF-16 code unit indices, as used by ICU.
typedef int32_t index_t;

enum class Dimension : uint16_t {
	Numeral,
	Ordinal,
	Time,
	TimeGrain,
	Duration,
	Distance,
	Temperature,
	Volume,
	Quantity,
	Finance,
	PhoneNumber,
	Email,
	Url,
	RegexMatch,

	// dimensions registered at runtime are numbered from here.
	FirstExtension = 32
};

constexpr size_t MaxDimensions = 128;

const char *dimension_name(Dimension dimension);

optional<Dimension> dimension_from_name(const std::string &name);

Dimension register_dimension(const std::string &name);

class DimensionSet {
private:
	std::bitset<MaxDimensions> m_bits;

public:
	inline DimensionSet() {
	}

	inline DimensionSet(std::initializer_list<Dimension> dimensions) {
		for (Dimension d : dimensions) {
			insert(d);
		}
	}

	inline void insert(Dimension d) {
		m_bits.set(size_t(d));
	}

	inline void insert(const DimensionSet &set) {
		m_bits |= set.m_bits;
	}

	inline bool contains(Dimension d) const {
		return m_bits.test(size_t(d));
	}

	inline bool empty() const {
		return m_bits.none();
	}

	inline size_t size() const {
		return m_bits.count();
	}

	inline bool operator==(const DimensionSet &set) const {
		return m_bits == set.m_bits;
	}

	template<typename F>
	inline void each(const F &f) const {
		for (size_t i = 0; i < MaxDimensions; i++) {
			if (m_bits.test(i)) {
				f(Dimension(i));
			}
		}
	}
};

struct Span {
	index_t begin;
	index_t end;

	inline index_t length() const {
		return end - begin;
	}

	inline bool contains(const Span &span) const {
		return begin <= span.begin && span.end <= end;
	}

	inline bool overlaps(const Span &span) const {
		return begin < span.end && span.begin < end;
	}

	inline bool operator==(const Span &span) const {
		return begin == span.begin && end == span.end;
	}

	inline bool operator!=(const Span &span) const {
		return !(*this == span);
	}
};

class RuleSetError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class MalformedTextError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class OptionsError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class UnknownLocaleError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class UnhandledVariantError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class Payload;
class Token;
class PatternItem;
class Rule;
class RuleSet;
class Document;
class TokenPool;

using PayloadRef = std::shared_ptr<const Payload>;
using TokenRef = std::shared_ptr<const Token>;
using PatternItemRef = std::shared_ptr<const PatternItem>;
using RuleRef = std::shared_ptr<const Rule>;

#endif // CDUCKLING_TYPES_H
