#ifndef CDUCKLING_POOL_H
#define CDUCKLING_POOL_H

#include <unordered_map>

#include "types.h"
#include "token.h"

// all tokens discovered so far for one document, indexed by start
// offset. the pool only grows; inserting a token that is already present
// (same span, dimension and payload) does nothing.
class TokenPool {
private:
	const index_t m_length;
	std::vector<TokenRef> m_tokens;
	std::vector<std::vector<TokenRef>> m_by_begin;
	std::unordered_multimap<hash_t, size_t> m_index;

public:
	explicit TokenPool(index_t length);

	// returns false if an identical token is already present.
	bool insert(const TokenRef &token);

	bool contains(const Token &token) const;

	inline size_t size() const {
		return m_tokens.size();
	}

	inline index_t length() const {
		return m_length;
	}

	// in insertion order.
	inline const std::vector<TokenRef> &tokens() const {
		return m_tokens;
	}

	inline const std::vector<TokenRef> &starting_at(index_t offset) const {
		return m_by_begin[offset];
	}

	// offsets at which at least one token starts, in ascending order.
	std::vector<index_t> starts() const;

	// same as starts(), restricted to tokens of the given dimension.
	std::vector<index_t> starts(Dimension dimension) const;

	inline size_t insertion_index(const Token &token) const {
		const hash_t h = token.hash();
		const auto range = m_index.equal_range(h);
		for (auto i = range.first; i != range.second; i++) {
			if (m_tokens[i->second]->same(token)) {
				return i->second;
			}
		}
		return m_tokens.size();
	}
};

#endif // CDUCKLING_POOL_H
