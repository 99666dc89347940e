#include "pool.h"

TokenPool::TokenPool(index_t length) : m_length(length), m_by_begin(size_t(length) + 1) {
}

bool TokenPool::insert(const TokenRef &token) {
	const Span &span = token->span;
	if (span.begin < 0 || span.end > m_length || span.begin >= span.end) {
		throw std::out_of_range("token span " + std::to_string(span.begin) + ".." +
			std::to_string(span.end) + " is outside the document");
	}

	const hash_t h = token->hash();
	const auto range = m_index.equal_range(h);
	for (auto i = range.first; i != range.second; i++) {
		if (m_tokens[i->second]->same(*token)) {
			return false;
		}
	}

	m_index.emplace(h, m_tokens.size());
	m_tokens.push_back(token);
	m_by_begin[span.begin].push_back(token);
	return true;
}

bool TokenPool::contains(const Token &token) const {
	return insertion_index(token) < m_tokens.size();
}

std::vector<index_t> TokenPool::starts() const {
	std::vector<index_t> offsets;
	for (index_t i = 0; i < m_length; i++) {
		if (!m_by_begin[i].empty()) {
			offsets.push_back(i);
		}
	}
	return offsets;
}

std::vector<index_t> TokenPool::starts(Dimension dimension) const {
	std::vector<index_t> offsets;
	for (index_t i = 0; i < m_length; i++) {
		for (const TokenRef &token : m_by_begin[i]) {
			if (token->dimension() == dimension) {
				offsets.push_back(i);
				break;
			}
		}
	}
	return offsets;
}
