#ifndef CDUCKLING_MATCHER_H
#define CDUCKLING_MATCHER_H

#include "types.h"
#include "rule.h"
#include "pool.h"
#include "options.h"
#include "document.h"

// everything one worker needs to try rules during a pass. the pool is
// the snapshot from before the pass and is only read.
struct MatchContext {
	const Document &document;
	const TokenPool &pool;
	TextScanner &scanner;
	const EngineOptions &options;
	const uint16_t pass;
};

// tries one rule at one start offset. every way of satisfying the pattern
// items in sequence is explored (several pool tokens may start at the
// same offset), and each complete match is handed to the production.
class Matcher {
private:
	const MatchContext &m_context;
	const Rule &m_rule;
	index_t m_offset;
	Captures m_captures;
	std::vector<TokenRef> &m_out;

	void match_item(size_t index, index_t position);

	void match_text(size_t index, index_t position);

	void match_token(size_t index, index_t position);

	void produce();

	template<typename F>
	inline void positions(size_t index, index_t position, const F &f) const {
		f(position);

		if (index > 0 && m_context.options.adjacency == Adjacency::Whitespace) {
			const index_t skipped = m_context.document.skip_spaces(position);
			if (skipped != position) {
				f(skipped);
			}
		}
	}

public:
	Matcher(const MatchContext &context, const Rule &rule, std::vector<TokenRef> &out);

	// appends the tokens produced at offset to the output vector and
	// returns their number. the output may contain duplicates; the pool
	// collapses them on insertion.
	size_t operator()(index_t offset);
};

#endif // CDUCKLING_MATCHER_H
