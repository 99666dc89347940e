#ifndef CDUCKLING_DRIVER_H
#define CDUCKLING_DRIVER_H

#include "types.h"
#include "rule.h"
#include "pool.h"
#include "options.h"
#include "output.h"
#include "document.h"

struct ParseStatistics {
	size_t passes = 0;

	// (rule, offset) attempts over all passes.
	size_t invocations = 0;

	size_t tokens = 0;

	// true if max_passes or max_invocations cut the parse short.
	bool exhausted = false;
};

// runs passes of all rules over a document until no pass adds a token.
// each pass reads the pool as it was before the pass; the tokens found
// are inserted after the pass in rule order, so the resulting pool does
// not depend on how the work was scheduled.
class PassDriver {
private:
	const RuleSet &m_rules;
	const EngineOptions &m_options;
	const OutputRef m_output;

	// the offsets at which a rule is tried in the given pass.
	std::vector<index_t> start_offsets(
		const Rule &rule,
		const std::vector<index_t> &text_starts,
		const TokenPool &pool,
		uint16_t pass) const;

public:
	PassDriver(const RuleSet &rules, const EngineOptions &options, const OutputRef &output);

	ParseStatistics run(const Document &document, TokenPool &pool) const;
};

#endif // CDUCKLING_DRIVER_H
