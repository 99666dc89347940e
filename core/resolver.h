#ifndef CDUCKLING_RESOLVER_H
#define CDUCKLING_RESOLVER_H

#include "types.h"
#include "rule.h"
#include "pool.h"
#include "options.h"
#include "context.h"
#include "resolve/value.h"

struct ResolvedToken {
	TokenRef token;
	ResolvedValueRef value;

	// position in the pool; the last tie-break.
	size_t insertion;
};

// picks the final, non-overlapping tokens from a pool and converts them
// to caller-facing values.
class Resolver {
private:
	const RuleSet &m_rules;
	const ValueConverters &m_converters;
	const EngineOptions &m_options;

	bool stronger(const ResolvedToken &a, const ResolvedToken &b) const;

	bool compatible(const ResolvedToken &a, const ResolvedToken &b, bool several_dimensions) const;

public:
	Resolver(const RuleSet &rules, const ValueConverters &converters, const EngineOptions &options);

	// tokens of the requested dimensions whose value converts.
	std::vector<ResolvedToken> candidates(const TokenPool &pool, const ResolutionContext &context) const;

	// the surviving candidates, ordered by start offset.
	std::vector<ResolvedToken> select(
		std::vector<ResolvedToken> candidates,
		const DimensionSet &dimensions) const;

	inline std::vector<ResolvedToken> resolve(const TokenPool &pool, const ResolutionContext &context) const {
		return select(candidates(pool, context), context.dimensions);
	}
};

#endif // CDUCKLING_RESOLVER_H
