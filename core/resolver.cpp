#include "resolver.h"

#include <algorithm>

Resolver::Resolver(const RuleSet &rules, const ValueConverters &converters, const EngineOptions &options) :
	m_rules(rules), m_converters(converters), m_options(options) {
}

std::vector<ResolvedToken> Resolver::candidates(const TokenPool &pool, const ResolutionContext &context) const {
	std::vector<ResolvedToken> candidates;

	const std::vector<TokenRef> &tokens = pool.tokens();
	for (size_t i = 0; i < tokens.size(); i++) {
		const TokenRef &token = tokens[i];

		if (!context.dimensions.empty() && !context.dimensions.contains(token->dimension())) {
			continue;
		}

		ResolvedValueRef value = m_converters.convert(*token, context, m_options);
		if (value) {
			candidates.push_back(ResolvedToken{token, std::move(value), i});
		}
	}

	return candidates;
}

bool Resolver::stronger(const ResolvedToken &a, const ResolvedToken &b) const {
	const Token &x = *a.token;
	const Token &y = *b.token;

	if (x.span.length() != y.span.length()) {
		return x.span.length() > y.span.length();
	}
	if (x.latent != y.latent) {
		return !x.latent;
	}
	if (x.span.begin != y.span.begin) {
		return x.span.begin < y.span.begin;
	}

	const size_t rx = m_rules.order(x.rule);
	const size_t ry = m_rules.order(y.rule);
	if (rx != ry) {
		switch (m_options.tie_break) {
			case TieBreak::DeclarationOrder:
				return rx < ry;
			case TieBreak::ReverseDeclarationOrder:
				return rx > ry;
			default:
				throw UnhandledVariantError("unknown tie break");
		}
	}

	return a.insertion < b.insertion;
}

bool Resolver::compatible(const ResolvedToken &a, const ResolvedToken &b, bool several_dimensions) const {
	const Span &x = a.token->span;
	const Span &y = b.token->span;

	if (!x.overlaps(y)) {
		return true;
	}
	if (!several_dimensions || a.token->dimension() == b.token->dimension()) {
		return false;
	}
	if (x == y) {
		return true;
	}
	// a token inside another one never survives, whatever its dimension.
	return m_options.cross_dimension_overlap && !x.contains(y) && !y.contains(x);
}

std::vector<ResolvedToken> Resolver::select(
	std::vector<ResolvedToken> candidates,
	const DimensionSet &dimensions) const {

	const bool several_dimensions = dimensions.empty() || dimensions.size() > 1;

	// latent tokens only count where nothing else was found.
	std::vector<ResolvedToken> eligible;
	eligible.reserve(candidates.size());

	for (const ResolvedToken &candidate : candidates) {
		if (candidate.token->latent) {
			if (!m_options.with_latent) {
				continue;
			}
			const bool covered = std::any_of(candidates.begin(), candidates.end(),
				[&candidate] (const ResolvedToken &other) {
					return !other.token->latent && other.token->span.overlaps(candidate.token->span);
				});
			if (covered) {
				continue;
			}
		}
		eligible.push_back(candidate);
	}

	std::sort(eligible.begin(), eligible.end(), [this] (const ResolvedToken &a, const ResolvedToken &b) {
		return stronger(a, b);
	});

	std::vector<ResolvedToken> selected;
	for (const ResolvedToken &candidate : eligible) {
		const bool fits = std::all_of(selected.begin(), selected.end(),
			[this, &candidate, several_dimensions] (const ResolvedToken &kept) {
				return compatible(candidate, kept, several_dimensions);
			});
		if (fits) {
			selected.push_back(candidate);
		}
	}

	std::sort(selected.begin(), selected.end(), [] (const ResolvedToken &a, const ResolvedToken &b) {
		const Span &x = a.token->span;
		const Span &y = b.token->span;
		if (x.begin != y.begin) {
			return x.begin < y.begin;
		} else if (x.end != y.end) {
			return x.end < y.end;
		} else {
			return a.token->dimension() < b.token->dimension();
		}
	});

	return selected;
}
