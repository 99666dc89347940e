#include "driver.h"
#include "matcher.h"
#include "concurrent/parallel.h"

#include <algorithm>
#include <limits>

PassDriver::PassDriver(const RuleSet &rules, const EngineOptions &options, const OutputRef &output) :
	m_rules(rules), m_options(options), m_output(output) {
}

std::vector<index_t> PassDriver::start_offsets(
	const Rule &rule,
	const std::vector<index_t> &text_starts,
	const TokenPool &pool,
	uint16_t pass) const {

	if (rule.starts_with_text()) {
		if (pass > 1 && rule.is_text_only()) {
			// the document did not change, so neither did the matches.
			return std::vector<index_t>();
		}
		return text_starts;
	} else {
		return pool.starts(*rule.first_dimension());
	}
}

ParseStatistics PassDriver::run(const Document &document, TokenPool &pool) const {
	ParseStatistics statistics;

	const size_t n_rules = m_rules.size();

	// each pass that is not the last builds at least one token from
	// tokens of earlier passes, so the number of rules bounds the passes.
	size_t bound = std::min(n_rules, size_t(std::numeric_limits<uint16_t>::max()));
	const bool capped = m_options.max_passes > 0 && m_options.max_passes < bound;
	if (capped) {
		bound = m_options.max_passes;
	}

	// text items never start inside a word, a number or white space.
	std::vector<index_t> text_starts;
	for (index_t offset = 0; offset < document.length(); offset++) {
		if (document.is_valid_start(offset) && !document.is_space(offset)) {
			text_starts.push_back(offset);
		}
	}

	// indexed by thread number. each worker only ever touches its own
	// slot, and scanners keep their caches across passes.
	std::vector<std::unique_ptr<TextScanner>> scanners(Parallel::MaxParallelism);

	const auto scanner = [&scanners, &document] () -> TextScanner& {
		std::unique_ptr<TextScanner> &slot = scanners[Parallel::context().thread_number];
		if (!slot) {
			slot.reset(new TextScanner(document));
		}
		return *slot;
	};

	for (size_t pass = 1; pass <= bound; pass++) {
		std::vector<std::vector<index_t>> offsets(n_rules);
		size_t planned = 0;

		for (size_t i = 0; i < n_rules; i++) {
			offsets[i] = start_offsets(m_rules[i], text_starts, pool, uint16_t(pass));
			planned += offsets[i].size();
		}

		if (m_options.max_invocations > 0 &&
			statistics.invocations + planned > m_options.max_invocations) {

			statistics.exhausted = true;
			message(m_output, "PassDriver", "budget",
				"invocation budget of `1` reached before pass `2`, keeping `3` tokens",
				m_options.max_invocations, pass, pool.size());
			break;
		}

		std::vector<std::vector<TokenRef>> found(n_rules);

		const auto work = [this, &offsets, &found, &document, &pool, &scanner, pass] (size_t i) {
			if (offsets[i].empty()) {
				return;
			}

			const MatchContext context{document, pool, scanner(), m_options, uint16_t(pass)};
			Matcher matcher(context, m_rules[i], found[i]);

			for (index_t offset : offsets[i]) {
				matcher(offset);
			}
		};

		if (m_options.parallel) {
			parallelize(work, n_rules);
		} else {
			for (size_t i = 0; i < n_rules; i++) {
				work(i);
			}
		}

		statistics.invocations += planned;
		statistics.passes = pass;

		size_t added = 0;
		for (const std::vector<TokenRef> &tokens : found) {
			for (const TokenRef &token : tokens) {
				if (pool.insert(token)) {
					added++;
				}
			}
		}

		if (m_options.trace) {
			message(m_output, "PassDriver", "pass",
				"pass `1` tried `2` offsets and added `3` tokens",
				pass, planned, added);
		}

		if (added == 0) {
			break;
		}

		if (capped && pass == bound) {
			statistics.exhausted = true;
			message(m_output, "PassDriver", "budget",
				"pass budget of `1` reached, keeping `2` tokens",
				bound, pool.size());
		}
	}

	statistics.tokens = pool.size();
	return statistics;
}
