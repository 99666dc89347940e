#ifndef CDUCKLING_ENGINE_H
#define CDUCKLING_ENGINE_H

#include "types.h"
#include "registry.h"
#include "options.h"
#include "output.h"
#include "context.h"
#include "driver.h"
#include "resolve/value.h"

// one resolved span of a parse response. span offsets count code points
// of the NFC-normalized text.
struct Entity {
	Span span;
	Dimension dimension;
	ResolvedValueRef value;
	std::string text;
	bool latent;

	// name of the rule that produced the token, for diagnostics.
	std::string rule;
};

struct ParseResult {
	std::vector<Entity> entities;
	ParseStatistics statistics;
};

// parses documents against a registry of rules. an engine never changes
// after construction, so one engine may serve parses from many threads.
class Engine {
private:
	const std::shared_ptr<const RuleRegistry> m_registry;
	const ValueConverters m_converters;
	const EngineOptions m_options;
	const OutputRef m_output;

public:
	Engine(
		const std::shared_ptr<const RuleRegistry> &registry,
		const EngineOptions &options = EngineOptions(),
		const OutputRef &output = OutputRef(),
		const ValueConverters &converters = ValueConverters::defaults());

	inline const EngineOptions &options() const {
		return m_options;
	}

	inline const RuleRegistry &registry() const {
		return *m_registry;
	}

	// throws MalformedTextError for text that is not UTF-8 and
	// UnknownLocaleError if no rules serve the context's locale.
	ParseResult parse(const std::string &text, const ResolutionContext &context) const;
};

#endif // CDUCKLING_ENGINE_H
