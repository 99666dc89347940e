#include "engine.h"
#include "document.h"
#include "pool.h"
#include "resolver.h"
#include "resolve/time.h"

Engine::Engine(
	const std::shared_ptr<const RuleRegistry> &registry,
	const EngineOptions &options,
	const OutputRef &output,
	const ValueConverters &converters) :

	m_registry(registry),
	m_converters(converters),
	m_options(options),
	m_output(output ? output : std::make_shared<NoOutput>()) {

	if (!m_registry) {
		throw std::invalid_argument("engine without rule registry");
	}
}

ParseResult Engine::parse(const std::string &text, const ResolutionContext &context) const {
	const Document document(text);
	check_timezone(context.timezone);

	const std::string locale = m_registry->resolve_locale(context.locale);
	const RuleSet rules = m_registry->rules(locale, m_registry->closure(context.dimensions));

	TokenPool pool(document.length());

	ParseResult result;
	result.statistics = PassDriver(rules, m_options, m_output).run(document, pool);

	const Resolver resolver(rules, m_converters, m_options);

	for (const ResolvedToken &resolved : resolver.resolve(pool, context)) {
		const Token &token = *resolved.token;

		Entity entity;
		entity.span = Span{
			document.code_points_before(token.span.begin),
			document.code_points_before(token.span.end)};
		entity.dimension = token.dimension();
		entity.value = resolved.value;
		entity.text = document.utf8(token.span);
		entity.latent = token.latent;
		entity.rule = token.rule ? token.rule->name : std::string();

		result.entities.push_back(std::move(entity));
	}

	return result;
}
