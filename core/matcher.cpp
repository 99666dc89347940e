#include "matcher.h"

Matcher::Matcher(const MatchContext &context, const Rule &rule, std::vector<TokenRef> &out) :
	m_context(context), m_rule(rule), m_offset(0), m_out(out) {

	m_captures.reserve(rule.pattern.size());
}

size_t Matcher::operator()(index_t offset) {
	const size_t before = m_out.size();
	m_offset = offset;
	match_item(0, offset);
	return m_out.size() - before;
}

void Matcher::match_item(size_t index, index_t position) {
	if (index == m_rule.pattern.size()) {
		produce();
		return;
	}

	switch (m_rule.item(index).type) {
		case PatternItem::RegexType:
		case PatternItem::LiteralSetType:
			positions(index, position, [this, index] (index_t p) {
				match_text(index, p);
			});
			break;

		case PatternItem::PredicateType:
		case PatternItem::NumericRangeType:
			positions(index, position, [this, index] (index_t p) {
				match_token(index, p);
			});
			break;

		default:
			throw UnhandledVariantError("unknown pattern item type in rule \"" + m_rule.name + "\"");
	}
}

void Matcher::match_text(size_t index, index_t position) {
	if (position >= m_context.document.length()) {
		return;
	}

	const TextPatternItem &item = static_cast<const TextPatternItem&>(m_rule.item(index));
	const optional<TextMatch> &match = m_context.scanner.match(item, position);

	if (match) {
		m_captures.push_back(std::make_shared<const Token>(match->span, match->payload));
		match_item(index + 1, match->span.end);
		m_captures.pop_back();
	}
}

void Matcher::match_token(size_t index, index_t position) {
	if (position >= m_context.pool.length()) {
		return;
	}

	const TokenPatternItem &item = static_cast<const TokenPatternItem&>(m_rule.item(index));

	for (const TokenRef &token : m_context.pool.starting_at(position)) {
		if (item.accepts(*token)) {
			m_captures.push_back(token);
			match_item(index + 1, token->span.end);
			m_captures.pop_back();
		}
	}
}

void Matcher::produce() {
	PayloadRef payload = m_rule.production(m_captures);

	if (!payload) {
		return; // declined
	}

	if (payload->dimension() == Dimension::RegexMatch) {
		throw std::logic_error("rule \"" + m_rule.name + "\" produced a regex match payload");
	}

	const Span span{m_offset, m_captures.span().end};

	m_out.push_back(std::make_shared<const Token>(
		span, std::move(payload), &m_rule, m_context.pass, m_rule.latent));
}
