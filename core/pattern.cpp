#include "pattern.h"
#include "document.h"
#include "payloads/numeral.h"
#include "payloads/text.h"

#include <algorithm>
#include <sstream>

#include "unicode/normalizer2.h"
#include "unicode/parseerr.h"

namespace {

icu::UnicodeString normalized_literal(const std::string &utf8) {
	UErrorCode status = U_ZERO_ERROR;

	const icu::Normalizer2 *norm = icu::Normalizer2::getNFCInstance(status);
	check_status(status, "Normalizer2::getNFCInstance failed");

	icu::UnicodeString normalized = norm->normalize(
		icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), int32_t(utf8.size()))), status);
	check_status(status, "Normalizer2::normalize failed");

	return normalized;
}

std::string group_text(icu::RegexMatcher &matcher, int32_t group) {
	UErrorCode status = U_ZERO_ERROR;

	// groups that did not participate in the match report start -1.
	if (matcher.start(group, status) < 0) {
		check_status(status, "RegexMatcher::start failed");
		return std::string();
	}
	check_status(status, "RegexMatcher::start failed");

	const icu::UnicodeString text = matcher.group(group, status);
	check_status(status, "RegexMatcher::group failed");

	std::string s;
	text.toUTF8String(s);
	return s;
}

} // namespace

RegexItem::RegexItem(const std::string &source, uint32_t flags) :
	TextPatternItem(RegexType), m_source(source), m_groups(0) {

	UErrorCode status = U_ZERO_ERROR;
	UParseError error;

	m_pattern.reset(icu::RegexPattern::compile(
		icu::UnicodeString::fromUTF8(icu::StringPiece(source.data(), int32_t(source.size()))),
		flags, error, status));

	if (U_FAILURE(status) || !m_pattern) {
		std::ostringstream s;
		s << "regex /" << source << "/ does not compile (" << u_errorName(status);
		s << " at offset " << error.offset << ")";
		throw RuleSetError(s.str());
	}

	std::unique_ptr<icu::RegexMatcher> matcher(m_pattern->matcher(status));
	check_status(status, "RegexPattern::matcher failed");
	m_groups = matcher->groupCount();
}

optional<TextMatch> RegexItem::match(
	const Document &document,
	index_t offset,
	TextScanner &scanner) const {

	icu::RegexMatcher &matcher = scanner.matcher(*this);

	UErrorCode status = U_ZERO_ERROR;
	matcher.region(offset, document.length(), status);
	check_status(status, "RegexMatcher::region failed");

	// look-arounds may see outside the region, while ^ and $ keep
	// referring to the start and end of the document.
	matcher.useTransparentBounds(true);
	matcher.useAnchoringBounds(false);

	const bool found = matcher.lookingAt(status);
	check_status(status, "RegexMatcher::lookingAt failed");
	if (!found) {
		return optional<TextMatch>();
	}

	const index_t begin = matcher.start(status);
	const index_t end = matcher.end(status);
	check_status(status, "RegexMatcher::end failed");

	if (end <= begin || !document.is_valid_range(begin, end)) {
		return optional<TextMatch>();
	}

	std::vector<std::string> groups;
	if (m_groups == 0) {
		groups.push_back(group_text(matcher, 0));
	} else {
		groups.reserve(m_groups);
		for (int32_t i = 1; i <= m_groups; i++) {
			groups.push_back(group_text(matcher, i));
		}
	}

	return TextMatch{Span{begin, end}, make_payload<GroupMatchData>(std::move(groups))};
}

std::string RegexItem::name() const {
	return "regex /" + m_source + "/";
}

LiteralSetItem::LiteralSetItem(const std::vector<std::pair<std::string, int64_t>> &literals) :
	TextPatternItem(LiteralSetType) {

	if (literals.empty()) {
		throw RuleSetError("literal set without literals");
	}

	for (const auto &literal : literals) {
		if (literal.first.empty()) {
			throw RuleSetError("literal set with an empty literal");
		}
		m_literals.emplace_back(normalized_literal(literal.first), literal.second);
	}

	std::stable_sort(m_literals.begin(), m_literals.end(), [] (const auto &a, const auto &b) {
		return a.first.length() > b.first.length();
	});
}

optional<TextMatch> LiteralSetItem::match(
	const Document &document,
	index_t offset,
	TextScanner &scanner) const {

	const icu::UnicodeString &text = document.unicode();

	for (const auto &literal : m_literals) {
		const index_t end = offset + literal.first.length();
		if (end > document.length()) {
			continue;
		}
		if (text.caseCompare(offset, literal.first.length(), literal.first, U_FOLD_CASE_DEFAULT) != 0) {
			continue;
		}
		if (!document.is_valid_range(offset, end)) {
			continue;
		}

		const Span span{offset, end};
		return TextMatch{span, make_payload<LiteralData>(document.utf8(span), literal.second)};
	}

	return optional<TextMatch>();
}

std::string LiteralSetItem::name() const {
	std::ostringstream s;
	s << "literals {";
	for (size_t i = 0; i < m_literals.size(); i++) {
		if (i > 0) {
			s << ", ";
		}
		std::string form;
		m_literals[i].first.toUTF8String(form);
		s << form;
	}
	s << "}";
	return s.str();
}

std::string PredicateItem::name() const {
	return std::string(dimension_name(m_dimension)) + (m_name.empty() ? "" : " " + m_name);
}

NumericRangeItem::NumericRangeItem(const mpq_class &low, const mpq_class &high) :
	TokenPatternItem(NumericRangeType), m_low(low), m_high(high) {

	if (!(low < high)) {
		throw RuleSetError("numeric range " + low.get_str() + ".." + high.get_str() + " is empty");
	}
}

bool NumericRangeItem::accepts(const Token &token) const {
	const NumeralData *numeral = token.as<NumeralData>();
	return numeral && m_low <= numeral->value && numeral->value < m_high;
}

std::string NumericRangeItem::name() const {
	return "number between " + m_low.get_str() + " and " + m_high.get_str();
}

icu::RegexMatcher &TextScanner::matcher(const RegexItem &item) {
	auto i = m_matchers.find(&item);
	if (i != m_matchers.end()) {
		return *i->second;
	}

	UErrorCode status = U_ZERO_ERROR;
	std::unique_ptr<icu::RegexMatcher> matcher(item.pattern().matcher(m_document.unicode(), status));
	check_status(status, "RegexPattern::matcher failed");

	icu::RegexMatcher &ref = *matcher;
	m_matchers.emplace(&item, std::move(matcher));
	return ref;
}

const optional<TextMatch> &TextScanner::match(const TextPatternItem &item, index_t offset) {
	const Key key{&item, offset};

	auto i = m_cache.find(key);
	if (i != m_cache.end()) {
		return i->second;
	}

	m_evaluations++;
	return m_cache.emplace(key, item.match(m_document, offset, *this)).first->second;
}

PatternItemRef regex_item(const std::string &source, uint32_t flags) {
	return std::make_shared<const RegexItem>(source, flags);
}

PatternItemRef literal_set(const std::vector<std::pair<std::string, int64_t>> &literals) {
	return std::make_shared<const LiteralSetItem>(literals);
}

PatternItemRef dimension_item(Dimension dimension) {
	return std::make_shared<const PredicateItem>(dimension, PayloadPredicate(), std::string());
}

PatternItemRef predicate_item(Dimension dimension, const PayloadPredicate &predicate, const std::string &name) {
	return std::make_shared<const PredicateItem>(dimension, predicate, name);
}

PatternItemRef numeric_range(const mpq_class &low, const mpq_class &high) {
	return std::make_shared<const NumericRangeItem>(low, high);
}
