// @formatter:off

#include "doctest.h"

#include "core/document.h"
#include "core/pattern.h"
#include "core/payloads/numeral.h"
#include "core/payloads/text.h"

TEST_CASE("document normalization") {
	// "e" followed by a combining acute accent composes to one code unit.
	const Document document("caf\x65\xcc\x81 au lait");
	CHECK(document.length() == 12);
	CHECK(document.utf8(Span{0, 4}) == "caf\xc3\xa9");

	CHECK_THROWS_AS(Document("\xff\xfe"), MalformedTextError);
}

TEST_CASE("document class boundaries") {
	const Document document("twenty 100k");

	CHECK(document.is_valid_range(0, 6));
	CHECK_FALSE(document.is_valid_range(4, 6)); // "ty" inside "twenty"
	CHECK(document.is_valid_range(7, 10)); // "100" before "k"
	CHECK_FALSE(document.is_valid_range(7, 9));
	CHECK(document.is_space(6));
	CHECK(document.skip_spaces(6) == 7);
	CHECK(document.is_space_run(6, 7));
	CHECK_FALSE(document.is_space_run(6, 8));
}

TEST_CASE("code points") {
	// U+1F600 takes two UTF-16 code units.
	const Document document("\xf0\x9f\x98\x80 five");
	CHECK(document.length() == 7);
	CHECK(document.code_points_before(3) == 2);
}

TEST_CASE("regex item") {
	const Document document("minus 5");
	TextScanner scanner(document);

	const PatternItemRef item = regex_item("minus\\s?");
	const TextPatternItem &text = static_cast<const TextPatternItem&>(*item);

	const optional<TextMatch> &match = scanner.match(text, 0);
	REQUIRE(bool(match));
	CHECK(match->span == (Span{0, 6}));
	CHECK(match->payload->as<GroupMatchData>()->groups[0] == "minus ");

	CHECK_FALSE(bool(scanner.match(text, 6)));

	// cached.
	const size_t evaluations = scanner.evaluations();
	scanner.match(text, 0);
	CHECK(scanner.evaluations() == evaluations);
}

TEST_CASE("regex item groups") {
	const Document document("12:45");
	TextScanner scanner(document);

	const PatternItemRef item = regex_item("(\\d+):(\\d+)(x)?");
	const optional<TextMatch> &match = scanner.match(static_cast<const TextPatternItem&>(*item), 0);

	REQUIRE(bool(match));
	const std::vector<std::string> &groups = match->payload->as<GroupMatchData>()->groups;
	REQUIRE(groups.size() == 3);
	CHECK(groups[0] == "12");
	CHECK(groups[1] == "45");
	CHECK(groups[2] == "");
}

TEST_CASE("regex item bounds") {
	const Document document("minus 5");
	TextScanner scanner(document);

	// look-behind sees the text before the offset.
	const PatternItemRef behind = regex_item("(?<=minus )5");
	CHECK(bool(scanner.match(static_cast<const TextPatternItem&>(*behind), 6)));

	// ^ still means the start of the document.
	const PatternItemRef anchored = regex_item("^5");
	CHECK_FALSE(bool(scanner.match(static_cast<const TextPatternItem&>(*anchored), 6)));

	const PatternItemRef plain = regex_item("\\d");
	const optional<TextMatch> &digit = scanner.match(static_cast<const TextPatternItem&>(*plain), 6);
	REQUIRE(bool(digit));
	CHECK(digit->payload->as<GroupMatchData>()->groups.size() == 1);
	CHECK(digit->payload->as<GroupMatchData>()->groups[0] == "5");
}

TEST_CASE("regex item rejects partial words") {
	const Document document("twenty");
	TextScanner scanner(document);

	const PatternItemRef item = regex_item("twen");
	CHECK_FALSE(bool(scanner.match(static_cast<const TextPatternItem&>(*item), 0)));
}

TEST_CASE("malformed regex") {
	CHECK_THROWS_AS(regex_item("(unclosed"), RuleSetError);
}

TEST_CASE("literal set") {
	const Document document("Seventeen");
	TextScanner scanner(document);

	const PatternItemRef item = literal_set({{"seven", 7}, {"seventeen", 17}});
	const optional<TextMatch> &match = scanner.match(static_cast<const TextPatternItem&>(*item), 0);

	REQUIRE(bool(match));
	CHECK(match->span == (Span{0, 9}));
	CHECK(match->payload->as<LiteralData>()->value == 17);

	CHECK_THROWS_AS(literal_set({}), RuleSetError);
}

TEST_CASE("token items") {
	const Token five(Span{0, 1}, std::make_shared<const NumeralData>(5));
	const Token twelve(Span{0, 2}, std::make_shared<const NumeralData>(12));

	const PatternItemRef range = numeric_range(1, 10);
	const TokenPatternItem &numeric = static_cast<const TokenPatternItem&>(*range);
	CHECK(numeric.accepts(five));
	CHECK_FALSE(numeric.accepts(twelve));
	CHECK_FALSE(range->is_text());

	const PatternItemRef even = predicate_item(Dimension::Numeral, [] (const Payload &payload) {
		return payload.as<NumeralData>()->value.get_num() % 2 == 0;
	}, "even");
	CHECK(static_cast<const TokenPatternItem&>(*even).accepts(twelve));
	CHECK_FALSE(static_cast<const TokenPatternItem&>(*even).accepts(five));

	const PatternItemRef ordinal = dimension_item(Dimension::Ordinal);
	CHECK_FALSE(static_cast<const TokenPatternItem&>(*ordinal).accepts(five));

	CHECK_THROWS_AS(numeric_range(5, 5), RuleSetError);
}
