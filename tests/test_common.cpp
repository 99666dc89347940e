#include "doctest.h"

#include "support.h"

namespace {

std::vector<std::string> texts(const std::vector<Entity> &entities) {
	std::vector<std::string> values;
	for (const Entity &entity : entities) {
		values.push_back(entity.value->as<TextValue>()->value);
	}
	return values;
}

} // namespace

TEST_CASE("emails") {
	const std::vector<Entity> entities = parse("contact alice.smith@example.com today", {Dimension::Email});
	CHECK(texts(entities) == std::vector<std::string>{"alice.smith@example.com"});
	REQUIRE(entities.size() == 1);
	CHECK(entities[0].span.begin == 8);
	CHECK(entities[0].span.end == 31);

	// common rules serve every locale.
	CHECK(texts(parse("ola@nordmann.no", {Dimension::Email}, "nb")) ==
		std::vector<std::string>{"ola@nordmann.no"});

	CHECK(parse("no at sign here", {Dimension::Email}).empty());
}

TEST_CASE("urls") {
	CHECK(texts(parse("visit www.example.com/path?q=1 now", {Dimension::Url})) ==
		std::vector<std::string>{"www.example.com/path?q=1"});
	CHECK(texts(parse("https://duckling.org", {Dimension::Url})) ==
		std::vector<std::string>{"https://duckling.org"});
}

TEST_CASE("phone numbers") {
	CHECK(texts(parse("call +33 1 46647998 now", {Dimension::PhoneNumber})) ==
		std::vector<std::string>{"(+33) 146647998"});
	CHECK(texts(parse("650-701-8887", {Dimension::PhoneNumber})) ==
		std::vector<std::string>{"6507018887"});

	// too few digits for a phone number.
	CHECK(parse("room 12", {Dimension::PhoneNumber}).empty());
}
