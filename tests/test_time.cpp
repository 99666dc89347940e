#include "doctest.h"

#include "support.h"
#include "core/resolve/time.h"

namespace {

std::shared_ptr<const TimeValue> time_of(
	const std::string &text,
	const EngineOptions &options = EngineOptions()) {

	const std::vector<Entity> entities = parse(text, {Dimension::Time}, "en", options);
	const Entity *entity = whole(entities, text);
	if (!entity) {
		return std::shared_ptr<const TimeValue>();
	}
	return std::dynamic_pointer_cast<const TimeValue>(entity->value);
}

// the start of the first candidate, or "" if text is not one time.
std::string start(const std::string &text) {
	const std::shared_ptr<const TimeValue> time = time_of(text);
	if (!time || time->candidates.empty()) {
		return "";
	}
	return time->candidates[0].start_text;
}

} // namespace

TEST_CASE("relative days") {
	CHECK(start("today") == "2013-02-12T00:00:00.000+00:00");
	CHECK(start("tomorrow") == "2013-02-13T00:00:00.000+00:00");
	CHECK(start("yesterday") == "2013-02-11T00:00:00.000+00:00");
	CHECK(start("now") == "2013-02-12T04:30:00.000+00:00");
}

TEST_CASE("durations from now") {
	CHECK(start("in 3 hours") == "2013-02-12T07:30:00.000+00:00");
	CHECK(start("3 days ago") == "2013-02-09T04:30:00.000+00:00");
	CHECK(start("in half an hour") == "2013-02-12T05:00:00.000+00:00");
}

TEST_CASE("cycles") {
	CHECK(start("next week") == "2013-02-18T00:00:00.000+00:00");
	CHECK(start("last month") == "2013-01-01T00:00:00.000+00:00");
}

TEST_CASE("days of the week") {
	const std::shared_ptr<const TimeValue> monday = time_of("monday");
	REQUIRE(bool(monday));
	REQUIRE(monday->candidates.size() == 2);
	CHECK(monday->candidates[0].start_text == "2013-02-18T00:00:00.000+00:00");
	CHECK(monday->candidates[1].start_text == "2013-02-25T00:00:00.000+00:00");
	CHECK_FALSE(monday->interval);

	EngineOptions options;
	options.max_time_candidates = 1;
	REQUIRE(bool(time_of("monday", options)));
	CHECK(time_of("monday", options)->candidates.size() == 1);
}

TEST_CASE("dates") {
	CHECK(start("march 3") == "2013-03-03T00:00:00.000+00:00");
	CHECK(start("3 march") == "2013-03-03T00:00:00.000+00:00");
	CHECK(start("march 3rd") == "2013-03-03T00:00:00.000+00:00");
	CHECK(start("march 3 2015") == "2015-03-03T00:00:00.000+00:00");
}

TEST_CASE("times of day") {
	CHECK(start("at 5pm") == "2013-02-12T17:00:00.000+00:00");
	CHECK(start("15:45") == "2013-02-12T15:45:00.000+00:00");
	CHECK(start("tomorrow at 5pm") == "2013-02-13T17:00:00.000+00:00");
}

TEST_CASE("intervals of days") {
	const std::shared_ptr<const TimeValue> week = time_of("from monday to friday");
	REQUIRE(bool(week));
	CHECK(week->interval);
	REQUIRE_FALSE(week->candidates.empty());
	CHECK(week->candidates[0].start_text == "2013-02-18T00:00:00.000+00:00");
	CHECK(week->candidates[0].end_text == "2013-02-23T00:00:00.000+00:00");
}

TEST_CASE("relative interval ends") {
	const std::shared_ptr<const TimeValue> days = time_of("yesterday - tomorrow");
	REQUIRE(bool(days));
	CHECK(days->interval);
	REQUIRE(days->candidates.size() == 1);
	CHECK(days->candidates[0].start_text == "2013-02-11T00:00:00.000+00:00");
	CHECK(days->candidates[0].end_text == "2013-02-14T00:00:00.000+00:00");

	// tomorrow, the 13th, lies before the next friday.
	CHECK_FALSE(bool(time_of("from friday to tomorrow")));
}

TEST_CASE("offsets beyond the calendar") {
	std::vector<Entity> entities;
	CHECK_NOTHROW(entities = parse("in 3000000000 seconds", {Dimension::Time}));
	CHECK(entities.empty());

	CHECK_FALSE(bool(calendar_amount(Grain::Second, 3000000000LL)));
	CHECK_FALSE(bool(calendar_amount(Grain::Week, 400000000LL)));
	CHECK(*calendar_amount(Grain::Quarter, 4) == 12);

	const PayloadRef eons = TimeData::relative(1000000000, Grain::Year, false);
	CHECK(resolve_time(*eons->as<TimeData>(), test_reference, "UTC", 2).empty());

	CHECK(start("in 30 years") == "2043-02-12T04:30:00.000+00:00");
}

TEST_CASE("latent years") {
	const std::vector<Entity> entities = parse("2015", {Dimension::Time});
	REQUIRE(entities.size() == 1);
	CHECK(entities[0].latent);
	CHECK(entities[0].value->as<TimeValue>()->candidates[0].start_text == "2015-01-01T00:00:00.000+00:00");

	EngineOptions options;
	options.with_latent = false;
	CHECK(parse("2015", {Dimension::Time}, "en", options).empty());
}

TEST_CASE("time zones of the context") {
	const Engine engine(default_registry());
	const ParseResult result = engine.parse("tomorrow", context_for("en", {Dimension::Time}, "Europe/Oslo"));
	REQUIRE(result.entities.size() == 1);
	CHECK(result.entities[0].value->as<TimeValue>()->candidates[0].start_text == "2013-02-13T00:00:00.000+01:00");

	CHECK_THROWS_AS(engine.parse("tomorrow", context_for("en", {Dimension::Time}, "Nowhere/Special")), OptionsError);

	// the zone is checked whether or not the text mentions a time.
	CHECK_THROWS_AS(engine.parse("five", context_for("en", {Dimension::Numeral}, "Nowhere/Special")), OptionsError);
	CHECK_THROWS_AS(check_timezone("Nowhere/Special"), OptionsError);
	CHECK_NOTHROW(check_timezone("America/New_York"));
}
