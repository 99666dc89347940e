#include "doctest.h"

#include "support.h"

namespace {

using MeasureRef = std::shared_ptr<const MeasureValue>;

// the measure spanning all of text, if it is the only one.
MeasureRef measure(const std::string &text, Dimension dimension) {
	const std::vector<Entity> entities = parse(text, {dimension});
	const Entity *entity = whole(entities, text);
	return entity ? std::dynamic_pointer_cast<const MeasureValue>(entity->value) : MeasureRef();
}

} // namespace

TEST_CASE("temperatures") {
	MeasureRef t = measure("80 degrees fahrenheit", Dimension::Temperature);
	REQUIRE(bool(t));
	CHECK(t->value == 80);
	CHECK(t->unit == "fahrenheit");

	t = measure("25°C", Dimension::Temperature);
	REQUIRE(bool(t));
	CHECK(t->value == 25);
	CHECK(t->unit == "celsius");

	t = measure("37 celsius", Dimension::Temperature);
	REQUIRE(bool(t));
	CHECK(t->unit == "celsius");

	t = measure("5 degrees below zero", Dimension::Temperature);
	REQUIRE(bool(t));
	CHECK(t->value == -5);
	CHECK(t->unit == "degree");
}

TEST_CASE("distances") {
	MeasureRef d = measure("3 km", Dimension::Distance);
	REQUIRE(bool(d));
	CHECK(d->value == 3);
	CHECK(d->unit == "kilometre");

	d = measure("5 miles", Dimension::Distance);
	REQUIRE(bool(d));
	CHECK(d->unit == "mile");

	d = measure("two metres", Dimension::Distance);
	REQUIRE(bool(d));
	CHECK(d->value == 2);
	CHECK(d->unit == "metre");

	d = measure("10 inches", Dimension::Distance);
	REQUIRE(bool(d));
	CHECK(d->unit == "inch");
}

TEST_CASE("volumes") {
	MeasureRef v = measure("2 litres", Dimension::Volume);
	REQUIRE(bool(v));
	CHECK(v->value == 2);
	CHECK(v->unit == "litre");

	v = measure("250 ml", Dimension::Volume);
	REQUIRE(bool(v));
	CHECK(v->unit == "millilitre");

	v = measure("3 gallons", Dimension::Volume);
	REQUIRE(bool(v));
	CHECK(v->unit == "gallon");
}

TEST_CASE("quantities") {
	MeasureRef q = measure("2 cups of sugar", Dimension::Quantity);
	REQUIRE(bool(q));
	CHECK(q->value == 2);
	CHECK(q->unit == "cup");
	REQUIRE(bool(q->product));
	CHECK(*q->product == "sugar");

	q = measure("500 grams", Dimension::Quantity);
	REQUIRE(bool(q));
	CHECK(q->unit == "gram");
	CHECK_FALSE(bool(q->product));

	q = measure("5 kilograms", Dimension::Quantity);
	REQUIRE(bool(q));
	CHECK(q->unit == "kilogram");
}

TEST_CASE("amounts of money") {
	MeasureRef m = measure("$20", Dimension::Finance);
	REQUIRE(bool(m));
	CHECK(m->value == 20);
	CHECK(m->unit == "USD");

	m = measure("20 dollars", Dimension::Finance);
	REQUIRE(bool(m));
	CHECK(m->unit == "USD");

	m = measure("$3 and 5 cents", Dimension::Finance);
	REQUIRE(bool(m));
	CHECK(m->value == doctest::Approx(3.05));
	CHECK(m->unit == "USD");

	m = measure("about €5", Dimension::Finance);
	REQUIRE(bool(m));
	CHECK(m->value == 5);
	CHECK(m->unit == "EUR");

	m = measure("10 kroner", Dimension::Finance);
	REQUIRE(bool(m));
	CHECK(m->unit == "NOK");
}

TEST_CASE("currency signs alone") {
	// a currency without an amount has no value and is not returned.
	CHECK(parse("$", {Dimension::Finance}).empty());
	CHECK(parse("pay in euros", {Dimension::Finance}).empty());
}
