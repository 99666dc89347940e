#include "rules.h"

namespace {

using namespace Rules;

bool in_degrees(const MeasureData &temperature) {
	return temperature.value && temperature.unit == "degree";
}

std::vector<RuleRef> temperature_rules() {
	return std::vector<RuleRef>{
		make_rule("<number> degrees", {number(), regex_item("(deg(ree)?s?\\.?)|°")}, [] (const Captures &c) {
			return measure(Dimension::Temperature, c.get<NumeralData>(0).value, "degree");
		}),

		make_rule("<temp> Celsius", {
			measure_with(Dimension::Temperature, "in degrees", in_degrees),
			regex_item("c(el[cs]?(ius)?)?\\.?")},
			[] (const Captures &c) {
				return c.get<MeasureData>(0).with_unit("celsius");
			}),

		make_rule("<temp> Fahrenheit", {
			measure_with(Dimension::Temperature, "in degrees", in_degrees),
			regex_item("f(ah?rh?eh?n(h?eit)?)?\\.?")},
			[] (const Captures &c) {
				return c.get<MeasureData>(0).with_unit("fahrenheit");
			}),

		make_rule("<number> Celsius", {number(), regex_item("cel[cs]?(ius)?")}, [] (const Captures &c) {
			return measure(Dimension::Temperature, c.get<NumeralData>(0).value, "celsius");
		}),

		make_rule("<number> Fahrenheit", {number(), regex_item("fah?rh?eh?n(h?eit)?")}, [] (const Captures &c) {
			return measure(Dimension::Temperature, c.get<NumeralData>(0).value, "fahrenheit");
		}),

		make_rule("<temp> below zero", {
			measure_with(Dimension::Temperature, "positive", [] (const MeasureData &t) {
				return t.value && *t.value > 0;
			}),
			regex_item("below zero")},
			[] (const Captures &c) {
				const MeasureData &t = c.get<MeasureData>(0);
				return measure(Dimension::Temperature, -*t.value, t.unit);
			})
	};
}

std::vector<RuleRef> distance_rules() {
	return std::vector<RuleRef>{
		unit_rule(Dimension::Distance, "kilometre", "k(ilo)?m(et(er|re)s?)?"),
		unit_rule(Dimension::Distance, "mile", "miles?"),
		unit_rule(Dimension::Distance, "metre", "m(et(er|re)s?)?"),
		unit_rule(Dimension::Distance, "centimetre", "(cm|centimet(er|re)s?)"),
		unit_rule(Dimension::Distance, "millimetre", "(mm|millimet(er|re)s?)"),
		unit_rule(Dimension::Distance, "foot", "(foot|feet|ft)"),
		unit_rule(Dimension::Distance, "inch", "(inch(es)?|in)"),
		unit_rule(Dimension::Distance, "yard", "y(ar)?ds?")
	};
}

std::vector<RuleRef> volume_rules() {
	return std::vector<RuleRef>{
		unit_rule(Dimension::Volume, "millilitre", "(ml|millilit(er|re)s?)"),
		unit_rule(Dimension::Volume, "hectolitre", "(hl|hectolit(er|re)s?)"),
		unit_rule(Dimension::Volume, "litre", "(lit(er|re)s?|l)"),
		unit_rule(Dimension::Volume, "gallon", "gal(l?on)?s?")
	};
}

std::vector<RuleRef> quantity_rules() {
	return std::vector<RuleRef>{
		unit_rule(Dimension::Quantity, "cup", "cups?"),
		unit_rule(Dimension::Quantity, "gram", "(grams?|g)"),
		unit_rule(Dimension::Quantity, "kilogram", "(kilograms?|kilos?|kg)"),
		unit_rule(Dimension::Quantity, "pound", "(lbs?|pounds?)"),

		make_rule("<quantity> of product", {
			measure_with(Dimension::Quantity, "without product", [] (const MeasureData &q) {
				return q.value && !q.product;
			}),
			regex_item("of (\\w+)")},
			[] (const Captures &c) {
				return c.get<MeasureData>(0).with_product(c.group(1));
			})
	};
}

} // namespace

void Rules::EnglishMeasures::initialize() {
	add(Dimension::Temperature, temperature_rules);
	add(Dimension::Distance, distance_rules);
	add(Dimension::Volume, volume_rules);
	add(Dimension::Quantity, quantity_rules);
}
