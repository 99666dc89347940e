#include "rules.h"
#include "core/resolve/time.h"

#include <algorithm>
#include <cctype>

namespace {

using namespace Rules;

const std::vector<std::pair<std::string, Grain>> grains = {
	{"sec(ond)?s?", Grain::Second},
	{"min(ute)?s?", Grain::Minute},
	{"h(ou)?rs?|hours?|h", Grain::Hour},
	{"days?", Grain::Day},
	{"weeks?", Grain::Week},
	{"months?", Grain::Month},
	{"quarters?|qtrs?", Grain::Quarter},
	{"y(ea)?rs?", Grain::Year}
};

const std::vector<std::pair<std::string, int64_t>> weekdays = {
	{"monday", 1}, {"mon", 1},
	{"tuesday", 2}, {"tue", 2}, {"tues", 2},
	{"wednesday", 3}, {"wed", 3},
	{"thursday", 4}, {"thu", 4}, {"thur", 4}, {"thurs", 4},
	{"friday", 5}, {"fri", 5},
	{"saturday", 6}, {"sat", 6},
	{"sunday", 7}, {"sun", 7}
};

const std::vector<std::pair<std::string, int64_t>> months = {
	{"january", 1}, {"jan", 1},
	{"february", 2}, {"feb", 2},
	{"march", 3}, {"mar", 3},
	{"april", 4}, {"apr", 4},
	{"may", 5},
	{"june", 6}, {"jun", 6},
	{"july", 7}, {"jul", 7},
	{"august", 8}, {"aug", 8},
	{"september", 9}, {"sept", 9}, {"sep", 9},
	{"october", 10}, {"oct", 10},
	{"november", 11}, {"nov", 11},
	{"december", 12}, {"dec", 12}
};

bool positive(const NumeralData &number) {
	return number.value > 0;
}

bool month_only(const TimeData &time) {
	const TimeFields &f = time.fields;
	return !time.shift && !time.interval_end && f.month && !f.day && !f.year && !f.weekday && !f.hour;
}

bool date_without_year(const TimeData &time) {
	const TimeFields &f = time.fields;
	return !time.shift && !time.interval_end && f.month && f.day && !f.year && !f.hour;
}

bool time_of_day(const TimeData &time) {
	const TimeFields &f = time.fields;
	return !time.shift && !time.interval_end && f.hour && !f.year && !f.month && !f.day && !f.weekday;
}

bool not_interval(const TimeData &time) {
	return !time.interval_end;
}

PayloadRef with_day(const TimeData &time, int64_t day) {
	if (day < 1 || day > 31) {
		return PayloadRef();
	}
	TimeFields fields(time.fields);
	fields.day = int(day);
	return time_fields(fields);
}

PayloadRef with_year(const TimeData &time, const NumeralData &year) {
	if (!year.is_integer()) {
		return PayloadRef();
	}
	TimeFields fields(time.fields);
	fields.year = int(year.value.get_num().get_si());
	return time_fields(fields);
}

PayloadRef hour_minute(int64_t hour, int64_t minute) {
	if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
		return PayloadRef();
	}
	TimeFields fields;
	fields.hour = int(hour);
	fields.minute = int(minute);
	return time_fields(fields);
}

PayloadRef hour_only(int64_t hour) {
	if (hour < 0 || hour > 23) {
		return PayloadRef();
	}
	TimeFields fields;
	fields.hour = int(hour);
	return time_fields(fields);
}

// "5" + "pm" -> 17; "12 am" -> 0.
optional<int> twelve_hour(int hour, const std::string &meridiem) {
	if (hour < 0 || hour > 12) {
		return optional<int>();
	}
	const bool pm = !meridiem.empty() && (meridiem[0] == 'p' || meridiem[0] == 'P');
	if (pm) {
		return hour == 12 ? 12 : hour + 12;
	} else {
		return hour == 12 ? 0 : hour;
	}
}

// whole units of the duration, moved to a finer grain if needed.
PayloadRef shifted_by(const DurationData &duration, int sign) {
	const PayloadRef normalized = duration.normalized();
	const DurationData &d = *normalized->as<DurationData>();
	if (d.value.get_den() != 1 || !d.value.get_num().fits_slong_p()) {
		return PayloadRef();
	}
	const int64_t n = sign * int64_t(d.value.get_num().get_si());
	if (!calendar_amount(d.grain, n)) {
		return PayloadRef();
	}
	return TimeData::relative(n, d.grain, false);
}

std::vector<RuleRef> grain_rules() {
	std::vector<RuleRef> rules;
	for (const auto &entry : grains) {
		const Grain g = entry.second;
		rules.push_back(make_rule(std::string("unit of duration (") + grain_name(g) + ")",
			{regex_item(entry.first)},
			[g] (const Captures&) {
				return make_payload<GrainData>(g);
			}));
	}
	return rules;
}

std::vector<RuleRef> duration_rules() {
	return std::vector<RuleRef>{
		make_rule("<number> <unit-of-duration>", {number_with("positive", positive), grain()}, [] (const Captures &c) {
			return DurationData(c.get<NumeralData>(0).value, c.get<GrainData>(1).grain).normalized();
		}),

		make_rule("a <unit-of-duration>", {regex_item("an?"), grain()}, [] (const Captures &c) {
			return make_payload<DurationData>(1, c.get<GrainData>(1).grain);
		}),

		make_rule("half an hour", {regex_item("(1/2|half) an? hour")}, [] (const Captures&) {
			return make_payload<DurationData>(30, Grain::Minute);
		}),

		make_rule("about <duration>", {regex_item("about|approx(\\.|imately)?|around"), duration()},
			[] (const Captures &c) {
				return c.token(1)->payload;
			})
	};
}

std::vector<RuleRef> time_rules() {
	return std::vector<RuleRef>{
		make_rule("now", {regex_item("((just|right) )?now|immediately")}, [] (const Captures&) {
			return TimeData::now();
		}),

		make_rule("today", {regex_item("todays?|at this time")}, [] (const Captures&) {
			return TimeData::relative(0, Grain::Day, true);
		}),

		make_rule("tomorrow", {regex_item("tmrw?|tomm?or?rows?")}, [] (const Captures&) {
			return TimeData::relative(1, Grain::Day, true);
		}),

		make_rule("yesterday", {regex_item("yesterdays?")}, [] (const Captures&) {
			return TimeData::relative(-1, Grain::Day, true);
		}),

		make_rule("day of week", {literal_set(weekdays)}, [] (const Captures &c) {
			TimeFields fields;
			fields.weekday = int(c.literal(0));
			return time_fields(fields);
		}),

		make_rule("month", {literal_set(months)}, [] (const Captures &c) {
			TimeFields fields;
			fields.month = int(c.literal(0));
			return time_fields(fields);
		}),

		make_rule("<month> <day-of-month>", {time_with("month", month_only), number_between(1, 32)},
			[] (const Captures &c) -> PayloadRef {
				const NumeralData &day = c.get<NumeralData>(1);
				if (!day.is_integer()) {
					return PayloadRef();
				}
				return with_day(c.get<TimeData>(0), day.value.get_num().get_si());
			}),

		make_rule("<day-of-month> <month>", {number_between(1, 32), time_with("month", month_only)},
			[] (const Captures &c) -> PayloadRef {
				const NumeralData &day = c.get<NumeralData>(0);
				if (!day.is_integer()) {
					return PayloadRef();
				}
				return with_day(c.get<TimeData>(1), day.value.get_num().get_si());
			}),

		make_rule("<month> <ordinal>", {time_with("month", month_only), ordinal()}, [] (const Captures &c) {
			return with_day(c.get<TimeData>(0), c.get<OrdinalData>(1).value);
		}),

		make_rule("the <ordinal> of <month>", {
			regex_item("the"),
			ordinal(),
			regex_item("of"),
			time_with("month", month_only)},
			[] (const Captures &c) {
				return with_day(c.get<TimeData>(3), c.get<OrdinalData>(1).value);
			}),

		make_rule("<date> <year>", {time_with("date", date_without_year), number_between(1000, 2101)},
			[] (const Captures &c) {
				return with_year(c.get<TimeData>(0), c.get<NumeralData>(1));
			}),

		make_rule("<date>, <year>", {time_with("date", date_without_year), regex_item(","), number_between(1000, 2101)},
			[] (const Captures &c) {
				return with_year(c.get<TimeData>(0), c.get<NumeralData>(2));
			}),

		make_latent_rule("year (latent)", {number_between(1000, 2101)}, [] (const Captures &c) -> PayloadRef {
			const NumeralData &year = c.get<NumeralData>(0);
			if (!year.is_integer()) {
				return PayloadRef();
			}
			TimeFields fields;
			fields.year = int(year.value.get_num().get_si());
			return time_fields(fields);
		}),

		make_rule("hh:mm", {regex_item("((?:[01]?\\d)|(?:2[0-3])):([0-5]\\d)")}, [] (const Captures &c) {
			return hour_minute(std::stoll(c.group(0, 0)), std::stoll(c.group(0, 1)));
		}),

		make_rule("<integer> am|pm", {number_between(0, 13), regex_item("([ap])\\.?m\\.?")},
			[] (const Captures &c) -> PayloadRef {
				const NumeralData &hour = c.get<NumeralData>(0);
				if (!hour.is_integer()) {
					return PayloadRef();
				}
				const optional<int> h = twelve_hour(int(hour.value.get_num().get_si()), c.group(1));
				return h ? hour_only(*h) : PayloadRef();
			}),

		make_rule("<time-of-day> am|pm", {time_with("time of day", time_of_day), regex_item("([ap])\\.?m\\.?")},
			[] (const Captures &c) -> PayloadRef {
				const TimeData &time = c.get<TimeData>(0);
				const optional<int> h = twelve_hour(*time.fields.hour, c.group(1));
				if (!h) {
					return PayloadRef();
				}
				TimeFields fields(time.fields);
				fields.hour = *h;
				return time_fields(fields);
			}),

		make_rule("noon", {regex_item("noon|midday")}, [] (const Captures&) {
			return hour_only(12);
		}),

		make_rule("midnight", {regex_item("midnight")}, [] (const Captures&) {
			return hour_only(0);
		}),

		make_rule("at <time-of-day>", {regex_item("at|@"), time_with("time of day", time_of_day)},
			[] (const Captures &c) {
				return c.token(1)->payload;
			}),

		make_rule("at <integer>", {regex_item("at|@"), number_between(0, 24)}, [] (const Captures &c) -> PayloadRef {
			const NumeralData &hour = c.get<NumeralData>(1);
			if (!hour.is_integer()) {
				return PayloadRef();
			}
			return hour_only(hour.value.get_num().get_si());
		}),

		make_rule("in <duration>", {regex_item("in|within|after"), duration()}, [] (const Captures &c) {
			return shifted_by(c.get<DurationData>(1), 1);
		}),

		make_rule("<duration> from now", {duration(), regex_item("from now|hence")}, [] (const Captures &c) {
			return shifted_by(c.get<DurationData>(0), 1);
		}),

		make_rule("<duration> ago", {duration(), regex_item("ago")}, [] (const Captures &c) {
			return shifted_by(c.get<DurationData>(0), -1);
		}),

		make_rule("this|next|last <cycle>", {
			regex_item("(this|current|coming|next|upcoming|last|past|previous)"),
			grain()},
			[] (const Captures &c) {
				std::string which(c.group(0));
				std::transform(which.begin(), which.end(), which.begin(), [] (char ch) {
					return char(std::tolower((unsigned char)ch));
				});
				int64_t n = 0;
				if (which == "next" || which == "coming" || which == "upcoming") {
					n = 1;
				} else if (which == "last" || which == "past" || which == "previous") {
					n = -1;
				}
				return TimeData::relative(n, c.get<GrainData>(1).grain, true);
			}),

		make_rule("intersect", {time_with("no interval", not_interval), time_with("no interval", not_interval)},
			[] (const Captures &c) {
				return TimeData::intersect(c.get<TimeData>(0), c.get<TimeData>(1));
			}),

		make_rule("from <time> to <time>", {
			regex_item("from"),
			any_time(),
			regex_item("\\-|to|th?ru|through|(un)?til(l)?"),
			any_time()},
			[] (const Captures &c) {
				return TimeData::interval(c.get<TimeData>(1), c.get<TimeData>(3));
			}),

		make_rule("<time> - <time>", {any_time(), regex_item("\\-"), any_time()}, [] (const Captures &c) {
			return TimeData::interval(c.get<TimeData>(0), c.get<TimeData>(2));
		})
	};
}

} // namespace

void Rules::EnglishTime::initialize() {
	add(Dimension::TimeGrain, grain_rules);
	add(Dimension::Duration, duration_rules);
	add(Dimension::Time, time_rules);
}
