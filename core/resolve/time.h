#ifndef CDUCKLING_RESOLVE_TIME_H
#define CDUCKLING_RESOLVE_TIME_H

#include <memory>

#include "unicode/calendar.h"
#include "unicode/timezone.h"

#include "core/context.h"
#include "core/payloads/time.h"

struct TimeInterval {
	UDate start;
	UDate end;
	Grain grain;

	// ISO 8601 with offset, in the request's time zone.
	std::string start_text;
	std::string end_text;
};

// throws OptionsError if ICU does not know the time zone id.
void check_timezone(const std::string &timezone);

// n units of grain in the calendar field that carries it (days for
// weeks, months for quarters); none if ICU cannot represent the offset.
optional<int32_t> calendar_amount(Grain grain, int64_t n);

// calendar arithmetic in one time zone. weeks start on monday.
class TimeCalendar {
private:
	std::unique_ptr<icu::Calendar> m_calendar;
	std::string m_timezone;

	bool add(Grain grain, int64_t n, UErrorCode &status);

public:
	// throws OptionsError if the time zone id is unknown.
	explicit TimeCalendar(const std::string &timezone);

	void set_time(UDate time);

	UDate time() const;

	int32_t get(UCalendarDateFields field) const;

	// moves back to the start of the grain containing the current time.
	void truncate(Grain grain);

	// throws std::out_of_range for offsets the calendar cannot represent.
	void add(Grain grain, int64_t n);

	// false, leaving the calendar in an unspecified state, where add throws.
	bool try_add(Grain grain, int64_t n);

	// 1 for monday up to 7 for sunday.
	int weekday() const;

	// sets a wall clock time; month is 1..12.
	void assign(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t minute, int32_t second);

	// keeps the day, replaces the wall clock time.
	void set_time_of_day(int hour, int minute);

	std::string format(UDate time) const;
};

// the concrete intervals a time expression stands for, seen from the
// reference instant: the current or next occurrences, at most
// max_candidates of them. expressions fixing the year yield a single
// interval even if it lies in the past.
std::vector<TimeInterval> resolve_time(
	const TimeData &time,
	UDate reference,
	const std::string &timezone,
	size_t max_candidates);

#endif // CDUCKLING_RESOLVE_TIME_H
