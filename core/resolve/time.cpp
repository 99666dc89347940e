#include "time.h"
#include "core/document.h"

#include <limits>

#include "unicode/gregocal.h"
#include "unicode/smpdtfmt.h"

namespace {

// how far ahead recurring expressions are searched; covers the next
// february 29.
constexpr int search_days = 4 * 366;
constexpr int search_months = 4 * 12;

inline bool day_matches(const TimeCalendar &calendar, const TimeFields &fields) {
	if (fields.month && calendar.get(UCAL_MONTH) + 1 != *fields.month) {
		return false;
	}
	if (fields.day && calendar.get(UCAL_DATE) != *fields.day) {
		return false;
	}
	if (fields.weekday && calendar.weekday() != *fields.weekday) {
		return false;
	}
	return true;
}

class TimeResolver {
private:
	TimeCalendar &m_calendar;
	const UDate m_reference;
	// recurring expressions look for occurrences ending after this.
	const UDate m_after;
	const size_t m_max_candidates;

	TimeInterval interval(UDate start, Grain grain) {
		m_calendar.set_time(start);
		m_calendar.add(grain, 1);
		const UDate end = m_calendar.time();
		return TimeInterval{start, end, grain, m_calendar.format(start), m_calendar.format(end)};
	}

	// "tomorrow", "in 3 hours", "next week at 5pm".
	std::vector<TimeInterval> shifted(const TimeData &time) {
		const TimeShift &shift = *time.shift;

		m_calendar.set_time(m_reference);
		if (shift.anchored) {
			m_calendar.truncate(shift.grain);
		}
		if (!m_calendar.try_add(shift.grain, shift.n)) {
			return std::vector<TimeInterval>();
		}

		if (time.fields.hour) {
			m_calendar.set_time_of_day(*time.fields.hour, time.fields.minute ? *time.fields.minute : 0);
		}

		const UDate start = m_calendar.time();
		if (!m_calendar.try_add(time.grain, 1)) {
			return std::vector<TimeInterval>();
		}
		const UDate end = m_calendar.time();

		return std::vector<TimeInterval>{
			TimeInterval{start, end, time.grain, m_calendar.format(start), m_calendar.format(end)}};
	}

	// "march 3 2016", "2017".
	std::vector<TimeInterval> absolute(const TimeData &time) {
		const TimeFields &fields = time.fields;

		m_calendar.set_time(m_reference);
		m_calendar.assign(
			*fields.year,
			fields.month ? *fields.month : 1,
			fields.day ? *fields.day : 1,
			fields.hour ? *fields.hour : 0,
			fields.minute ? *fields.minute : 0,
			0);

		if (fields.weekday && !fields.day) {
			// "monday in march 2017": the first such day.
			for (int i = 0; i < 7 && m_calendar.weekday() != *fields.weekday; i++) {
				m_calendar.add(Grain::Day, 1);
			}
		}

		if (!day_matches(m_calendar, fields)) {
			// e.g. february 30, or a weekday that does not fit the date.
			return std::vector<TimeInterval>();
		}

		return std::vector<TimeInterval>{interval(m_calendar.time(), time.grain)};
	}

	// "march", "in september".
	std::vector<TimeInterval> monthly(const TimeData &time) {
		std::vector<TimeInterval> candidates;

		m_calendar.set_time(m_after);
		m_calendar.truncate(Grain::Month);
		UDate current = m_calendar.time();

		for (int i = 0; i < search_months && candidates.size() < m_max_candidates; i++) {
			m_calendar.set_time(current);
			if (day_matches(m_calendar, time.fields)) {
				candidates.push_back(interval(current, time.grain));
			}
			m_calendar.set_time(current);
			m_calendar.add(Grain::Month, 1);
			current = m_calendar.time();
		}

		return candidates;
	}

	// "monday", "march 3", "at 5pm", "the 3rd at 9:30".
	std::vector<TimeInterval> daily(const TimeData &time) {
		std::vector<TimeInterval> candidates;
		const TimeFields &fields = time.fields;

		m_calendar.set_time(m_after);
		m_calendar.truncate(Grain::Day);
		UDate current = m_calendar.time();

		for (int i = 0; i < search_days && candidates.size() < m_max_candidates; i++) {
			m_calendar.set_time(current);

			if (day_matches(m_calendar, fields)) {
				if (fields.hour) {
					m_calendar.set_time_of_day(*fields.hour, fields.minute ? *fields.minute : 0);
				}
				const TimeInterval candidate = interval(m_calendar.time(), time.grain);
				if (candidate.end > m_after) {
					candidates.push_back(candidate);
				}
			}

			m_calendar.set_time(current);
			m_calendar.add(Grain::Day, 1);
			current = m_calendar.time();
		}

		return candidates;
	}

public:
	inline TimeResolver(TimeCalendar &calendar, UDate reference, size_t max_candidates) :
		m_calendar(calendar), m_reference(reference), m_after(reference), m_max_candidates(max_candidates) {
	}

	inline TimeResolver(TimeCalendar &calendar, UDate reference, UDate after, size_t max_candidates) :
		m_calendar(calendar), m_reference(reference), m_after(after), m_max_candidates(max_candidates) {
	}

	// resolves the start of an interval, or a time that is no interval.
	std::vector<TimeInterval> point(const TimeData &time) {
		if (m_max_candidates == 0) {
			return std::vector<TimeInterval>();
		}

		const TimeFields &fields = time.fields;

		if (time.shift) {
			return shifted(time);
		} else if (fields.year) {
			return absolute(time);
		} else if (fields.month && !fields.day && !fields.weekday && !fields.hour) {
			return monthly(time);
		} else if (!fields.empty()) {
			return daily(time);
		} else {
			return std::vector<TimeInterval>();
		}
	}
};

} // namespace

optional<int32_t> calendar_amount(Grain grain, int64_t n) {
	// ICU keeps instants within about 5.8 million years of 1970.
	constexpr int64_t max_seconds = int64_t(100000000000000);

	int64_t factor = 1;
	switch (grain) {
		case Grain::Week:
			factor = 7;
			break;
		case Grain::Quarter:
			factor = 3;
			break;
		default:
			break;
	}

	if (n > std::numeric_limits<int32_t>::max() / factor ||
		n < std::numeric_limits<int32_t>::min() / factor) {
		return optional<int32_t>();
	}
	if (n > max_seconds / grain_seconds(grain) || n < -max_seconds / grain_seconds(grain)) {
		return optional<int32_t>();
	}

	return int32_t(n * factor);
}

namespace {

std::unique_ptr<icu::TimeZone> time_zone(const std::string &timezone) {
	std::unique_ptr<icu::TimeZone> zone(icu::TimeZone::createTimeZone(
		icu::UnicodeString::fromUTF8(icu::StringPiece(timezone.data(), int32_t(timezone.size())))));

	if (!zone || *zone == icu::TimeZone::getUnknown()) {
		throw OptionsError("unknown time zone " + timezone);
	}

	return zone;
}

} // namespace

void check_timezone(const std::string &timezone) {
	time_zone(timezone);
}

TimeCalendar::TimeCalendar(const std::string &timezone) : m_timezone(timezone) {
	UErrorCode status = U_ZERO_ERROR;
	m_calendar.reset(new icu::GregorianCalendar(time_zone(timezone).release(), status));
	check_status(status, "GregorianCalendar failed");

	m_calendar->setFirstDayOfWeek(UCAL_MONDAY);
	m_calendar->setMinimalDaysInFirstWeek(4);
}

void TimeCalendar::set_time(UDate time) {
	UErrorCode status = U_ZERO_ERROR;
	m_calendar->setTime(time, status);
	check_status(status, "Calendar::setTime failed");
}

UDate TimeCalendar::time() const {
	UErrorCode status = U_ZERO_ERROR;
	const UDate time = m_calendar->getTime(status);
	check_status(status, "Calendar::getTime failed");
	return time;
}

int32_t TimeCalendar::get(UCalendarDateFields field) const {
	UErrorCode status = U_ZERO_ERROR;
	const int32_t value = m_calendar->get(field, status);
	check_status(status, "Calendar::get failed");
	return value;
}

void TimeCalendar::assign(int32_t year, int32_t month, int32_t day, int32_t hour, int32_t minute, int32_t second) {
	m_calendar->clear();
	m_calendar->set(year, month - 1, day, hour, minute, second);
	// forces the fields to be recomputed.
	time();
}

void TimeCalendar::truncate(Grain grain) {
	const int32_t year = get(UCAL_YEAR);
	int32_t month = get(UCAL_MONTH) + 1;
	int32_t day = get(UCAL_DATE);
	int32_t hour = get(UCAL_HOUR_OF_DAY);
	int32_t minute = get(UCAL_MINUTE);
	int32_t second = get(UCAL_SECOND);

	switch (grain) {
		case Grain::Year:
			month = 1;
			// fall through
		case Grain::Quarter:
			month = ((month - 1) / 3) * 3 + 1;
			// fall through
		case Grain::Month:
			day = 1;
			// fall through
		case Grain::Week:
		case Grain::Day:
			hour = 0;
			// fall through
		case Grain::Hour:
			minute = 0;
			// fall through
		case Grain::Minute:
			second = 0;
			// fall through
		case Grain::Second:
			break;
		default:
			throw UnhandledVariantError("unknown grain");
	}

	assign(year, month, day, hour, minute, second);

	if (grain == Grain::Week) {
		add(Grain::Day, -(weekday() - 1));
	}
}

bool TimeCalendar::add(Grain grain, int64_t n, UErrorCode &status) {
	const optional<int32_t> amount = calendar_amount(grain, n);
	if (!amount) {
		return false;
	}

	switch (grain) {
		case Grain::Second:
			m_calendar->add(UCAL_SECOND, *amount, status);
			break;
		case Grain::Minute:
			m_calendar->add(UCAL_MINUTE, *amount, status);
			break;
		case Grain::Hour:
			m_calendar->add(UCAL_HOUR_OF_DAY, *amount, status);
			break;
		case Grain::Day:
		case Grain::Week:
			m_calendar->add(UCAL_DATE, *amount, status);
			break;
		case Grain::Month:
		case Grain::Quarter:
			m_calendar->add(UCAL_MONTH, *amount, status);
			break;
		case Grain::Year:
			m_calendar->add(UCAL_YEAR, *amount, status);
			break;
		default:
			throw UnhandledVariantError("unknown grain");
	}

	if (U_SUCCESS(status)) {
		m_calendar->getTime(status);
	}
	return U_SUCCESS(status);
}

void TimeCalendar::add(Grain grain, int64_t n) {
	UErrorCode status = U_ZERO_ERROR;
	if (!add(grain, n, status)) {
		if (U_FAILURE(status)) {
			check_status(status, "Calendar::add failed");
		}
		throw std::out_of_range("calendar offset " + std::to_string(n) + " is too large");
	}
}

bool TimeCalendar::try_add(Grain grain, int64_t n) {
	UErrorCode status = U_ZERO_ERROR;
	return add(grain, n, status);
}

int TimeCalendar::weekday() const {
	// ICU counts from sunday = 1.
	return ((get(UCAL_DAY_OF_WEEK) + 5) % 7) + 1;
}

void TimeCalendar::set_time_of_day(int hour, int minute) {
	assign(get(UCAL_YEAR), get(UCAL_MONTH) + 1, get(UCAL_DATE), hour, minute, 0);
}

std::string TimeCalendar::format(UDate time) const {
	UErrorCode status = U_ZERO_ERROR;

	icu::SimpleDateFormat formatter(
		icu::UnicodeString("yyyy-MM-dd'T'HH:mm:ss.SSSxxx", -1, US_INV),
		icu::Locale::getRoot(),
		status);
	check_status(status, "SimpleDateFormat failed");

	formatter.setTimeZone(m_calendar->getTimeZone());

	icu::UnicodeString text;
	formatter.format(time, text);

	std::string s;
	text.toUTF8String(s);
	return s;
}

std::vector<TimeInterval> resolve_time(
	const TimeData &time,
	UDate reference,
	const std::string &timezone,
	size_t max_candidates) {

	TimeCalendar calendar(timezone);

	std::vector<TimeInterval> starts = TimeResolver(calendar, reference, max_candidates).point(time);

	if (!time.interval_end) {
		return starts;
	}

	// "from monday to friday": each start pairs with the first end that
	// does not lie before it. relative ends ("until tomorrow") are seen
	// from the reference like the start.
	std::vector<TimeInterval> intervals;
	for (const TimeInterval &start : starts) {
		const std::vector<TimeInterval> ends = TimeResolver(
			calendar, reference, start.start, 1).point(*time.interval_end);
		if (ends.empty() || ends.front().end <= start.start) {
			continue;
		}

		const TimeInterval &end = ends.front();
		intervals.push_back(TimeInterval{
			start.start, end.end, finest(start.grain, end.grain), start.start_text, end.end_text});
	}

	return intervals;
}
