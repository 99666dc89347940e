// @formatter:off

#ifndef CDUCKLING_TIME_H
#define CDUCKLING_TIME_H

#include <gmpxx.h>

#include "core/payload.h"

enum class Grain : uint8_t {
	Second,
	Minute,
	Hour,
	Day,
	Week,
	Month,
	Quarter,
	Year
};

const char *grain_name(Grain grain);

// nominal length; months are 30 days, quarters 91, years 365.
int64_t grain_seconds(Grain grain);

inline bool finer(Grain a, Grain b) {
	return uint8_t(a) < uint8_t(b);
}

inline Grain finest(Grain a, Grain b) {
	return finer(a, b) ? a : b;
}

class GrainData : public Payload {
public:
	const Grain grain;

	inline GrainData(Grain grain_) : Payload(Dimension::TimeGrain), grain(grain_) {
	}

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

class DurationData : public Payload {
public:
	const mpq_class value;
	const Grain grain;

	inline DurationData(const mpq_class &value_, Grain grain_) :
		Payload(Dimension::Duration), value(value_), grain(grain_) {
	}

	// a duration in the next finer grain with an integral value, if one
	// exists; "1.5 hours" becomes 90 minutes.
	PayloadRef normalized() const;

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

// n units of a grain away from the reference instant. an anchored shift
// starts at the beginning of its grain ("tomorrow" is all of the next
// day), an unanchored one keeps the time of day ("in 3 hours").
struct TimeShift {
	int64_t n;
	Grain grain;
	bool anchored;

	inline bool operator==(const TimeShift &shift) const {
		return n == shift.n && grain == shift.grain && anchored == shift.anchored;
	}
};

// calendar field constraints; months are 1..12, weekdays 1 (monday)
// to 7 (sunday).
struct TimeFields {
	optional<int> year;
	optional<int> month;
	optional<int> day;
	optional<int> weekday;
	optional<int> hour;
	optional<int> minute;

	inline bool empty() const {
		return !year && !month && !day && !weekday && !hour && !minute;
	}

	// the finest grain constrained by these fields.
	optional<Grain> grain() const;

	// merges two sets of constraints, declining on conflicting values.
	optional<TimeFields> intersect(const TimeFields &fields) const;

	bool operator==(const TimeFields &fields) const;

	hash_t hash() const;
};

class TimeData : public Payload {
public:
	const optional<TimeShift> shift;
	const TimeFields fields;
	const Grain grain;

	// set for intervals; this payload is then the interval's start.
	const std::shared_ptr<const TimeData> interval_end;

	inline TimeData(
		const optional<TimeShift> &shift_,
		const TimeFields &fields_,
		Grain grain_,
		const std::shared_ptr<const TimeData> &interval_end_ = std::shared_ptr<const TimeData>()) :

		Payload(Dimension::Time),
		shift(shift_),
		fields(fields_),
		grain(grain_),
		interval_end(interval_end_) {
	}

	static PayloadRef now();

	static PayloadRef relative(int64_t n, Grain grain, bool anchored);

	static PayloadRef with_fields(const TimeFields &fields);

	// null if the two expressions cannot describe the same time.
	static PayloadRef intersect(const TimeData &a, const TimeData &b);

	// null if either end is itself an interval.
	static PayloadRef interval(const TimeData &from, const TimeData &to);

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

#endif // CDUCKLING_TIME_H
