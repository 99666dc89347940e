#include "time.h"

#include <sstream>

const char *grain_name(Grain grain) {
	switch (grain) {
		case Grain::Second:
			return "second";
		case Grain::Minute:
			return "minute";
		case Grain::Hour:
			return "hour";
		case Grain::Day:
			return "day";
		case Grain::Week:
			return "week";
		case Grain::Month:
			return "month";
		case Grain::Quarter:
			return "quarter";
		case Grain::Year:
			return "year";
		default:
			throw UnhandledVariantError("unknown grain");
	}
}

int64_t grain_seconds(Grain grain) {
	switch (grain) {
		case Grain::Second:
			return 1;
		case Grain::Minute:
			return 60;
		case Grain::Hour:
			return 3600;
		case Grain::Day:
			return 86400;
		case Grain::Week:
			return 7 * 86400;
		case Grain::Month:
			return 30 * 86400;
		case Grain::Quarter:
			return 91 * 86400;
		case Grain::Year:
			return 365 * 86400;
		default:
			throw UnhandledVariantError("unknown grain");
	}
}

namespace {

inline hash_t hash_optional(const optional<int> &x) {
	return x ? hash_t(*x) + 1 : 0;
}

inline bool merge_field(optional<int> &target, const optional<int> &source) {
	if (source) {
		if (target && *target != *source) {
			return false;
		}
		target = source;
	}
	return true;
}

// the next finer grain in which a fractional duration may become integral.
optional<Grain> finer_grain(Grain grain) {
	switch (grain) {
		case Grain::Minute:
			return Grain::Second;
		case Grain::Hour:
			return Grain::Minute;
		case Grain::Day:
			return Grain::Hour;
		case Grain::Week:
			return Grain::Day;
		case Grain::Month:
			return Grain::Day;
		case Grain::Quarter:
			return Grain::Month;
		case Grain::Year:
			return Grain::Month;
		default:
			return optional<Grain>();
	}
}

int64_t grain_factor(Grain coarse, Grain fine) {
	if (coarse == Grain::Month && fine == Grain::Day) {
		return 30;
	} else if (coarse == Grain::Quarter && fine == Grain::Month) {
		return 3;
	} else if (coarse == Grain::Year && fine == Grain::Month) {
		return 12;
	} else {
		return grain_seconds(coarse) / grain_seconds(fine);
	}
}

} // namespace

bool GrainData::same(const Payload &payload) const {
	const GrainData *other = payload.as<GrainData>();
	return other && grain == other->grain;
}

hash_t GrainData::hash() const {
	return hash_pair(grain_hash, hash_t(grain));
}

std::string GrainData::debugform() const {
	return std::string("TimeGrain[") + grain_name(grain) + "]";
}

PayloadRef DurationData::normalized() const {
	mpq_class v = value;
	Grain g = grain;

	while (v.get_den() != 1) {
		const optional<Grain> next = finer_grain(g);
		if (!next) {
			break;
		}
		v *= grain_factor(g, *next);
		v.canonicalize();
		g = *next;
	}

	return make_payload<DurationData>(v, g);
}

bool DurationData::same(const Payload &payload) const {
	const DurationData *other = payload.as<DurationData>();
	return other && value == other->value && grain == other->grain;
}

hash_t DurationData::hash() const {
	return hash_combine(hash_pair(duration_hash, hash_mpq(value)), hash_t(grain));
}

std::string DurationData::debugform() const {
	std::ostringstream s;
	s << "Duration[" << value.get_str() << " " << grain_name(grain) << "]";
	return s.str();
}

optional<Grain> TimeFields::grain() const {
	if (minute) {
		return Grain::Minute;
	} else if (hour) {
		return Grain::Hour;
	} else if (day || weekday) {
		return Grain::Day;
	} else if (month) {
		return Grain::Month;
	} else if (year) {
		return Grain::Year;
	} else {
		return optional<Grain>();
	}
}

optional<TimeFields> TimeFields::intersect(const TimeFields &fields) const {
	TimeFields merged(*this);

	if (!merge_field(merged.year, fields.year) ||
		!merge_field(merged.month, fields.month) ||
		!merge_field(merged.day, fields.day) ||
		!merge_field(merged.weekday, fields.weekday) ||
		!merge_field(merged.hour, fields.hour) ||
		!merge_field(merged.minute, fields.minute)) {
		return optional<TimeFields>();
	}

	return merged;
}

bool TimeFields::operator==(const TimeFields &fields) const {
	return year == fields.year &&
		month == fields.month &&
		day == fields.day &&
		weekday == fields.weekday &&
		hour == fields.hour &&
		minute == fields.minute;
}

hash_t TimeFields::hash() const {
	hash_t h = hash_optional(year);
	h = hash_combine(h, hash_optional(month));
	h = hash_combine(h, hash_optional(day));
	h = hash_combine(h, hash_optional(weekday));
	h = hash_combine(h, hash_optional(hour));
	return hash_combine(h, hash_optional(minute));
}

PayloadRef TimeData::now() {
	return make_payload<TimeData>(TimeShift{0, Grain::Second, false}, TimeFields(), Grain::Second);
}

PayloadRef TimeData::relative(int64_t n, Grain grain, bool anchored) {
	return make_payload<TimeData>(
		TimeShift{n, grain, anchored}, TimeFields(), anchored ? grain : Grain::Second);
}

PayloadRef TimeData::with_fields(const TimeFields &fields) {
	const optional<Grain> grain = fields.grain();
	if (!grain) {
		return PayloadRef();
	}
	return make_payload<TimeData>(optional<TimeShift>(), fields, *grain);
}

PayloadRef TimeData::intersect(const TimeData &a, const TimeData &b) {
	if (a.interval_end || b.interval_end) {
		return PayloadRef();
	}
	if (a.shift && b.shift) {
		return PayloadRef();
	}

	const optional<TimeFields> fields = a.fields.intersect(b.fields);
	if (!fields) {
		return PayloadRef();
	}

	const optional<TimeShift> shift = a.shift ? a.shift : b.shift;
	if (shift) {
		// a shift fixes everything at or above its grain, so only finer
		// fields may be added ("tomorrow at 5pm", not "tomorrow in march").
		const optional<Grain> field_grain = fields->grain();
		if (!shift->anchored || !field_grain || !finer(*field_grain, shift->grain)) {
			return PayloadRef();
		}
		if (fields->year || fields->month || fields->day || fields->weekday) {
			return PayloadRef();
		}
	}

	return make_payload<TimeData>(shift, *fields, finest(a.grain, b.grain));
}

PayloadRef TimeData::interval(const TimeData &from, const TimeData &to) {
	if (from.interval_end || to.interval_end) {
		return PayloadRef();
	}
	return make_payload<TimeData>(
		from.shift, from.fields, from.grain, std::make_shared<const TimeData>(to));
}

bool TimeData::same(const Payload &payload) const {
	const TimeData *other = payload.as<TimeData>();
	if (!other) {
		return false;
	}
	if (!(shift == other->shift && fields == other->fields && grain == other->grain)) {
		return false;
	}
	if (bool(interval_end) != bool(other->interval_end)) {
		return false;
	}
	return !interval_end || interval_end->same(*other->interval_end);
}

hash_t TimeData::hash() const {
	hash_t h = hash_pair(time_hash, fields.hash());
	if (shift) {
		h = hash_combine(h, std::hash<int64_t>()(shift->n));
		h = hash_combine(h, hash_t(shift->grain) * 2 + (shift->anchored ? 1 : 0));
	}
	h = hash_combine(h, hash_t(grain));
	if (interval_end) {
		h = hash_combine(h, interval_end->hash());
	}
	return h;
}

std::string TimeData::debugform() const {
	std::ostringstream s;
	s << "Time[";
	if (shift) {
		s << (shift->n >= 0 ? "+" : "") << shift->n << " " << grain_name(shift->grain);
		if (shift->anchored) {
			s << " anchored";
		}
		s << "; ";
	}
	if (fields.year) s << "y" << *fields.year << " ";
	if (fields.month) s << "m" << *fields.month << " ";
	if (fields.day) s << "d" << *fields.day << " ";
	if (fields.weekday) s << "wd" << *fields.weekday << " ";
	if (fields.hour) s << "h" << *fields.hour << " ";
	if (fields.minute) s << "min" << *fields.minute << " ";
	s << "grain " << grain_name(grain);
	if (interval_end) {
		s << " to " << interval_end->debugform();
	}
	s << "]";
	return s.str();
}
