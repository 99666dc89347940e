#ifndef CDUCKLING_VALUE_H
#define CDUCKLING_VALUE_H

#include <map>

#include "core/types.h"
#include "core/token.h"
#include "core/options.h"
#include "core/context.h"
#include "core/resolve/time.h"

// the caller-facing value of a resolved token.
class ResolvedValue {
public:
	const Dimension dimension;

	inline ResolvedValue(Dimension dimension_) : dimension(dimension_) {
	}

	virtual ~ResolvedValue() {
	}

	// a JSON rendering, e.g. {"type": "value", "value": 21}.
	virtual std::string format() const = 0;

	template<typename T>
	inline const T *as() const {
		return dynamic_cast<const T*>(this);
	}
};

using ResolvedValueRef = std::shared_ptr<const ResolvedValue>;

class NumberValue : public ResolvedValue {
public:
	const double value;

	inline NumberValue(double value_) : ResolvedValue(Dimension::Numeral), value(value_) {
	}

	virtual std::string format() const;
};

class OrdinalValue : public ResolvedValue {
public:
	const int64_t value;

	inline OrdinalValue(int64_t value_) : ResolvedValue(Dimension::Ordinal), value(value_) {
	}

	virtual std::string format() const;
};

// distance, temperature, volume, quantity and money.
class MeasureValue : public ResolvedValue {
public:
	const double value;
	const std::string unit;
	const optional<std::string> product;

	inline MeasureValue(
		Dimension dimension,
		double value_,
		const std::string &unit_,
		const optional<std::string> &product_) :

		ResolvedValue(dimension),
		value(value_),
		unit(unit_),
		product(product_) {
	}

	virtual std::string format() const;
};

class TextValue : public ResolvedValue {
public:
	const std::string value;

	inline TextValue(Dimension dimension, const std::string &value_) :
		ResolvedValue(dimension), value(value_) {
	}

	virtual std::string format() const;
};

class GrainValue : public ResolvedValue {
public:
	const Grain grain;

	inline GrainValue(Grain grain_) : ResolvedValue(Dimension::TimeGrain), grain(grain_) {
	}

	virtual std::string format() const;
};

class DurationValue : public ResolvedValue {
public:
	const double value;
	const Grain grain;

	// the nominal length, see grain_seconds().
	const double seconds;

	inline DurationValue(double value_, Grain grain_, double seconds_) :
		ResolvedValue(Dimension::Duration), value(value_), grain(grain_), seconds(seconds_) {
	}

	virtual std::string format() const;
};

class TimeValue : public ResolvedValue {
public:
	const std::vector<TimeInterval> candidates;

	// true for "from ... to ..." expressions.
	const bool interval;

	inline TimeValue(std::vector<TimeInterval> &&candidates_, bool interval_) :
		ResolvedValue(Dimension::Time), candidates(std::move(candidates_)), interval(interval_) {
	}

	virtual std::string format() const;
};

// turns a payload into its resolved value, or returns null if the
// payload does not stand for a complete value.
using ValueConverter = std::function<ResolvedValueRef(
	const Payload &payload,
	const ResolutionContext &context,
	const EngineOptions &options)>;

// one conversion per dimension. new dimensions plug in their own.
class ValueConverters {
private:
	std::map<Dimension, ValueConverter> m_converters;

public:
	void add(Dimension dimension, const ValueConverter &converter);

	bool contains(Dimension dimension) const;

	// null if the dimension has no conversion or the conversion declines.
	ResolvedValueRef convert(
		const Token &token,
		const ResolutionContext &context,
		const EngineOptions &options) const;

	// conversions for all built-in dimensions.
	static ValueConverters defaults();
};

std::string json_quote(const std::string &s);

std::string json_number(double value);

#endif // CDUCKLING_VALUE_H
