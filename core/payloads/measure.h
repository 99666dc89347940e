#ifndef CDUCKLING_MEASURE_H
#define CDUCKLING_MEASURE_H

#include <gmpxx.h>

#include "core/payload.h"

// an amount with a unit. used for distances, temperatures, volumes,
// quantities and amounts of money (where the unit is the currency).
// a measure may lack a value while it is still being composed, e.g.
// a bare "$" waiting for the number that follows.
class MeasureData : public Payload {
public:
	const optional<mpq_class> value;
	const std::string unit;
	const optional<std::string> product;

	inline MeasureData(
		Dimension dimension,
		const optional<mpq_class> &value_,
		const std::string &unit_,
		const optional<std::string> &product_ = optional<std::string>()) :

		Payload(dimension),
		value(value_),
		unit(unit_),
		product(product_) {
	}

	inline PayloadRef with_value(const mpq_class &v) const {
		return make_payload<MeasureData>(dimension(), v, unit, product);
	}

	inline PayloadRef with_unit(const std::string &u) const {
		return make_payload<MeasureData>(dimension(), value, u, product);
	}

	inline PayloadRef with_product(const std::string &p) const {
		return make_payload<MeasureData>(dimension(), value, unit, p);
	}

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

#endif // CDUCKLING_MEASURE_H
