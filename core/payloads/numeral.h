#ifndef CDUCKLING_NUMERAL_H
#define CDUCKLING_NUMERAL_H

#include <gmpxx.h>

#include "core/payload.h"

class NumeralData : public Payload {
public:
	const mpq_class value;

	// power of ten this numeral stands for as a magnitude word, e.g.
	// 2 for "hundred"; absent for plain numbers.
	const optional<int> grain;

	// true for magnitude words that may multiply a preceding number.
	const bool multipliable;

	inline NumeralData(
		const mpq_class &value_,
		const optional<int> &grain_ = optional<int>(),
		bool multipliable_ = false) :

		Payload(Dimension::Numeral),
		value(value_),
		grain(grain_),
		multipliable(multipliable_) {
	}

	inline double to_double() const {
		return value.get_d();
	}

	inline bool is_integer() const {
		return value.get_den() == 1;
	}

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

class OrdinalData : public Payload {
public:
	const int64_t value;

	inline OrdinalData(int64_t value_) : Payload(Dimension::Ordinal), value(value_) {
	}

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

#endif // CDUCKLING_NUMERAL_H
