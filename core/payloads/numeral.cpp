#include "numeral.h"

#include <sstream>

bool NumeralData::same(const Payload &payload) const {
	const NumeralData *other = payload.as<NumeralData>();
	return other &&
		value == other->value &&
		grain == other->grain &&
		multipliable == other->multipliable;
}

hash_t NumeralData::hash() const {
	hash_t h = hash_pair(numeral_hash, hash_mpq(value));
	h = hash_combine(h, grain ? hash_t(*grain + 1) : 0);
	return hash_combine(h, multipliable ? 1 : 0);
}

std::string NumeralData::debugform() const {
	std::ostringstream s;
	s << "Numeral[" << value.get_str();
	if (grain) {
		s << ", grain " << *grain;
	}
	if (multipliable) {
		s << ", multipliable";
	}
	s << "]";
	return s.str();
}

bool OrdinalData::same(const Payload &payload) const {
	const OrdinalData *other = payload.as<OrdinalData>();
	return other && value == other->value;
}

hash_t OrdinalData::hash() const {
	return hash_pair(ordinal_hash, std::hash<int64_t>()(value));
}

std::string OrdinalData::debugform() const {
	std::ostringstream s;
	s << "Ordinal[" << value << "]";
	return s.str();
}
