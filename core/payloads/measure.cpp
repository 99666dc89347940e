#include "measure.h"

#include <sstream>

bool MeasureData::same(const Payload &payload) const {
	const MeasureData *other = payload.as<MeasureData>();
	return other &&
		dimension() == other->dimension() &&
		value == other->value &&
		unit == other->unit &&
		product == other->product;
}

hash_t MeasureData::hash() const {
	hash_t h = hash_pair(measure_hash, hash_t(dimension()));
	h = hash_combine(h, value ? hash_mpq(*value) : 0);
	h = hash_combine(h, djb2(unit.c_str()));
	return hash_combine(h, product ? djb2(product->c_str()) : 0);
}

std::string MeasureData::debugform() const {
	std::ostringstream s;
	s << dimension_name(dimension()) << "[";
	if (value) {
		s << value->get_str() << " ";
	}
	s << unit;
	if (product) {
		s << " of " << *product;
	}
	s << "]";
	return s.str();
}
