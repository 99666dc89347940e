#include "text.h"

#include <sstream>

bool GroupMatchData::same(const Payload &payload) const {
	const GroupMatchData *other = payload.as<GroupMatchData>();
	return other && groups == other->groups;
}

hash_t GroupMatchData::hash() const {
	hash_t h = text_hash;
	for (const std::string &group : groups) {
		h = hash_combine(h, djb2(group.c_str()));
	}
	return h;
}

std::string GroupMatchData::debugform() const {
	std::ostringstream s;
	s << "GroupMatch[";
	for (size_t i = 0; i < groups.size(); i++) {
		if (i > 0) {
			s << ", ";
		}
		s << "\"" << groups[i] << "\"";
	}
	s << "]";
	return s.str();
}

bool LiteralData::same(const Payload &payload) const {
	const LiteralData *other = payload.as<LiteralData>();
	return other && text == other->text && value == other->value;
}

hash_t LiteralData::hash() const {
	return hash_combine(hash_pair(text_hash, djb2(text.c_str())), std::hash<int64_t>()(value));
}

std::string LiteralData::debugform() const {
	std::ostringstream s;
	s << "Literal[\"" << text << "\" -> " << value << "]";
	return s.str();
}

bool TextData::same(const Payload &payload) const {
	const TextData *other = payload.as<TextData>();
	return other && dimension() == other->dimension() && value == other->value;
}

hash_t TextData::hash() const {
	return hash_combine(hash_pair(text_hash, hash_t(dimension())), djb2(value.c_str()));
}

std::string TextData::debugform() const {
	std::ostringstream s;
	s << dimension_name(dimension()) << "[\"" << value << "\"]";
	return s.str();
}
