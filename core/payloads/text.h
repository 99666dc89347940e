#ifndef CDUCKLING_TEXT_H
#define CDUCKLING_TEXT_H

#include "core/payload.h"

// the capture groups of a regex pattern item. such payloads only live in
// the transient tokens handed to productions, never in the pool.
class GroupMatchData : public Payload {
public:
	const std::vector<std::string> groups;

	inline GroupMatchData(std::vector<std::string> &&groups_) :
		Payload(Dimension::RegexMatch), groups(std::move(groups_)) {
	}

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

// the form matched by a literal set item and the value it maps to.
class LiteralData : public Payload {
public:
	const std::string text;
	const int64_t value;

	inline LiteralData(const std::string &text_, int64_t value_) :
		Payload(Dimension::RegexMatch), text(text_), value(value_) {
	}

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

// a value that resolves to its own normalized text: emails, urls and
// phone numbers.
class TextData : public Payload {
public:
	const std::string value;

	inline TextData(Dimension dimension, const std::string &value_) :
		Payload(dimension), value(value_) {
	}

	virtual bool same(const Payload &payload) const;

	virtual hash_t hash() const;

	virtual std::string debugform() const;
};

#endif // CDUCKLING_TEXT_H
