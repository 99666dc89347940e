#ifndef CDUCKLING_TOKEN_H
#define CDUCKLING_TOKEN_H

#include "types.h"
#include "payload.h"

// a typed value discovered over a span of the document. tokens never
// change after creation.
class Token {
public:
	const Span span;
	const PayloadRef payload;

	// provenance: the rule that produced this token (null for the
	// transient capture tokens of text pattern items) and the pass.
	const Rule * const rule;
	const uint16_t pass;

	const bool latent;

	inline Token(
		const Span &span_,
		const PayloadRef &payload_,
		const Rule *rule_ = nullptr,
		uint16_t pass_ = 0,
		bool latent_ = false) :

		span(span_),
		payload(payload_),
		rule(rule_),
		pass(pass_),
		latent(latent_) {
	}

	inline Dimension dimension() const {
		return payload->dimension();
	}

	template<typename T>
	inline const T *as() const {
		return payload->as<T>();
	}

	// identity is (span, dimension, payload); provenance is ignored.
	inline bool same(const Token &token) const {
		return span == token.span &&
			dimension() == token.dimension() &&
			payload->same(*token.payload);
	}

	inline hash_t hash() const {
		hash_t h = hash_pair(hash_t(span.begin), hash_t(span.end));
		h = hash_combine(h, hash_t(dimension()));
		return hash_combine(h, payload->hash());
	}

	std::string debugform() const;
};

#endif // CDUCKLING_TOKEN_H
