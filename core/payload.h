#ifndef CDUCKLING_PAYLOAD_H
#define CDUCKLING_PAYLOAD_H

#include "types.h"
#include "hash.h"

// the dimension-specific content of a token. payloads are immutable
// and shared between tokens.
class Payload {
private:
	const Dimension m_dimension;

public:
	inline Payload(Dimension dimension) : m_dimension(dimension) {
	}

	virtual ~Payload() {
	}

	inline Dimension dimension() const {
		return m_dimension;
	}

	virtual bool same(const Payload &payload) const = 0;

	virtual hash_t hash() const = 0;

	virtual std::string debugform() const = 0;

	template<typename T>
	inline const T *as() const {
		return dynamic_cast<const T*>(this);
	}
};

template<typename T, typename... Args>
inline PayloadRef make_payload(Args&&... args) {
	return std::make_shared<const T>(std::forward<Args>(args)...);
}

#endif // CDUCKLING_PAYLOAD_H
