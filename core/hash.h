#ifndef CDUCKLING_HASH_H
#define CDUCKLING_HASH_H

#include <gmpxx.h>
#include <functional>
#include <cstdlib>

typedef size_t hash_t;

inline hash_t djb2(const char* str) {
	hash_t result = 5381;

	int c;
    while ((c = *str++)) {
        result = ((result << 5) + result) + c;
    }

    return result;
}

inline hash_t hash_combine(hash_t seed, const hash_t x) {
    // see boost::hash_combine
    seed ^= x + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

inline hash_t hash_pair(const hash_t x, const hash_t y) {
    // combines 2 hash values
	return hash_combine(hash_combine(0, x), y);
}

inline hash_t hash_mpz(const mpz_class &value) {
    std::hash<mp_limb_t> limb_hash;
    const mpz_srcptr x = value.get_mpz_t();
    const size_t n = std::abs(x->_mp_size);
    hash_t h = x->_mp_size < 0 ? 1 : 0;
    for (size_t i = 0; i < n; i++) {
        h = hash_combine(h, limb_hash(x->_mp_d[i]));
    }
    return h;
}

inline hash_t hash_mpq(const mpq_class &value) {
	// mpq_class is kept canonical, so equal values hash equally.
	return hash_pair(hash_mpz(value.get_num()), hash_mpz(value.get_den()));
}

constexpr hash_t numeral_hash = 0x3b2a8fe54c1a7d05;
constexpr hash_t ordinal_hash = 0x1d2e7a4469c30b17;
constexpr hash_t measure_hash = 0x5f81c3e0a4b2d6e9;
constexpr hash_t time_hash = 0x7c0d5a3b91e46f28;
constexpr hash_t duration_hash = 0x2ea4f61b8d0c5739;
constexpr hash_t grain_hash = 0x4b9e02d7c36a1f85;
constexpr hash_t text_hash = 0x6a17c5e2f0b8d943;

#endif
