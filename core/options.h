#ifndef CDUCKLING_OPTIONS_H
#define CDUCKLING_OPTIONS_H

#include <map>

#include "types.h"

enum class Adjacency {
	// each pattern item starts exactly where the previous one ended.
	Strict,
	// items may also be separated by white space.
	Whitespace
};

// how two overlapping tokens of the same dimension and the same length
// are ordered when neither contains the other.
enum class TieBreak {
	DeclarationOrder,
	ReverseDeclarationOrder
};

struct EngineOptions {
	// 0 means no limit other than the number of rules.
	size_t max_passes = 0;

	// 0 means unlimited. counts (rule, offset) attempts.
	size_t max_invocations = 0;

	bool parallel = true;

	Adjacency adjacency = Adjacency::Whitespace;

	TieBreak tie_break = TieBreak::DeclarationOrder;

	bool with_latent = true;

	// keep partially overlapping tokens of different dimensions when more
	// than one dimension is requested. off, no two returned spans overlap
	// except for identical spans of different dimensions.
	bool cross_dimension_overlap = false;

	size_t max_time_candidates = 2;

	bool trace = false;

	struct Option {
		const char *name;
		std::function<void(EngineOptions&, const std::string&)> set;
	};

	static const std::vector<Option> &meta();

	// applies "key=value" settings on top of the defaults. throws
	// OptionsError on unknown keys or malformed values.
	static EngineOptions parse(const std::vector<std::string> &settings);

	static EngineOptions parse(const std::map<std::string, std::string> &settings);

	void set(const std::string &key, const std::string &value);
};

#endif // CDUCKLING_OPTIONS_H
