#include "options.h"

#include <cerrno>
#include <cstdlib>

namespace {

size_t parse_size(const std::string &key, const std::string &value) {
	if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
		throw OptionsError("option " + key + " expects a non-negative integer, got \"" + value + "\"");
	}
	errno = 0;
	const unsigned long long n = std::strtoull(value.c_str(), nullptr, 10);
	if (errno == ERANGE) {
		throw OptionsError("option " + key + " is out of range: " + value);
	}
	return size_t(n);
}

bool parse_bool(const std::string &key, const std::string &value) {
	if (value == "true" || value == "1" || value == "yes") {
		return true;
	} else if (value == "false" || value == "0" || value == "no") {
		return false;
	} else {
		throw OptionsError("option " + key + " expects true or false, got \"" + value + "\"");
	}
}

} // namespace

const std::vector<EngineOptions::Option> &EngineOptions::meta() {
	static const std::vector<Option> options = {
		{"max_passes", [] (EngineOptions &o, const std::string &v) {
			o.max_passes = parse_size("max_passes", v);
		}},
		{"max_invocations", [] (EngineOptions &o, const std::string &v) {
			o.max_invocations = parse_size("max_invocations", v);
		}},
		{"parallel", [] (EngineOptions &o, const std::string &v) {
			o.parallel = parse_bool("parallel", v);
		}},
		{"adjacency", [] (EngineOptions &o, const std::string &v) {
			if (v == "strict") {
				o.adjacency = Adjacency::Strict;
			} else if (v == "whitespace") {
				o.adjacency = Adjacency::Whitespace;
			} else {
				throw OptionsError("option adjacency expects strict or whitespace, got \"" + v + "\"");
			}
		}},
		{"tie_break", [] (EngineOptions &o, const std::string &v) {
			if (v == "declaration") {
				o.tie_break = TieBreak::DeclarationOrder;
			} else if (v == "reverse_declaration") {
				o.tie_break = TieBreak::ReverseDeclarationOrder;
			} else {
				throw OptionsError("option tie_break expects declaration or reverse_declaration, got \"" + v + "\"");
			}
		}},
		{"with_latent", [] (EngineOptions &o, const std::string &v) {
			o.with_latent = parse_bool("with_latent", v);
		}},
		{"cross_dimension_overlap", [] (EngineOptions &o, const std::string &v) {
			o.cross_dimension_overlap = parse_bool("cross_dimension_overlap", v);
		}},
		{"max_time_candidates", [] (EngineOptions &o, const std::string &v) {
			o.max_time_candidates = parse_size("max_time_candidates", v);
		}},
		{"trace", [] (EngineOptions &o, const std::string &v) {
			o.trace = parse_bool("trace", v);
		}}
	};

	return options;
}

void EngineOptions::set(const std::string &key, const std::string &value) {
	for (const Option &option : meta()) {
		if (key == option.name) {
			option.set(*this, value);
			return;
		}
	}
	throw OptionsError("unknown option " + key);
}

EngineOptions EngineOptions::parse(const std::vector<std::string> &settings) {
	EngineOptions options;
	for (const std::string &setting : settings) {
		const auto eq = setting.find('=');
		if (eq == std::string::npos) {
			throw OptionsError("expected key=value, got \"" + setting + "\"");
		}
		options.set(setting.substr(0, eq), setting.substr(eq + 1));
	}
	return options;
}

EngineOptions EngineOptions::parse(const std::map<std::string, std::string> &settings) {
	EngineOptions options;
	for (const auto &setting : settings) {
		options.set(setting.first, setting.second);
	}
	return options;
}
