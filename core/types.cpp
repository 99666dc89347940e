#include "types.h"

#include <mutex>
#include <unordered_map>

namespace {

struct ExtensionDimensions {
	std::mutex mutex;
	std::vector<std::string> names;
	std::unordered_map<std::string, Dimension> by_name;
};

ExtensionDimensions &extension_dimensions() {
	static ExtensionDimensions extensions;
	return extensions;
}

const char *builtin_dimension_name(Dimension dimension) {
	switch (dimension) {
		case Dimension::Numeral:
			return "number";
		case Dimension::Ordinal:
			return "ordinal";
		case Dimension::Time:
			return "time";
		case Dimension::TimeGrain:
			return "time-grain";
		case Dimension::Duration:
			return "duration";
		case Dimension::Distance:
			return "distance";
		case Dimension::Temperature:
			return "temperature";
		case Dimension::Volume:
			return "volume";
		case Dimension::Quantity:
			return "quantity";
		case Dimension::Finance:
			return "amount-of-money";
		case Dimension::PhoneNumber:
			return "phone-number";
		case Dimension::Email:
			return "email";
		case Dimension::Url:
			return "url";
		case Dimension::RegexMatch:
			return "regex";
		default:
			return nullptr;
	}
}

} // namespace

const char *dimension_name(Dimension dimension) {
	const char *name = builtin_dimension_name(dimension);
	if (name) {
		return name;
	}

	const size_t index = size_t(dimension);
	const size_t first = size_t(Dimension::FirstExtension);

	ExtensionDimensions &extensions = extension_dimensions();
	std::lock_guard<std::mutex> lock(extensions.mutex);
	if (index >= first && index - first < extensions.names.size()) {
		// names are never removed, so the pointer stays valid.
		return extensions.names[index - first].c_str();
	}

	throw UnhandledVariantError("unknown dimension " + std::to_string(index));
}

optional<Dimension> dimension_from_name(const std::string &name) {
	for (size_t i = 0; i < size_t(Dimension::FirstExtension); i++) {
		const char *builtin = builtin_dimension_name(Dimension(i));
		if (builtin && name == builtin) {
			return Dimension(i);
		}
	}

	ExtensionDimensions &extensions = extension_dimensions();
	std::lock_guard<std::mutex> lock(extensions.mutex);
	const auto i = extensions.by_name.find(name);
	if (i != extensions.by_name.end()) {
		return i->second;
	}

	return optional<Dimension>();
}

Dimension register_dimension(const std::string &name) {
	for (size_t i = 0; i < size_t(Dimension::FirstExtension); i++) {
		const char *builtin = builtin_dimension_name(Dimension(i));
		if (builtin && name == builtin) {
			return Dimension(i);
		}
	}

	ExtensionDimensions &extensions = extension_dimensions();
	std::lock_guard<std::mutex> lock(extensions.mutex);

	const auto i = extensions.by_name.find(name);
	if (i != extensions.by_name.end()) {
		return i->second;
	}

	const size_t index = size_t(Dimension::FirstExtension) + extensions.names.size();
	if (index >= MaxDimensions) {
		throw RuleSetError("too many dimensions registered, cannot add " + name);
	}

	// reserve first, so c_str() pointers handed out earlier survive the push_back.
	extensions.names.reserve(MaxDimensions);
	extensions.names.push_back(name);
	const Dimension dimension = Dimension(index);
	extensions.by_name[name] = dimension;
	return dimension;
}
