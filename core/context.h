#ifndef CDUCKLING_CONTEXT_H
#define CDUCKLING_CONTEXT_H

#include "unicode/utypes.h"

#include "types.h"

// what a parse request is resolved against. read only during a parse.
struct ResolutionContext {
	std::string locale = "en";

	// milliseconds since 1970-01-01 UTC.
	UDate reference = 0;

	// an ICU time zone id such as "Europe/Oslo".
	std::string timezone = "UTC";

	// empty means all dimensions.
	DimensionSet dimensions;
};

#endif // CDUCKLING_CONTEXT_H
