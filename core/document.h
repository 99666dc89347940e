#ifndef CDUCKLING_DOCUMENT_H
#define CDUCKLING_DOCUMENT_H

#include <string>
#include "unicode/unistr.h"

#include "types.h"

void check_status(const UErrorCode &status, const char *err);

// the text of one parse request, NFC-normalized. all spans handed out
// by the engine index into this normalized text.
class Document {
private:
	icu::UnicodeString m_text;

public:
	explicit Document(const std::string &utf8);

	inline const icu::UnicodeString &unicode() const {
		return m_text;
	}

	inline index_t length() const {
		return m_text.length();
	}

	std::string utf8() const;

	std::string utf8(const Span &span) const;

	bool is_space(index_t offset) const;

	// first offset >= the given one that is not white space.
	index_t skip_spaces(index_t offset) const;

	// true if [begin, end) consists of white space only (or is empty).
	bool is_space_run(index_t begin, index_t end) const;

	// a match may neither start nor end in the middle of a run of
	// letters or a run of digits.
	bool is_valid_range(index_t begin, index_t end) const;

	bool is_valid_start(index_t begin) const;

	bool is_valid_end(index_t end) const;

	// number of code points in [0, offset).
	index_t code_points_before(index_t offset) const;
};

#endif // CDUCKLING_DOCUMENT_H
