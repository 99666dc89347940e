#include "document.h"

#include <sstream>

#include "unicode/uchar.h"
#include "unicode/ustring.h"
#include "unicode/normalizer2.h"
#include "unicode/errorcode.h"

void check_status(const UErrorCode &status, const char *err) {
	if (U_FAILURE(status)) {
		icu::ErrorCode code;
		code.set(status);
		std::ostringstream s;
		s << err << ": " << code.errorName();
		throw std::runtime_error(s.str());
	}
}

namespace {

enum {
	LetterClass = -1,
	DigitClass = -2
};

inline UChar32 char_class(UChar32 c) {
	if (u_islower(c) || u_isupper(c)) {
		return LetterClass;
	} else if (u_isdigit(c)) {
		return DigitClass;
	} else {
		return c;
	}
}

void check_utf8(const std::string &utf8) {
	UErrorCode status = U_ZERO_ERROR;
	int32_t length = 0;

	// preflight only; we just want to know if the input is well-formed.
	u_strFromUTF8(nullptr, 0, &length, utf8.data(), int32_t(utf8.size()), &status);

	if (status == U_INVALID_CHAR_FOUND || status == U_ILLEGAL_CHAR_FOUND) {
		throw MalformedTextError("document is not valid UTF-8");
	}
}

} // namespace

Document::Document(const std::string &utf8) {
	check_utf8(utf8);

	UErrorCode status = U_ZERO_ERROR;

	const icu::Normalizer2 *norm = icu::Normalizer2::getNFCInstance(status);
	check_status(status, "Normalizer2::getNFCInstance failed");

	m_text = norm->normalize(
		icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), int32_t(utf8.size()))), status);
	check_status(status, "Normalizer2::normalize failed");
}

std::string Document::utf8() const {
	std::string s;
	m_text.toUTF8String(s);
	return s;
}

std::string Document::utf8(const Span &span) const {
	std::string s;
	icu::UnicodeString slice(m_text, span.begin, span.length());
	slice.toUTF8String(s);
	return s;
}

bool Document::is_space(index_t offset) const {
	return offset >= 0 && offset < m_text.length() && u_isUWhiteSpace(m_text.char32At(offset));
}

index_t Document::skip_spaces(index_t offset) const {
	const index_t n = m_text.length();
	while (offset < n && u_isUWhiteSpace(m_text.char32At(offset))) {
		offset = m_text.moveIndex32(offset, 1);
	}
	return offset;
}

bool Document::is_space_run(index_t begin, index_t end) const {
	return skip_spaces(begin) >= end;
}

bool Document::is_valid_start(index_t begin) const {
	if (begin <= 0) {
		return true;
	}
	if (begin >= m_text.length()) {
		return false;
	}
	// char32At on a trail surrogate yields the whole code point.
	return char_class(m_text.char32At(begin - 1)) != char_class(m_text.char32At(begin));
}

bool Document::is_valid_end(index_t end) const {
	if (end >= m_text.length()) {
		return true;
	}
	if (end <= 0) {
		return false;
	}
	return char_class(m_text.char32At(end - 1)) != char_class(m_text.char32At(end));
}

bool Document::is_valid_range(index_t begin, index_t end) const {
	return begin < end && is_valid_start(begin) && is_valid_end(end);
}

index_t Document::code_points_before(index_t offset) const {
	return m_text.countChar32(0, offset);
}
