#ifndef TOOLS_H
#define TOOLS_H

#include "llvm/Support/ConvertUTF.h"

#include <string>

/*
 * State whether a codepoint ends a line
 *
 * @example isLineBreak('\n') -> true
 * @example isLineBreak(0x2028) -> true
 */
static bool isLineBreak(char32_t c) {
	switch (c) {
		case '\n': case '\v': case '\f': case '\r':
		case 0x85: case 0x2028: case 0x2029:
			return true;
		default:
			return false;
	}
}

/*
 * State whether a codepoint separates words
 *
 * @example isBlank('\t') -> true
 * @example isBlank('_') -> false
 */
static bool isBlank(char32_t c) {
	return c == ' ' or c == '\t' or isLineBreak(c);
}

/*
 * Convert a char into its "\xhh" hexadecimal representation
 *
 * @example char2hex('\n') -> "\\x0a"
 */
static std::string char2hex(unsigned char c) {
	std::string s = "\\x00";

	char d = c / 16;
	s[2] = d + (d < 10 ? '0' : 'a' - 10);
	d = c % 16;
	s[3] = d + (d < 10 ? '0' : 'a' - 10);

	return s;
}

/*
 * Convert a codepoint into its UTF-8 encoding
 *
 * @example encode(0xe9) -> "\xc3\xa9"
 * @remark Codepoints outside of Unicode are encoded as U+FFFD.
 */
static std::string encode(char32_t c) {
	char buffer[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
	char* p = buffer;

	if (not llvm::ConvertCodePointToUTF8(c, p))
		return "\xef\xbf\xbd";

	return std::string(buffer, p);
}

/*
 * Convert a codepoint into a printable representation
 *
 * @example escape('a') -> "a"
 * @example escape('\r') -> "\\x0d"
 * @example escape(0x2028) -> "\\u2028"
 */
static std::string escape(char32_t c) {
	if (c < 0x20 or (c >= 0x7f and c < 0xa0))
		return char2hex(c);
	else if (c == 0x2028)
		return "\\u2028";
	else if (c == 0x2029)
		return "\\u2029";

	return encode(c);
}

#endif
