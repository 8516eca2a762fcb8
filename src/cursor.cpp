#include "cursor.hpp"

#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/ErrorHandling.h"

using namespace std;

Cursor::Cursor(llvm::StringRef text) : input_(text) {
	const llvm::UTF8* begin = input_.bytes_begin();
	const llvm::UTF8* p = begin;

	if (not llvm::isLegalUTF8String(&p, input_.bytes_end()))
		throw EncodingError("invalid UTF-8 sequence at offset " + to_string(p - begin), p - begin);
}

llvm::Optional<char32_t> Cursor::peekNext() {
	if (not next_)
		next_ = this->decode(nextLength_);

	return next_;
}

llvm::Optional<char32_t> Cursor::next() {
	llvm::Optional<char32_t> c;

	if (next_) {
		c = next_;
		next_ = llvm::None;
	} else {
		size_t length;
		c = this->decode(length);
	}

	if (c)
		this->advancePosition(*c);

	return c;
}

llvm::StringRef Cursor::sliceFromMarker() const {
	if (not this->hasMarker())
		llvm::report_fatal_error("sliceFromMarker called without a marker");

	return input_.slice(*marker_, this->offset());
}

llvm::Optional<char32_t> Cursor::decode(size_t& length) {
	length = 0;

	if (i_ == input_.size())
		return llvm::None;

	const llvm::UTF8* begin = input_.bytes_begin() + i_;
	const llvm::UTF8* p = begin;
	llvm::UTF32 c;

	if (llvm::convertUTF8Sequence(&p, input_.bytes_end(), &c, llvm::strictConversion) != llvm::conversionOK)
		throw EncodingError("invalid UTF-8 sequence at offset " + to_string(i_), i_);

	length = p - begin;
	i_ += length;

	return char32_t(c);
}

void Cursor::advancePosition(char32_t c) {
	switch (c) {
		case U'\r':
			lastWasCr_ = true;
			pos_.advanceLine();
			break;
		case U'\n':
			// second half of a CRLF pair
			if (not lastWasCr_)
				pos_.advanceLine();
			lastWasCr_ = false;
			break;
		case U'\v':
			pos_.feedLine();
			lastWasCr_ = false;
			break;
		case U'\f':
		case U'\x85': // next line
		case U'\x2028': // line separator
		case U'\x2029': // paragraph separator
			lastWasCr_ = false;
			pos_.advanceLine();
			break;
		default:
			lastWasCr_ = false;
			pos_.advanceChar();
	}
}
