#ifndef CURSOR_H
#define CURSOR_H

#include "position.hpp"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cstddef>
#include <exception>
#include <iterator>
#include <string>

class EncodingError: public std::exception {
	public:
		EncodingError(const std::string& message, size_t offset) : message(message), offset_(offset) {};
		virtual const char* what() const throw() { return message.c_str(); };

		/// Byte offset of the first invalid sequence
		size_t offset() const { return offset_; };

	private:
		std::string message;
		size_t offset_;
};

/**
 * Cursor over a UTF-8 text, producing one codepoint at a time
 *
 * The cursor tracks the line and column of the next codepoint and allows to extract,
 * without copy, the text between a marker and the current reading position.
 *
 * @warning The cursor borrows the text. Neither the cursor nor the slices it returns
 * may outlive it.
 */
class Cursor {
	public:
		class iterator;

		/* Constructors */

		/**
		 * Wrap a text
		 *
		 * @throw EncodingError if the text is not valid UTF-8
		 */
		explicit Cursor(llvm::StringRef text);

		/* Methods */

		/// Return the next codepoint without consuming it, or None at the end of the text
		llvm::Optional<char32_t> peekNext();

		/// Consume and return the next codepoint, or None at the end of the text
		llvm::Optional<char32_t> next();

		/// Set the marker at the current reading position
		void setMarker() { marker_ = this->offset(); };
		void clearMarker() { marker_ = llvm::None; };
		bool hasMarker() const { return marker_.hasValue(); };

		/**
		 * Return the text from the marker up to (excluding) the current reading position
		 *
		 * @remark A peeked but not consumed codepoint is not part of the slice.
		 * @warning Calling it without a marker is a fatal error.
		 */
		llvm::StringRef sliceFromMarker() const;

		iterator begin();
		iterator end();

		/* Accessors */

		/// Position of the next codepoint returned by next()
		const Position& position() const { return pos_; };

		/// Byte offset of the reading position
		size_t offset() const { return next_ ? i_ - nextLength_ : i_; };

	private:
		/* Methods */
		llvm::Optional<char32_t> decode(size_t& length);
		void advancePosition(char32_t c);

		/* Variables */
		llvm::StringRef input_;
		size_t i_ = 0;
		Position pos_ = Position(1, 1);

		llvm::Optional<char32_t> next_;
		size_t nextLength_ = 0;

		llvm::Optional<size_t> marker_;
		bool lastWasCr_ = false;
};

/**
 * Single-pass iterator consuming a cursor
 *
 * @remark While an iterator is dereferenced, the cursor position is the position of the
 * dereferenced codepoint.
 */
class Cursor::iterator {
	public:
		typedef std::input_iterator_tag iterator_category;
		typedef char32_t value_type;
		typedef std::ptrdiff_t difference_type;
		typedef const char32_t* pointer;
		typedef char32_t reference;

		/* Constructors */
		iterator() {}
		explicit iterator(Cursor* x) : x_(x) {}

		/* Operators */
		char32_t operator *() const { return x_->peekNext().getValue(); };
		iterator& operator ++() { x_->next(); return *this; };

		bool operator ==(const iterator& y) const { return this->done() == y.done(); };
		bool operator !=(const iterator& y) const { return not (*this == y); };

	private:
		bool done() const { return not x_ or not x_->peekNext(); };

		Cursor* x_ = nullptr;
};

inline Cursor::iterator Cursor::begin() {
	return iterator(this);
}

inline Cursor::iterator Cursor::end() {
	return iterator();
}

#endif
