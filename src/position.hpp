#ifndef POSITION_H
#define POSITION_H

#include <cstdint>
#include <string>

/// Base type for line and column numbers
typedef uint32_t Counter;

/**
 * Position in a text by line and column numbers
 *
 * @remark A default constructed position (0, 0) is not located in any text. Counters
 * saturate at their maximum value.
 */
struct Position {
	/* Constructors */
	Position() {}
	Position(Counter line, Counter column) : line(line), column(column) {}

	/* Methods */

	/// Advance by one (non new-line) character
	void advanceChar();

	/// Advance by one line, setting the column to the first character of the new line
	void advanceLine();

	/// Advance by one line, keeping the column
	void feedLine();

	/// Produce the "line:column" representation
	std::string toString() const;

	/* Operators */
	bool operator ==(const Position& x) const { return line == x.line and column == x.column; }
	bool operator !=(const Position& x) const { return not (*this == x); }
	bool operator <(const Position& x) const {
		return line < x.line or (line == x.line and column < x.column);
	}

	/* Variables */
	Counter line = 0; ///< line number (starts counting with 1)
	Counter column = 0; ///< character number within the line (starts counting with 1)
};

#endif
