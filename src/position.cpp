#include "position.hpp"

#include <limits>

using namespace std;

static void increment(Counter& c) {
	if (c != numeric_limits<Counter>::max())
		++c;
}

void Position::advanceChar() {
	increment(column);
}

void Position::advanceLine() {
	increment(line);
	column = 1;
}

void Position::feedLine() {
	increment(line);
}

string Position::toString() const {
	return to_string(line) + ":" + to_string(column);
}
