#include "cursor.hpp"
#include "tools.hpp"

#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <string>

using namespace std;

/* Dumps */

/// Print "line,column,char" for each codepoint
void dumpChars(Cursor& x, llvm::raw_ostream& out) {
	for (char32_t c: x)
		out << x.position().line << ',' << x.position().column << ',' << escape(c) << '\n';
}

/// Print "line,column,word" for each run of non-blank codepoints
void dumpWords(Cursor& x, llvm::raw_ostream& out) {
	for (llvm::Optional<char32_t> c; (c = x.peekNext());) {
		if (isBlank(*c)) {
			x.next();
			continue;
		}

		Position start = x.position();
		x.setMarker();

		while ((c = x.peekNext()) and not isBlank(*c))
			x.next();

		out << start.line << ',' << start.column << ',' << x.sliceFromMarker() << '\n';
	}

	x.clearMarker();
}

/// Print "line,text" for each line, without its terminator
void dumpLines(Cursor& x, llvm::raw_ostream& out) {
	Counter line = x.position().line;
	x.setMarker();

	while (true) {
		llvm::Optional<char32_t> c = x.peekNext();

		if (c and not isLineBreak(*c)) {
			x.next();
			continue;
		}

		// no line after a final terminator
		if (c or not x.sliceFromMarker().empty())
			out << line << ',' << x.sliceFromMarker() << '\n';

		if (not c)
			break;

		x.next();
		if (*c == '\r' and x.peekNext() == U'\n')
			x.next();

		line = x.position().line;
		x.setMarker();
	}

	x.clearMarker();
}

/* chscn */

enum flags {
	chars,
	words,
	lines,
	nocolor,
	none
};

flags hashflag(const string& str) {
	if (str == "-chars") return chars;
	if (str == "-words") return words;
	if (str == "-lines") return lines;
	if (str == "-nocolor") return nocolor;
	return none;
}

int main(int argc, char* argv[]) {
	flags mode = chars;
	bool colorflag = true;
	string filename;

	for (int i = 1; i < argc; ++i)
		switch (flags f = hashflag(argv[i])) {
			case chars:
			case words:
			case lines: mode = f; break;
			case nocolor: colorflag = false; break;
			default: filename = argv[i];
		}

	if (filename.empty()) {
		llvm::WithColor::error(llvm::errs(), "chscn", not colorflag) << "no input file\n";
		return 1;
	}

	llvm::ErrorOr<unique_ptr<llvm::MemoryBuffer>> buffer = llvm::MemoryBuffer::getFileOrSTDIN(filename);

	if (not buffer) {
		llvm::WithColor::error(llvm::errs(), "chscn", not colorflag)
			<< filename << ": " << buffer.getError().message() << '\n';
		return 1;
	}

	try {
		Cursor x((*buffer)->getBuffer());

		switch (mode) {
			case words: dumpWords(x, llvm::outs()); break;
			case lines: dumpLines(x, llvm::outs()); break;
			default: dumpChars(x, llvm::outs());
		}
	} catch (const EncodingError& e) {
		llvm::WithColor::error(llvm::errs(), "chscn", not colorflag) << filename << ": " << e.what() << '\n';
		return 1;
	}

	return 0;
}
