#ifndef TOKEN_T_INCLUDE_GUARD
#define TOKEN_T_INCLUDE_GUARD

#include <string>
#include <vector>

namespace sentseg {

// The sentence boundary decision taken for a token.
enum sent_start_t {
	SENT_UNSET = 0,
	SENT_START = 1,
	SENT_CONTINUE = -1
};

struct token_t {
	token_t(): is_space(false), is_digit(false), is_punct(false),
	           excluded(false) {}

	//The text of the token.
	std::string text;
	//The whitespace following the token which is not a token of its own.
	std::string whitespace;
	//Lexical classification of the text.
	bool is_space;
	bool is_digit;
	bool is_punct;
	//Coarse case/pattern signature of the text (e.g. "Xxxx", "dd").
	std::string shape;
	//Whether an upstream pass marked the token as outside of the prose
	//(header or footer fragments, etc...).
	bool excluded;
};

struct document_t {
	document_t(): tokens(), sent_starts() {}

	//The name under which the document is reported.
	std::string name;
	//Where the document was read from and where its output goes.
	std::string input_path, output_path;
	std::vector<token_t> tokens;
	//One decision per token, filled in by the classifier.
	std::vector<sent_start_t> sent_starts;
};

}
#endif
