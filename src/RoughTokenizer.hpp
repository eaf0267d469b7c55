#ifndef ROUGH_TOKENIZER_INCLUDE_GUARD
#define ROUGH_TOKENIZER_INCLUDE_GUARD

#include <string>
#include <vector>

#include "token_t.hpp"

namespace sentseg {

/* RoughTokenizer cuts UTF-8 text into the tokens consumed by the sentence
   boundary classifier and fills out their lexical attributes. Runs of
   letters and digits make up words, every punctuation character is a token
   of its own and every newline character is a separate space token "\n".
   A single space after a token is kept as the token's trailing whitespace,
   any other whitespace becomes a space token. */
class RoughTokenizer {

public:
    RoughTokenizer() {}

    // tokenize appends the tokens of text to tokens. Throws
    // std::domain_error if text is not valid UTF-8.
    void tokenize(std::string const &text,
                  std::vector<token_t> &tokens) const;

    std::vector<token_t> tokenize(std::string const &text) const {
        std::vector<token_t> tokens;
        tokenize(text, tokens);
        return tokens;
    }

private:
    void push_token(std::string const &text,
                    std::vector<token_t> &tokens) const;
    void push_whitespace(std::string const &text,
                         std::vector<token_t> &tokens) const;
};

}

#endif
