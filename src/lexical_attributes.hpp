#ifndef LEXICAL_ATTRIBUTES_INCLUDE_GUARD
#define LEXICAL_ATTRIBUTES_INCLUDE_GUARD

#include <string>

#include "token_t.hpp"

namespace sentseg {

/* Character classes are Unicode general categories matched by PCRE:
   a text is punctuation when all its characters are in \p{P} and it is
   a number when all its characters are decimal digits (\p{Nd}). The empty
   text belongs to no class. Throws std::domain_error if text is not valid
   UTF-8. */
bool is_punct_text(std::string const &text);
bool is_digit_text(std::string const &text);
bool is_space_text(std::string const &text);

/* Computes the shape of a word: uppercase and titlecase letters become 'X',
   other letters 'x', digits 'd' and other characters are kept. A shape
   character repeated more than four times in a row is cut short, so
   "Bonjour" gives "Xxxxx" and "12345" gives "dddd". */
std::string token_shape(std::string const &text);

// Fills out is_space, is_digit, is_punct and shape from the token's text.
void set_lexical_attributes(token_t &token);

}

#endif
