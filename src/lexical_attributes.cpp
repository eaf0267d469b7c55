#include <string>
#include <pcrecpp.h>

#include "lexical_attributes.hpp"
#include "utils.hpp"

using namespace std;

namespace sentseg {

namespace {

// The Unicode properties the attributes are computed from. Each regexp
// matches whole texts made of characters of one class.
struct unicode_classes_t {
  unicode_classes_t():
    upper("[\\p{Lu}\\p{Lt}]+", pcrecpp::UTF8()),
    letter("\\p{L}+", pcrecpp::UTF8()),
    digit("\\p{Nd}+", pcrecpp::UTF8()),
    punct("\\p{P}+", pcrecpp::UTF8())
  {}

  pcrecpp::RE upper;
  pcrecpp::RE letter;
  pcrecpp::RE digit;
  pcrecpp::RE punct;
};

unicode_classes_t const& unicode_classes() {
  static unicode_classes_t const classes;
  return classes;
}

// Validates text before it is handed to PCRE.
void check_utf8(string const &text) {
  size_t offset = 0;
  while (offset < text.length()) {
    utf8char_to_unicode(text.data(), text.length(), offset);
  }
}

}

bool is_punct_text(string const &text) {
  check_utf8(text);
  return unicode_classes().punct.FullMatch(text);
}

bool is_digit_text(string const &text) {
  check_utf8(text);
  return unicode_classes().digit.FullMatch(text);
}

bool is_space_text(string const &text) {
  ustring codepoints = utf8_to_unicode(text);
  if (codepoints.empty()) {
    return false;
  }
  for (ustring::const_iterator c = codepoints.begin();
       c != codepoints.end(); c++) {
    if (!is_whitespace(*c)) {
      return false;
    }
  }
  return true;
}

string token_shape(string const &text) {
  unicode_classes_t const &classes = unicode_classes();
  string shape;

  string last;
  int seq = 0;
  size_t offset = 0;
  while (offset < text.length()) {
    size_t char_start = offset;
    utf8char_to_unicode(text.data(), text.length(), offset);
    string character = text.substr(char_start, offset - char_start);

    string shape_char;
    if (classes.upper.FullMatch(character)) {
      shape_char = "X";
    } else if (classes.letter.FullMatch(character)) {
      shape_char = "x";
    } else if (classes.digit.FullMatch(character)) {
      shape_char = "d";
    } else {
      shape_char = character;
    }

    if (shape_char == last) {
      seq++;
    } else {
      seq = 0;
      last = shape_char;
    }
    if (seq < 4) {
      shape += shape_char;
    }
  }

  return shape;
}

void set_lexical_attributes(token_t &token) {
  token.is_space = is_space_text(token.text);
  token.is_digit = is_digit_text(token.text);
  token.is_punct = is_punct_text(token.text);
  token.shape = token_shape(token.text);
}

}
