#include <string>
#include <vector>

#include "RoughTokenizer.hpp"
#include "lexical_attributes.hpp"
#include "token_t.hpp"
#include "utils.hpp"

namespace sentseg {

enum char_class_t {
  WORD_CHAR,
  PUNCT_CHAR,
  SPACE_CHAR,
  NEWLINE_CHAR
};

static char_class_t classify_char(codepoint_t c, std::string const &utf8) {
  if (c == '\n')
    return NEWLINE_CHAR;
  if (is_whitespace(c))
    return SPACE_CHAR;
  if (is_punct_text(utf8))
    return PUNCT_CHAR;
  return WORD_CHAR;
}

void RoughTokenizer::push_token(std::string const &text,
                                std::vector<token_t> &tokens) const {
  tokens.push_back(token_t());
  token_t &token = tokens.back();
  token.text = text;
  set_lexical_attributes(token);
}

void RoughTokenizer::push_whitespace(std::string const &text,
                                     std::vector<token_t> &tokens) const {
  // The first space goes to the preceding token, the rest of the run
  // becomes a token of its own.
  if ((text[0] == ' ') && !tokens.empty() && tokens.back().whitespace.empty()) {
    tokens.back().whitespace = " ";
    if (text.size() > 1) {
      push_token(text.substr(1), tokens);
    }
  } else {
    push_token(text, tokens);
  }
}

void RoughTokenizer::tokenize(std::string const &text,
                              std::vector<token_t> &tokens) const {
  char const *data = text.data();
  size_t length = text.length();

  size_t offset = 0;
  // Start of the run we are currently in and its class.
  size_t run_start = 0;
  char_class_t run_class = WORD_CHAR;
  bool in_run = false;

  while (offset < length) {
    size_t char_start = offset;
    codepoint_t c = utf8char_to_unicode(data, length, offset);
    char_class_t char_class =
        classify_char(c, text.substr(char_start, offset - char_start));

    // Only words and non-newline whitespace form runs.
    if (in_run && (char_class == run_class)
        && ((char_class == WORD_CHAR) || (char_class == SPACE_CHAR))) {
      continue;
    }

    if (in_run) {
      std::string run = text.substr(run_start, char_start - run_start);
      if (run_class == SPACE_CHAR) {
        push_whitespace(run, tokens);
      } else {
        push_token(run, tokens);
      }
    }

    run_start = char_start;
    run_class = char_class;
    in_run = true;
  }

  if (in_run) {
    std::string run = text.substr(run_start, length - run_start);
    if (run_class == SPACE_CHAR) {
      push_whitespace(run, tokens);
    } else {
      push_token(run, tokens);
    }
  }
}

}
