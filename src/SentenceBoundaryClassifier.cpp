#include <string>
#include <vector>

#include "SentenceBoundaryClassifier.hpp"
#include "config_exception.hpp"
#include "token_t.hpp"

using namespace std;

namespace sentseg {

vector<string> default_punct_chars() {
  static char const *punct_chars[] = {
    "!", ".", "?", "\xD6\x89" /*։*/, "\xD8\x9F" /*؟*/, "\xDB\x94" /*۔*/,
    "\xDC\x80" /*܀*/, "\xDC\x81" /*܁*/, "\xDC\x82" /*܂*/,
    "\xE0\xA5\xA4" /*।*/, "\xE0\xA5\xA5" /*॥*/,
    "\xE1\x81\x8A" /*၊*/, "\xE1\x81\x8B" /*။*/,
    "\xE1\x8D\xA2" /*።*/, "\xE1\x8D\xA7" /*፧*/, "\xE1\x8D\xA8" /*፨*/,
    "\xE1\x99\xAE" /*᙮*/, "\xE1\xA0\x83" /*᠃*/, "\xE1\xA0\x89" /*᠉*/,
    "\xE2\x80\xBC" /*‼*/, "\xE2\x80\xBD" /*‽*/,
    "\xE2\x81\x87" /*⁇*/, "\xE2\x81\x88" /*⁈*/, "\xE2\x81\x89" /*⁉*/,
    "\xE2\xB8\xAE" /*⸮*/, "\xE2\xB8\xBC" /*⸼*/,
    "\xE3\x80\x82" /*。*/, "\xEF\xB9\x92" /*﹒*/,
    "\xEF\xB9\x96" /*﹖*/, "\xEF\xB9\x97" /*﹗*/,
    "\xEF\xBC\x81" /*！*/, "\xEF\xBC\x8E" /*．*/, "\xEF\xBC\x9F" /*？*/,
    "\xEF\xBD\xA1" /*｡*/
  };
  return vector<string>(punct_chars,
                        punct_chars + sizeof(punct_chars) / sizeof(char*));
}

vector<string> default_capitalized_shapes() {
  static char const *shapes[] = { "Xx", "Xxx", "Xxxx", "Xxxxx" };
  return vector<string>(shapes, shapes + sizeof(shapes) / sizeof(char*));
}

SentenceBoundaryClassifier::SentenceBoundaryClassifier(
    vector<string> const &punct_chars,
    bool ignore_excluded,
    vector<string> const &capitalized_shapes):
  m_ignore_excluded(ignore_excluded)
{
  vector<string> punct_list =
      punct_chars.empty() ? default_punct_chars() : punct_chars;
  for (vector<string>::const_iterator punct = punct_list.begin();
       punct != punct_list.end(); punct++) {
    if (punct->empty()) {
      throw config_exception("punct_chars: empty string is not a valid "
                             "sentence-final punctuation.");
    }
    m_punct_chars.insert(*punct);
  }

  vector<string> shape_list = capitalized_shapes.empty()
      ? default_capitalized_shapes() : capitalized_shapes;
  for (vector<string>::const_iterator shape = shape_list.begin();
       shape != shape_list.end(); shape++) {
    if (shape->empty()) {
      throw config_exception("capitalized_shapes: empty string is not a "
                             "valid shape.");
    }
    m_capitalized_shapes.insert(*shape);
  }
}

vector<sent_start_t> SentenceBoundaryClassifier::classify(
    vector<token_t> const &tokens) const {

  vector<sent_start_t> sent_starts(tokens.size(), SENT_UNSET);

  bool seen_period = false;
  bool seen_newline = false;
  bool seen_first = false;

  for (size_t i = 0; i != tokens.size(); i++) {
    token_t const &token = tokens[i];

    // Excluded tokens are invisible: they neither settle nor open
    // a boundary and they get no decision.
    if (m_ignore_excluded && token.excluded) {
      continue;
    }

    if (!seen_first) {
      sent_starts[i] = SENT_START;
      seen_first = true;
    } else {
      sent_starts[i] = SENT_CONTINUE;
    }

    bool is_in_punct_chars = is_punct_char(token.text);
    bool is_newline = token.is_space && (token.text == "\n");

    if (seen_period || seen_newline) {
      // A period followed by a number does not end the sentence.
      if (seen_period && token.is_digit) {
        continue;
      }
      // Neither do punctuation or newlines settle the pending boundary.
      if (is_in_punct_chars || is_newline || token.is_punct) {
        continue;
      }
      if (seen_period) {
        sent_starts[i] = SENT_START;
      } else {
        sent_starts[i] = is_capitalized_shape(token.shape)
                         ? SENT_START : SENT_CONTINUE;
      }
      seen_period = false;
      seen_newline = false;
    } else if (is_in_punct_chars) {
      seen_period = true;
    } else if (is_newline) {
      seen_newline = true;
    }
  }

  return sent_starts;
}

void SentenceBoundaryClassifier::classify(document_t &document) const {
  document.sent_starts = classify(document.tokens);
}

vector<sentence_span_t> sentence_spans(vector<sent_start_t> const &sent_starts) {
  vector<sentence_span_t> spans;

  for (size_t i = 0; i != sent_starts.size(); i++) {
    if (sent_starts[i] != SENT_START) {
      continue;
    }
    if (spans.empty()) {
      spans.push_back(sentence_span_t(0, i));
    } else {
      spans.back().end = i;
      spans.push_back(sentence_span_t(i, i));
    }
  }

  if (!spans.empty()) {
    spans.back().end = sent_starts.size();
  }

  return spans;
}

}
