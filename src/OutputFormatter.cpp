#include <ostream>
#include <string>
#include <vector>

#include "OutputFormatter.hpp"
#include "SentenceBoundaryClassifier.hpp"
#include "config_exception.hpp"
#include "token_t.hpp"

namespace sentseg {

output_format_t parse_output_format(std::string const &name) {
  if (name == "sentences") {
    return SENTENCES_FORMAT;
  } else if (name == "tokens") {
    return TOKENS_FORMAT;
  }
  throw config_exception("Output format \"" + name + "\" not recognized. "
      "Supported formats are sentences and tokens.");
}

char const *sent_start_name(sent_start_t sent_start) {
  switch (sent_start) {
    case SENT_START:
      return "START";
    case SENT_CONTINUE:
      return "CONTINUE";
    default:
      return "UNSET";
  }
}

static void append_space(std::string &sentence) {
  if (!sentence.empty() && (sentence[sentence.size() - 1] != ' '))
    sentence += ' ';
}

static std::string escape_text(std::string const &text) {
  std::string escaped;
  for (std::string::const_iterator ch = text.begin(); ch != text.end(); ch++) {
    switch (*ch) {
      case '\n': escaped += "\\n"; break;
      case '\r': escaped += "\\r"; break;
      case '\t': escaped += "\\t"; break;
      case '\\': escaped += "\\\\"; break;
      default: escaped += *ch;
    }
  }
  return escaped;
}

void OutputFormatter::write(document_t const &document,
                            std::ostream &out) const {
  if (m_format == TOKENS_FORMAT) {
    write_tokens(document, out);
  } else {
    write_sentences(document, out);
  }
}

void OutputFormatter::write_sentences(document_t const &document,
                                      std::ostream &out) const {
  std::vector<sentence_span_t> spans = sentence_spans(document.sent_starts);

  typedef std::vector<sentence_span_t>::const_iterator span_iter;
  for (span_iter span = spans.begin(); span != spans.end(); span++) {
    // Any whitespace inside the sentence, newlines included, is written
    // as a single space.
    std::string sentence;
    for (size_t i = span->begin; i != span->end; i++) {
      token_t const &token = document.tokens[i];
      if (token.is_space) {
        append_space(sentence);
      } else {
        sentence += token.text;
      }
      if (!token.whitespace.empty()) {
        append_space(sentence);
      }
    }

    if (!sentence.empty() && (sentence[sentence.size() - 1] == ' '))
      sentence.erase(sentence.size() - 1);

    if (!sentence.empty())
      out << sentence << '\n';
  }
}

void OutputFormatter::write_tokens(document_t const &document,
                                   std::ostream &out) const {
  for (size_t i = 0; i != document.tokens.size(); i++) {
    token_t const &token = document.tokens[i];
    sent_start_t sent_start = (i < document.sent_starts.size())
                              ? document.sent_starts[i] : SENT_UNSET;
    out << escape_text(token.text) << '\t' << sent_start_name(sent_start);
    if (token.excluded)
      out << "\tEXCLUDED";
    out << '\n';
  }
  out << '\n';
}

}
