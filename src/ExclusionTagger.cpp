#include <vector>
#include <string>

#include "ExclusionTagger.hpp"
#include "config_exception.hpp"
#include "token_t.hpp"

using namespace std;

namespace sentseg {

ExclusionTagger::ExclusionTagger(vector<string> const &line_patterns) {
  for (vector<string>::const_iterator pattern = line_patterns.begin();
       pattern != line_patterns.end(); pattern++) {
    pcrecpp::RE regex(*pattern, pcrecpp::UTF8());
    if (regex.error() != "") {
      throw config_exception("exclude_line \"" + *pattern + "\": The "
          "following error occured when compiling the regular expression: "
          + regex.error());
    }
    m_line_patterns.push_back(regex);
  }
}

bool ExclusionTagger::matches(string const &line) const {
  for (vector<pcrecpp::RE>::const_iterator pattern = m_line_patterns.begin();
       pattern != m_line_patterns.end(); pattern++) {
    if (pattern->FullMatch(line)) {
      return true;
    }
  }
  return false;
}

void ExclusionTagger::tag(vector<token_t> &tokens) const {
  if (m_line_patterns.empty()) {
    return;
  }

  size_t line_start = 0;
  while (line_start < tokens.size()) {
    // Find the newline token ending this line (or the end of the document).
    size_t line_end = line_start;
    while ((line_end < tokens.size())
        && !(tokens[line_end].is_space && (tokens[line_end].text == "\n"))) {
      line_end++;
    }

    // The carriage return of a CRLF line ending is not part of the line
    // text, but it is tagged along with the line.
    size_t text_end = line_end;
    while ((text_end > line_start) && (tokens[text_end - 1].text == "\r")) {
      text_end--;
    }

    if (text_end > line_start) {
      string line;
      for (size_t i = line_start; i != text_end; i++) {
        line += tokens[i].text;
        if (i + 1 != text_end) {
          line += tokens[i].whitespace;
        }
      }
      if (matches(line)) {
        for (size_t i = line_start; i != line_end; i++) {
          tokens[i].excluded = true;
        }
      }
    }

    line_start = line_end + 1;
  }
}

}
