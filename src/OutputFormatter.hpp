#ifndef OUTPUTFORMATTER_INCLUDE_GUARD
#define OUTPUTFORMATTER_INCLUDE_GUARD

#include <ostream>
#include <string>

#include "token_t.hpp"

namespace sentseg {

enum output_format_t {
  // One sentence per line.
  SENTENCES_FORMAT,
  // One token per line along with its decision.
  TOKENS_FORMAT
};

// Parses "sentences" or "tokens". Throws config_exception otherwise.
output_format_t parse_output_format(std::string const &name);

char const *sent_start_name(sent_start_t sent_start);

class OutputFormatter {

public:
    OutputFormatter(/* how the classified documents are written */
                    output_format_t format):
            m_format(format)
    {}

    // write sends the classified document down the output stream.
    // The document must have been classified first.
    void write(document_t const &document, std::ostream &out) const;

private:
    void write_sentences(document_t const &document, std::ostream &out) const;
    void write_tokens(document_t const &document, std::ostream &out) const;

    output_format_t m_format;
};

}

#endif
