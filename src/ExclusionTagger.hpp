#ifndef EXCLUSION_TAGGER_INCLUDE_GUARD
#define EXCLUSION_TAGGER_INCLUDE_GUARD

#include <vector>
#include <string>
#include <pcrecpp.h>

#include "token_t.hpp"

namespace sentseg {

/* The ExclusionTagger marks the boilerplate of a document (page headers,
   footers, signatures...) as excluded. The user gives a list of regular
   expressions and the tokens of every line whose text matches one of them
   as a whole are tagged. */
class ExclusionTagger {

public:
    // Throws config_exception if one of the patterns does not compile.
    ExclusionTagger(std::vector<std::string> const &line_patterns);

    bool empty() const { return m_line_patterns.empty(); }

    // Sets the excluded flag on the tokens of the matching lines. The
    // newline tokens separating the lines are left untouched.
    void tag(std::vector<token_t> &tokens) const;

    void tag(document_t &document) const { tag(document.tokens); }

private:
    bool matches(std::string const &line) const;

    std::vector<pcrecpp::RE> m_line_patterns;
};

}

#endif
