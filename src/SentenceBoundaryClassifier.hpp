#ifndef SENTENCE_BOUNDARY_CLASSIFIER_INCLUDE_GUARD
#define SENTENCE_BOUNDARY_CLASSIFIER_INCLUDE_GUARD

#include <string>
#include <vector>
#include <boost/unordered_set.hpp>

#include "token_t.hpp"

namespace sentseg {

// The builtin sentence-final punctuation.
std::vector<std::string> default_punct_chars();

// The shapes of a single capitalized word of 2 to 5 (or more) characters.
std::vector<std::string> default_capitalized_shapes();

/* SentenceBoundaryClassifier decides for every token of a document whether
   it starts a new sentence. A sentence-final punctuation or a newline opens
   a pending boundary which is settled by the next content token:
     - after a punctuation, the next content token starts a sentence unless
       it is a digit (decimal numbers, numbered items);
     - after a bare newline, the next content token starts a sentence only
       if it looks capitalized.
   Punctuation and newlines met while a boundary is pending leave it pending.
   With ignore_excluded, excluded tokens are skipped altogether and keep the
   SENT_UNSET flag. */
class SentenceBoundaryClassifier {

public:
    // Empty punct_chars or capitalized_shapes select the builtin lists.
    // Throws config_exception if one of the entries is empty.
    SentenceBoundaryClassifier(
           std::vector<std::string> const &punct_chars
               = std::vector<std::string>(),
           bool ignore_excluded = true,
           std::vector<std::string> const &capitalized_shapes
               = std::vector<std::string>());

    // Returns the decisions for the tokens, one per token. The first token
    // examined is always SENT_START.
    std::vector<sent_start_t> classify(std::vector<token_t> const &tokens)
        const;

    // Classifies the document's tokens and stores the decisions in
    // document.sent_starts.
    void classify(document_t &document) const;

    bool ignore_excluded() const { return m_ignore_excluded; }

    bool is_punct_char(std::string const &text) const {
        return m_punct_chars.find(text) != m_punct_chars.end();
    }

    bool is_capitalized_shape(std::string const &shape) const {
        return m_capitalized_shapes.find(shape) != m_capitalized_shapes.end();
    }

private:
    boost::unordered_set<std::string> m_punct_chars;
    boost::unordered_set<std::string> m_capitalized_shapes;
    bool m_ignore_excluded;
};

// A sentence covering the tokens [begin, end).
struct sentence_span_t {
    sentence_span_t(size_t begin_, size_t end_): begin(begin_), end(end_) {}

    size_t begin;
    size_t end;
};

/* Groups the tokens into sentences. A sentence starts at every SENT_START
   token and runs up to the next one. Tokens before the first SENT_START
   belong to the first sentence. Without any SENT_START there are no
   sentences at all. */
std::vector<sentence_span_t> sentence_spans(
    std::vector<sent_start_t> const &sent_starts);

}

#endif
