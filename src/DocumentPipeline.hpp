#ifndef DOCUMENT_PIPELINE_INCLUDE_GUARD
#define DOCUMENT_PIPELINE_INCLUDE_GUARD

#include <ostream>
#include <vector>

#include "ExclusionTagger.hpp"
#include "OutputFormatter.hpp"
#include "RoughTokenizer.hpp"
#include "SentenceBoundaryClassifier.hpp"
#include "token_t.hpp"

namespace sentseg {

/* The DocumentPipeline segments a batch of documents on a TBB pipeline.
   The documents are read and written in order, one at a time, while the
   tokenization, exclusion tagging and classification of several documents
   run in parallel. The stages share the tokenizer, tagger, classifier and
   formatter, which are only read. */
class DocumentPipeline {

public:
    DocumentPipeline(RoughTokenizer const &tokenizer,
                     ExclusionTagger const &tagger,
                     SentenceBoundaryClassifier const &classifier,
                     OutputFormatter const &formatter,
                     /* where documents with output_path "-" are written */
                     std::ostream *stdout_p,
                     /* where progress and warnings are reported */
                     std::ostream *log_p):
        m_tokenizer(tokenizer),
        m_tagger(tagger),
        m_classifier(classifier),
        m_formatter(formatter),
        m_stdout_p(stdout_p),
        m_log_p(log_p)
    {}

    /* Reads every document from its input_path ("-" being the standard
       input), segments it and writes it to its output_path ("-" being
       stdout_p). The processed tokens and decisions are stored back in the
       documents. A document which cannot be read, decoded or written is
       reported and skipped. Returns the number of skipped documents. */
    int run(std::vector<document_t> &documents) const;

private:
    RoughTokenizer const &m_tokenizer;
    ExclusionTagger const &m_tagger;
    SentenceBoundaryClassifier const &m_classifier;
    OutputFormatter const &m_formatter;
    std::ostream *m_stdout_p;
    std::ostream *m_log_p;
};

}

#endif
