#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <tbb/parallel_pipeline.h>

#include "DocumentPipeline.hpp"
#include "configuration.hpp"
#include "token_t.hpp"

using namespace std;
namespace fs = boost::filesystem;

namespace sentseg {

namespace {

// A document travelling down the pipeline. Items are shared between the
// stages, so the ones in flight are released if the pipeline is cancelled.
struct work_item_t {
  work_item_t(): index(0), failed(false) {}

  size_t index;
  document_t document;
  string text;
  // Set when a stage could not process the document; the writer reports
  // the error and skips the document.
  bool failed;
  string error;
};

typedef boost::shared_ptr<work_item_t> work_item_ptr;

/* The reader stage takes the documents one by one and loads their text.
   Stopping the flow control signifies the end of processing to TBB. */
class DocumentReader {

public:
  DocumentReader(vector<document_t> *documents_p, size_t *next_p):
    m_documents_p(documents_p),
    m_next_p(next_p)
  {}

  work_item_ptr operator()(tbb::flow_control &control) const {
    if (*m_next_p == m_documents_p->size()) {
      control.stop();
      return work_item_ptr();
    }

    work_item_ptr item_p = boost::make_shared<work_item_t>();
    item_p->index = *m_next_p;
    item_p->document = (*m_documents_p)[*m_next_p];
    (*m_next_p)++;

    string const &input_path = item_p->document.input_path;
    if (input_path == "-") {
      item_p->text.assign(istreambuf_iterator<char>(cin),
                          istreambuf_iterator<char>());
      return item_p;
    }

    fs::path input_file_path(input_path);
    if (!fs::exists(input_file_path)) {
      item_p->failed = true;
      item_p->error = "File not found, skipping.";
      return item_p;
    }
    fs::ifstream input_stream(input_file_path, ios::in | ios::binary);
    if (!input_stream) {
      item_p->failed = true;
      item_p->error = "Cannot open file, skipping.";
      return item_p;
    }
    item_p->text.assign(istreambuf_iterator<char>(input_stream),
                        istreambuf_iterator<char>());
    input_stream.close();

    return item_p;
  }

private:
  vector<document_t> *m_documents_p;
  size_t *m_next_p;
};

// The analyzer stage tokenizes, tags and classifies a single document.
class DocumentAnalyzer {

public:
  DocumentAnalyzer(RoughTokenizer const &tokenizer,
                   ExclusionTagger const &tagger,
                   SentenceBoundaryClassifier const &classifier):
    m_tokenizer(tokenizer),
    m_tagger(tagger),
    m_classifier(classifier)
  {}

  work_item_ptr operator()(work_item_ptr item_p) const {
    if (item_p->failed) {
      return item_p;
    }

    document_t &document = item_p->document;
    document.tokens.clear();
    try {
      m_tokenizer.tokenize(item_p->text, document.tokens);
    } catch (domain_error const &exc) {
      item_p->failed = true;
      item_p->error = string("Invalid UTF-8 input (") + exc.what()
                      + "), skipping.";
      return item_p;
    }
    // The text is no longer needed.
    string().swap(item_p->text);

    m_tagger.tag(document);
    m_classifier.classify(document);

    return item_p;
  }

private:
  RoughTokenizer const &m_tokenizer;
  ExclusionTagger const &m_tagger;
  SentenceBoundaryClassifier const &m_classifier;
};

// The writer stage formats the documents in their original order.
class DocumentWriter {

public:
  DocumentWriter(OutputFormatter const &formatter,
                 vector<document_t> *documents_p,
                 ostream *stdout_p,
                 ostream *log_p,
                 int *n_failed_p):
    m_formatter(formatter),
    m_documents_p(documents_p),
    m_stdout_p(stdout_p),
    m_log_p(log_p),
    m_n_failed_p(n_failed_p)
  {}

  void operator()(work_item_ptr item_p) const {
    document_t &document = item_p->document;

    *m_log_p << "sentseg: Processing file " << document.name << endl;

    if (!item_p->failed) {
      write(item_p);
    }

    if (item_p->failed) {
      *m_log_p << document.input_path << ": Warning: " << item_p->error
               << endl;
      (*m_n_failed_p)++;
    }

    (*m_documents_p)[item_p->index].tokens.swap(document.tokens);
    (*m_documents_p)[item_p->index].sent_starts.swap(document.sent_starts);
  }

private:
  void write(work_item_ptr const &item_p) const {
    document_t const &document = item_p->document;

    if (document.output_path == "-") {
      m_formatter.write(document, *m_stdout_p);
      m_stdout_p->flush();
      if (!*m_stdout_p) {
        item_p->failed = true;
        item_p->error = "Cannot write to the standard output.";
      }
      return;
    }

    fs::path output_file_path(document.output_path);
    try {
      if (!output_file_path.parent_path().empty()
          && !fs::is_directory(output_file_path.parent_path())) {
        fs::create_directories(output_file_path.parent_path());
      }
    } catch (fs::filesystem_error const &exc) {
      item_p->failed = true;
      item_p->error = string(exc.what()) + ", skipping.";
      return;
    }
    fs::ofstream output_stream(output_file_path, ios::out | ios::binary);
    if (!output_stream) {
      item_p->failed = true;
      item_p->error = "Cannot write to " + document.output_path
                      + ", skipping.";
      return;
    }
    m_formatter.write(document, output_stream);
    output_stream.close();
    // close() flushes the buffer, so a full disk shows up here.
    if (!output_stream) {
      item_p->failed = true;
      item_p->error = "Error while writing to " + document.output_path + ".";
    }
  }

  OutputFormatter const &m_formatter;
  vector<document_t> *m_documents_p;
  ostream *m_stdout_p;
  ostream *m_log_p;
  int *m_n_failed_p;
};

}

int DocumentPipeline::run(vector<document_t> &documents) const {
  size_t next = 0;
  int n_failed = 0;

  tbb::parallel_pipeline(WORK_UNIT_COUNT,
      tbb::make_filter<void, work_item_ptr>(
          tbb::filter_mode::serial_in_order,
          DocumentReader(&documents, &next))
    & tbb::make_filter<work_item_ptr, work_item_ptr>(
          tbb::filter_mode::parallel,
          DocumentAnalyzer(m_tokenizer, m_tagger, m_classifier))
    & tbb::make_filter<work_item_ptr, void>(
          tbb::filter_mode::serial_in_order,
          DocumentWriter(m_formatter, &documents, m_stdout_p, m_log_p,
                         &n_failed)));

  return n_failed;
}

}
