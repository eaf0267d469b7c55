#include <iostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <pcrecpp.h>

#include "configuration.hpp"
#include "config_exception.hpp"
#include "read_config_file.hpp"
#include "token_t.hpp"
#include "RoughTokenizer.hpp"
#include "ExclusionTagger.hpp"
#include "SentenceBoundaryClassifier.hpp"
#include "OutputFormatter.hpp"
#include "DocumentPipeline.hpp"

using namespace std;
using namespace sentseg;
namespace po = boost::program_options;
namespace fs = boost::filesystem;

#define END_WITH_ERROR(location, message) {\
  cerr << location << ": Error: " << message << endl;\
  return 1;\
}


void include_listed_files(fs::path const &file_list_path,
                          vector<string> &input_files) {
    istream *file_list_stream_p = (file_list_path == "-") ? &std::cin
                                      : new fs::ifstream(file_list_path);
    fs::path file_list_dir = file_list_path.parent_path();
    string line;
    while (getline(*file_list_stream_p, line)) {
      if (line.size() > 0)
        // the listed files are relative to the directory of the file list
        // if not already absolute
        input_files.push_back(fs::absolute(line, file_list_dir).string());
    }
    if (file_list_path != "-") {
      fs::ifstream *file_list_file_stream_p = (fs::ifstream*)file_list_stream_p;
      file_list_file_stream_p->close();
      delete file_list_file_stream_p;
    }
}


int main(int argc, char const **argv) {

    // PARSING AND CHECKING THE ARGUMENTS

    /* The s_* variables represent settings, o_* represent options and sv_*
     * represent nonsingleton settings as a vector of strings. */
    string s_config_file;
    string s_format;
    string s_filename_regexp;

    vector<string> sv_input_files;
    vector<string> sv_file_lists;
    vector<string> sv_punct_chars;
    vector<string> sv_exclude_lines;

    bool o_keep_excluded;

    po::options_description explicit_options("Options");
    explicit_options.add_options()
      ("help,h", "Prints this message and exits.")
      ("version", "Prints the version and exits.")
      ("config,c", po::value<string>(&s_config_file),
        "A configuration file setting punct_chars, capitalized_shapes, "
        "ignore_excluded and exclude_line.")
      ("punct-chars,p", po::value< vector<string> >(&sv_punct_chars)
                        ->composing(),
        "A token text to be treated as sentence-final punctuation. Can be "
        "given several times and replaces the builtin punctuation and the "
        "one from the configuration file.")
      ("keep-excluded,k", po::bool_switch(&o_keep_excluded),
        "Examine the excluded tokens like any other tokens instead of "
        "skipping them.")
      ("exclude-line,x", po::value< vector<string> >(&sv_exclude_lines)
                         ->composing(),
        "A regular expression; the lines of the input matching it as a whole "
        "are excluded from the sentence segmentation. Can be given several "
        "times.")
      ("file-list,l", po::value< vector<string> >(&sv_file_lists)->composing(),
        "A list of input files to be processed. If the paths are relative, "
        "they are evaluated with respect to the location of the file list. "
        "More than 1 file list can be specified.")
      ("filename-regexp,r",
          po::value<string>(&s_filename_regexp)
                           ->default_value("/\\.txt$/.sent/"),
        "A regular expression/replacement string used to find the output "
        "file for every input file.")
      ("format,f", po::value<string>(&s_format)->default_value("sentences"),
        "The output format: 'sentences' writes one sentence per line, "
        "'tokens' writes one token per line with its decision.")
    ;

    po::options_description positional_options;
    positional_options.add_options()
        ("input-file", po::value< vector<string> >(&sv_input_files)
                       ->composing(), "")
        ;

    po::positional_options_description pod;
    pod.add("input-file", -1);

    po::options_description all_options;
    all_options.add(explicit_options).add(positional_options);
    po::command_line_parser cmd_line(argc, argv);
    cmd_line.options(all_options).positional(pod);

    po::variables_map vm;

    try {
        po::store(cmd_line.run(), vm);
        po::notify(vm);
    } catch (po::error const &exc) {
        cerr << "sentseg:command line options: Error: " << exc.what() << endl;
        cerr << "Usage: sentseg [OPTION]... [FILE]..." << endl;
        cerr << explicit_options;
        return 1;
    }

    if (vm.count("help")) {
        cout << "Usage: sentseg [OPTION]... [FILE]..." << endl;
        cout << "Splits the input text files into sentences." << endl;
        cout << explicit_options;
        return 0;
    }

    if (vm.count("version")) {
        cout << "sentseg " << SENTSEG_VERSION << endl;
        return 0;
    }


    // READING THE CONFIGURATION

    // The command line takes precedence over the configuration file.
    segmenter_config_t config;
    if (!s_config_file.empty()) {
      vector<string> warnings;
      try {
        read_config_file(s_config_file, config, warnings);
      } catch (config_exception const &exc) {
        END_WITH_ERROR("sentseg", exc.what());
      }
      for (vector<string>::const_iterator warning = warnings.begin();
           warning != warnings.end(); warning++) {
        cerr << s_config_file << ": Warning: " << *warning << endl;
      }
    }
    if (!sv_punct_chars.empty()) {
      config.punct_chars = sv_punct_chars;
    }
    if (o_keep_excluded) {
      config.ignore_excluded = false;
    }
    config.exclude_lines.insert(config.exclude_lines.end(),
                                sv_exclude_lines.begin(),
                                sv_exclude_lines.end());

    output_format_t format;
    try {
      format = parse_output_format(s_format);
    } catch (config_exception const &exc) {
      END_WITH_ERROR("sentseg", exc.what());
    }


    // BUILDING THE SEGMENTER

    RoughTokenizer tokenizer;
    OutputFormatter formatter(format);
    // The tagger and the classifier validate the configuration.
    ExclusionTagger *tagger_p = NULL;
    SentenceBoundaryClassifier *classifier_p = NULL;
    try {
      tagger_p = new ExclusionTagger(config.exclude_lines);
      classifier_p = new SentenceBoundaryClassifier(config.punct_chars,
                                                    config.ignore_excluded,
                                                    config.capitalized_shapes);
    } catch (config_exception const &exc) {
      delete tagger_p;
      END_WITH_ERROR((s_config_file.empty() ? "sentseg" : s_config_file),
                     exc.what());
    }


    // DETERMINING THE INPUT FILES

    vector<string> input_files;

    // The files explicitly stated on the command line are to be processed
    // everytime. If a file named '-' was given, the standard input/output
    // combo is used.
    for (vector<string>::const_iterator file = sv_input_files.begin();
         file != sv_input_files.end(); file++) {

      fs::path file_path(*file);

      if (!fs::exists(file_path) && (file_path != "-")) {
        delete tagger_p;
        delete classifier_p;
        END_WITH_ERROR(*file, "File not found.");
      }

      input_files.push_back(*file);
    }

    // If we were given any explicit file list, we include all the files
    // referred inside it.
    for (vector<string>::const_iterator file_list = sv_file_lists.begin();
         file_list != sv_file_lists.end(); file_list++) {

      fs::path file_list_path(*file_list);

      if (!fs::exists(file_list_path) && (file_list_path != "-")) {
        delete tagger_p;
        delete classifier_p;
        END_WITH_ERROR(*file_list, "File not found.");
      }

      include_listed_files(file_list_path, input_files);
    }

    // If no input files or file lists were given, then we process
    // standard input.
    if (input_files.size() == 0) {
      input_files.push_back("-");
    }


    // PARSING THE FILENAME REGEXP/REPLACEMENT STRING

    // Decomposition of the regexp/replacement string combo.
    char delimiter = s_filename_regexp.empty() ? '/' : s_filename_regexp[0];

    size_t second_delimiter_pos = s_filename_regexp.find(delimiter, 1);
    size_t third_delimiter_pos = (second_delimiter_pos == string::npos)
        ? string::npos
        : s_filename_regexp.find(delimiter, second_delimiter_pos + 1);
    if ((second_delimiter_pos == string::npos)
        || (third_delimiter_pos != s_filename_regexp.size() - 1)) {
      delete tagger_p;
      delete classifier_p;
      END_WITH_ERROR("sentseg", "The filename regexp/replacement string must "
          "begin and end with its delimiter and have the same delimiter "
          "separating the regex from the replacement string (as in sed, "
          "e.g. /change_this/into_this/).");
    }

    // The product: fnre_regexp, fnre_replace
    pcrecpp::RE fnre_regexp(
                    s_filename_regexp.substr(1, second_delimiter_pos - 1),
                    pcrecpp::UTF8());
    string fnre_replace = s_filename_regexp.substr(second_delimiter_pos + 1,
                          third_delimiter_pos - (second_delimiter_pos + 1));

    if (fnre_regexp.error() != "") {
      delete tagger_p;
      delete classifier_p;
      END_WITH_ERROR("sentseg", "The following error occured when compiling "
          "the filename regular expression: " << fnre_regexp.error());
    }


    // PAIRING THE INPUT FILES WITH THEIR OUTPUT FILES

    vector<document_t> documents;
    for (vector<string>::const_iterator input_file = input_files.begin();
         input_file != input_files.end(); input_file++) {

      document_t document;
      document.name = *input_file;
      document.input_path = *input_file;

      if (*input_file == "-") {
        document.output_path = "-";
      } else {
        string other_file(*input_file);
        bool fnre_success = fnre_regexp.Replace(fnre_replace, &other_file);

        if (!fnre_success) {
          cerr << *input_file << ": Warning: Failed to apply regex to find "
              "the output file, skipping. Possible causes include the regular "
              "expression failing to match and the replacement string using "
              "illegal backreferences." << endl;
          continue;
        }
        if (other_file == *input_file) {
          cerr << *input_file << ": Warning: The output file would overwrite "
              "the input file, skipping." << endl;
          continue;
        }
        document.output_path = other_file;
      }

      documents.push_back(document);
    }


    // RUNNING THE PIPELINE

    DocumentPipeline pipeline(tokenizer, *tagger_p, *classifier_p, formatter,
                              &cout, &clog);
    int n_failed = pipeline.run(documents);

    cout.flush();

    delete tagger_p;
    delete classifier_p;

    return (n_failed == 0) ? 0 : 1;
}
