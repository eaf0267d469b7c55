#include <istream>
#include <vector>
#include <string>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

#include "read_config_file.hpp"
#include "config_exception.hpp"

using namespace std;
namespace po = boost::program_options;
namespace fs = boost::filesystem;

namespace sentseg {

static void check_not_empty(string const &location, string const &key,
                            vector<string> const &values) {
  for (vector<string>::const_iterator value = values.begin();
       value != values.end(); value++) {
    if (value->empty()) {
      throw config_exception(location + ": Empty value given for " + key
                             + ".");
    }
  }
}

void read_config(istream &config_stream,
                 string const &location,
                 segmenter_config_t &config,
                 vector<string> &warnings) {

  po::options_description config_options;
  config_options.add_options()
      ("punct_chars", po::value< vector<string> >()->composing())
      ("capitalized_shapes", po::value< vector<string> >()->composing())
      ("ignore_excluded", po::value<bool>())
      ("exclude_line", po::value< vector<string> >()->composing())
      // Deprecated, superseded by ignore_excluded.
      ("use_endlines", po::value<bool>())
      ;

  po::variables_map vm;
  vector<string> unrecognized;
  try {
    po::parsed_options parsed =
        po::parse_config_file(config_stream, config_options, true);
    unrecognized = po::collect_unrecognized(parsed.options,
                                            po::include_positional);
    po::store(parsed, vm);
    po::notify(vm);
  } catch (po::error const &exc) {
    throw config_exception(location + ": " + exc.what());
  }

  // collect_unrecognized gives both the keys and the values.
  for (size_t i = 0; i < unrecognized.size(); i += 2) {
    warnings.push_back("Unknown option \"" + unrecognized[i]
                       + "\" ignored.");
  }

  if (vm.count("punct_chars")) {
    config.punct_chars = vm["punct_chars"].as< vector<string> >();
    check_not_empty(location, "punct_chars", config.punct_chars);
  }
  if (vm.count("capitalized_shapes")) {
    config.capitalized_shapes =
        vm["capitalized_shapes"].as< vector<string> >();
    check_not_empty(location, "capitalized_shapes", config.capitalized_shapes);
  }
  if (vm.count("exclude_line")) {
    vector<string> const &exclude_lines =
        vm["exclude_line"].as< vector<string> >();
    check_not_empty(location, "exclude_line", exclude_lines);
    config.exclude_lines.insert(config.exclude_lines.end(),
                                exclude_lines.begin(), exclude_lines.end());
  }
  if (vm.count("ignore_excluded")) {
    config.ignore_excluded = vm["ignore_excluded"].as<bool>();
  }
  if (vm.count("use_endlines")) {
    warnings.push_back("The option use_endlines is deprecated and has been "
                       "replaced by ignore_excluded.");
    if (vm["use_endlines"].as<bool>()) {
      config.ignore_excluded = true;
    }
  }
}

void read_config_file(string const &config_file,
                      segmenter_config_t &config,
                      vector<string> &warnings) {
  fs::path config_path(config_file);
  if (!fs::exists(config_path)) {
    throw config_exception(config_file + ": File not found.");
  }

  fs::ifstream config_stream(config_path);
  if (!config_stream) {
    throw config_exception(config_file + ": Cannot open file.");
  }
  read_config(config_stream, config_file, config, warnings);
  config_stream.close();
}

}
