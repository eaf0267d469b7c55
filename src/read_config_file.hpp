#ifndef READ_CONFIG_FILE_INCLUDE_GUARD
#define READ_CONFIG_FILE_INCLUDE_GUARD

#include <istream>
#include <vector>
#include <string>

namespace sentseg {

struct segmenter_config_t {
  // Empty lists stand for the builtin defaults.
  std::vector<std::string> punct_chars;
  std::vector<std::string> capitalized_shapes;
  bool ignore_excluded;
  std::vector<std::string> exclude_lines;

  segmenter_config_t():
    punct_chars(),
    capitalized_shapes(),
    ignore_excluded(true),
    exclude_lines()
  {}
};

/* Reads the segmenter settings from an INI-style configuration.
   The keys punct_chars, capitalized_shapes and exclude_line may be repeated,
   ignore_excluded takes a boolean. Settings present in the configuration
   override those already in config. Deprecated and unknown options are
   accepted and reported through warnings. Throws config_exception when the
   configuration cannot be parsed. */
void read_config(
          /* The configuration text. */
          std::istream &config_stream,
          /* Where the configuration comes from, used in messages. */
          std::string const &location,
          /* Input/Output: the settings to override. */
          segmenter_config_t &config,
          /* Output: non-fatal problems found in the configuration. */
          std::vector<std::string> &warnings);

// Opens config_file and reads it with read_config.
void read_config_file(std::string const &config_file,
                      segmenter_config_t &config,
                      std::vector<std::string> &warnings);

}

#endif
