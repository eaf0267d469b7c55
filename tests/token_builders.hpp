#ifndef TOKEN_BUILDERS_INCLUDE_GUARD
#define TOKEN_BUILDERS_INCLUDE_GUARD

#include <string>
#include <vector>

#include "lexical_attributes.hpp"
#include "token_t.hpp"

namespace sentseg {
namespace testing {

// Builds tokens out of their texts, with the attributes computed from them.
// A text starting with '#' gives an excluded token with the rest as text.
inline std::vector<token_t> make_tokens(std::vector<std::string> const &texts) {
    std::vector<token_t> tokens;
    for (size_t i = 0; i != texts.size(); i++) {
        token_t token;
        if ((texts[i].size() > 1) && (texts[i][0] == '#')) {
            token.text = texts[i].substr(1);
            token.excluded = true;
        } else {
            token.text = texts[i];
        }
        set_lexical_attributes(token);
        tokens.push_back(token);
    }
    return tokens;
}

inline std::vector<std::string> texts_of(std::vector<token_t> const &tokens) {
    std::vector<std::string> texts;
    for (size_t i = 0; i != tokens.size(); i++) {
        texts.push_back(tokens[i].text);
    }
    return texts;
}

}
}

#endif
