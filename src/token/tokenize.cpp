#include "tokenize.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace redfa::token {

std::vector<Lexeme> tokenize(std::string_view regex) {
    std::vector<Lexeme> lexemes;
    std::size_t open_groups = 0;
    std::size_t pos = 0;

    while (pos < regex.size()) {
        const char c = regex[pos];
        const std::size_t offset = pos;
        switch (c) {
            case ' ':
                break;
            case '|':
                lexemes.push_back({Alternation{}, offset});
                break;
            case '*':
                lexemes.push_back({KleeneStar{}, offset});
                break;
            case '+':
                lexemes.push_back({PositiveClosure{}, offset});
                break;
            case '?':
                lexemes.push_back({Optional{}, offset});
                break;
            case '(':
                ++open_groups;
                lexemes.push_back({GroupOpen{}, offset});
                break;
            case ')':
                if (open_groups == 0) {
                    throw SyntaxError("Unbalanced parentheses", offset);
                }
                --open_groups;
                lexemes.push_back({GroupClose{}, offset});
                break;
            default:
                lexemes.push_back({Literal{c}, offset});
                break;
        }
        ++pos;
    }

    if (lexemes.empty()) {
        throw SyntaxError("Empty regular expression", 0);
    }

    return lexemes;
}

}  // namespace redfa::token
