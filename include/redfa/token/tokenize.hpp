#pragma once

#include <string_view>
#include <vector>
#include "token.hpp"

namespace redfa::token {

std::vector<Lexeme> tokenize(std::string_view regex);

}  // namespace redfa::token
