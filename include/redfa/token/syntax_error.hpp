#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace redfa {

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, std::size_t offset)
        : std::runtime_error(message + " at offset " + std::to_string(offset)),
          offset_(offset) {}

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

}  // namespace redfa
