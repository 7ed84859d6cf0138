#pragma once

#include <stdexcept>
#include <string>

namespace Kindling {

// Thrown when a helper is asked for a combination it does not support
// (an unmapped primitive type, a camera without a compositor slot, ...).
// This is a contract violation on the caller's side, not a runtime condition.
class InvalidOperationError : public std::logic_error {
public:
    explicit InvalidOperationError(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace Kindling
