// gradual/basic/internal_error.hpp - Engine invariant violations
//
// User-facing static errors are data recorded in the info map. This
// exception signals a broken engine invariant (for example, looking up an
// id that must be present in a total map) and is never caught by the
// library.
//
#pragma once

#include <stdexcept>
#include <string>

namespace gradual
{

class InternalError : public std::logic_error
{
public:
  explicit InternalError(const std::string & what) : std::logic_error(what) {}
};

}  // namespace gradual
