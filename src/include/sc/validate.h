#pragma once

#include <optional>
#include <string>
#include "sc/schema.h"

namespace sc {

// Validate 'data' against 'schema'.
// Returns std::nullopt on success, or the described failure otherwise.
std::optional<std::string> validate(const Value& data, const Schema& schema);

}  // namespace sc
