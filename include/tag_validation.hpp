// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "tag_types.hpp"

namespace coldspray {

// Checks a proposed write against access, type, range, options and named speeds.
// Throws ValidationError naming the violated constraint. Internal tags are not checked.
void validate_write(const TagDefinition& def, const Value& value);

} // namespace coldspray
