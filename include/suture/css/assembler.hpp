#pragma once

#include <suture/css/fragment.hpp>
#include <string>
#include <vector>

namespace suture::css {

// Concatenate fragments in the given order, each followed by a single '\n'.
// The order is trusted as-is: no deduplication, no reordering.
std::string assemble(const std::vector<CssFragment>& fragments);

} // namespace suture::css
