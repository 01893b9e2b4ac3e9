//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/text_utils.cpp
// Purpose: Implement small text formatting helpers used by summaries.
// Key invariants: None.
// Ownership/Lifetime: Stateless.
// Links: support/text_utils.hpp

#include "support/text_utils.hpp"

#include <sstream>

namespace apicheck::support
{

std::string formatList(const std::vector<std::string> &items, size_t maxItems)
{
    const size_t shown = (maxItems == 0 || maxItems >= items.size()) ? items.size() : maxItems;

    std::ostringstream os;
    for (size_t i = 0; i < shown; ++i)
    {
        if (i != 0)
            os << ", ";
        os << items[i];
    }
    if (shown < items.size())
        os << "... (" << (items.size() - shown) << " more)";
    return os.str();
}

} // namespace apicheck::support
