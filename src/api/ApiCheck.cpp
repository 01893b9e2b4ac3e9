//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Facade entry point tying catalog loading to the checker.
//
//===----------------------------------------------------------------------===//

#include "apicheck/ApiCheck.hpp"

#include <utility>

namespace apicheck
{

support::Expected<check::ScanResult> runCheck(const std::string &catalogPath,
                                              const std::vector<check::CompiledUnit> &units,
                                              const std::vector<check::ResourceFile> &resources,
                                              const check::CheckOptions &options)
{
    auto catalog = catalog::loadCatalog(catalogPath);
    if (!catalog)
        return std::move(catalog).takeError();

    return check::ApiChecker(catalog.value(), options).run(units, resources);
}

} // namespace apicheck
