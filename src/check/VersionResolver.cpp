//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Inherited members: a call compiled against a subclass ("Chronometer") of the
// declaring platform class ("TextView") carries the subclass as owner. The
// search therefore climbs the hierarchy, but the violation names the most
// specific platform class on the path, which is what the user wrote.
//
//===----------------------------------------------------------------------===//

#include "check/VersionResolver.hpp"

#include <deque>
#include <unordered_set>
#include <utility>

namespace apicheck::check
{

std::optional<Resolution> VersionResolver::resolve(const Reference &ref) const
{
    const catalog::ApiCatalog &api = hierarchy_.catalog();
    switch (ref.kind)
    {
        case catalog::ElementKind::Class:
        case catalog::ElementKind::UiTag:
        {
            const auto version = api.lookup(ref.signature, ref.kind);
            if (!version)
                return std::nullopt;
            return Resolution{*version, ref.signature.owner};
        }
        case catalog::ElementKind::Method:
        case catalog::ElementKind::Field:
            return resolveMember(ref);
    }
    return std::nullopt;
}

std::optional<Resolution> VersionResolver::resolveMember(const Reference &ref) const
{
    const catalog::ApiCatalog &api = hierarchy_.catalog();
    const std::string &start = ref.signature.owner;

    struct Step
    {
        std::string type;
        std::string display; ///< First catalog class on the path, or empty.
    };

    std::deque<Step> queue;
    std::unordered_set<std::string> visited;
    queue.push_back({start, api.hasClass(start) ? start : std::string()});
    visited.insert(start);

    catalog::Signature candidate = ref.signature;
    while (!queue.empty())
    {
        Step step = std::move(queue.front());
        queue.pop_front();

        candidate.owner = step.type;
        if (const auto version = api.lookup(candidate, ref.kind))
            return Resolution{*version, step.display.empty() ? step.type : step.display};

        if (hierarchy_.declaresMember(
                step.type, ref.kind, ref.signature.member, ref.signature.descriptor))
            return std::nullopt;

        for (const auto &super : hierarchy_.supertypes(step.type))
        {
            if (!visited.insert(super).second)
                continue;
            std::string display = step.display;
            if (display.empty() && api.hasClass(super))
                display = super;
            queue.push_back({super, std::move(display)});
        }
    }
    return std::nullopt;
}

} // namespace apicheck::check
