//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "source_manager.hpp"

#include "support/path_utils.hpp"

namespace apicheck::support
{

uint32_t SourceManager::addFile(std::string_view path)
{
    std::string normalized = normalizePath(path);
    if (auto it = ids_.find(normalized); it != ids_.end())
        return it->second;

    paths_.push_back(std::move(normalized));
    const auto id = static_cast<uint32_t>(paths_.size());
    ids_.emplace(paths_.back(), id);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > paths_.size())
        return {};
    return paths_[file_id - 1];
}

} // namespace apicheck::support
