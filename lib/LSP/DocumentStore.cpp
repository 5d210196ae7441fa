//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements open-document tracking.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/DocumentStore.h"

#include <utility>

namespace fsmcp::lsp
{

bool DocumentStore::open(std::string path, std::string languageId, std::string text)
{
    if (documents_.find(path) != documents_.end())
    {
        return false;
    }
    DocumentSnapshot snapshot{path, std::move(languageId), std::move(text), 1};
    documents_.emplace(std::move(path), std::move(snapshot));
    return true;
}

std::int64_t DocumentStore::applyFullTextChange(const std::string& path, std::string text)
{
    const auto it = documents_.find(path);
    if (it == documents_.end())
    {
        return 0;
    }
    it->second.text = std::move(text);
    return ++it->second.version;
}

bool DocumentStore::close(const std::string& path)
{
    return documents_.erase(path) > 0U;
}

const DocumentSnapshot* DocumentStore::lookup(const std::string& path) const
{
    const auto it = documents_.find(path);
    return it == documents_.end() ? nullptr : &it->second;
}

std::vector<DocumentSnapshot> DocumentStore::snapshots() const
{
    std::vector<DocumentSnapshot> out;
    out.reserve(documents_.size());
    for (const auto& [_, snapshot] : documents_)
    {
        out.push_back(snapshot);
    }
    return out;
}

}  // namespace fsmcp::lsp
