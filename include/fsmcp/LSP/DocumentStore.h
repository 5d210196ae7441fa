//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Documents a client has opened on its analysis server.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_DOCUMENT_STORE_H
#define FSMCP_LSP_DOCUMENT_STORE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace fsmcp::lsp
{

/// @brief Snapshot of one open document as last sent to the server.
struct DocumentSnapshot final
{
    /// @brief Absolute filesystem path.
    std::string path;

    /// @brief Language id sent with `didOpen`.
    std::string languageId;

    /// @brief Full text as last synchronized.
    std::string text;

    /// @brief Document version; starts at 1.
    std::int64_t version{0};
};

/// @brief Tracks open documents keyed by absolute path.
///
/// Versions are gapless: `open` records version 1 and every accepted change
/// increments it by exactly one.
class DocumentStore final
{
public:
    /// @brief Registers a document as opened at version 1.
    /// @param[in] path Absolute path.
    /// @param[in] languageId Language id sent with `didOpen`.
    /// @param[in] text Initial full text.
    /// @return `false` when the document was already open; nothing changes.
    [[nodiscard]] bool open(std::string path, std::string languageId, std::string text);

    /// @brief Replaces the text of an open document and bumps its version.
    /// @param[in] path Absolute path.
    /// @param[in] text New full text.
    /// @return New version, or `0` when the document is not open.
    [[nodiscard]] std::int64_t applyFullTextChange(const std::string& path, std::string text);

    /// @brief Forgets a document.
    /// @param[in] path Absolute path.
    /// @return `true` when an entry existed and was removed.
    [[nodiscard]] bool close(const std::string& path);

    /// @brief Looks up a document snapshot by path.
    /// @param[in] path Absolute path.
    /// @return Snapshot pointer when present, otherwise `nullptr`.
    [[nodiscard]] const DocumentSnapshot* lookup(const std::string& path) const;

    /// @brief Returns a copy of all open document snapshots.
    [[nodiscard]] std::vector<DocumentSnapshot> snapshots() const;

    [[nodiscard]] std::size_t size() const
    {
        return documents_.size();
    }

    void clear()
    {
        documents_.clear();
    }

private:
    std::unordered_map<std::string, DocumentSnapshot> documents_;
};

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_DOCUMENT_STORE_H
