//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Project-rooted document content access.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_SUPPORT_FILE_STORAGE_H
#define FSMCP_SUPPORT_FILE_STORAGE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>

namespace fsmcp
{

/// @brief Reads and writes document text on behalf of the client engine.
class DocumentStorage
{
public:
    virtual ~DocumentStorage() = default;

    /// @brief Maps a caller path to the absolute path used as document key.
    /// @param[in] path Absolute or project-relative path.
    /// @return Normalized absolute path, or `InvalidArgument` when it escapes
    /// the project root.
    [[nodiscard]] virtual llvm::Expected<std::string> resolvePath(llvm::StringRef path) const = 0;

    /// @brief Reads the full text of a document.
    /// @param[in] path Absolute or project-relative path.
    /// @return Document text or `StorageFailure`.
    [[nodiscard]] virtual llvm::Expected<std::string> readText(llvm::StringRef path) = 0;

    /// @brief Replaces the full text of a document.
    /// @param[in] path Absolute or project-relative path.
    /// @param[in] text New content.
    /// @return `StorageFailure` when the write fails.
    [[nodiscard]] virtual llvm::Error writeText(llvm::StringRef path, llvm::StringRef text) = 0;
};

/// @brief `DocumentStorage` backed by the local filesystem.
class FileStorage final : public DocumentStorage
{
public:
    /// @brief Creates storage rooted at `projectRoot`.
    /// @param[in] projectRoot Project root; made absolute and normalized.
    explicit FileStorage(llvm::StringRef projectRoot);

    [[nodiscard]] const std::string& projectRoot() const
    {
        return projectRoot_;
    }

    [[nodiscard]] llvm::Expected<std::string> resolvePath(llvm::StringRef path) const override;
    [[nodiscard]] llvm::Expected<std::string> readText(llvm::StringRef path) override;
    [[nodiscard]] llvm::Error                 writeText(llvm::StringRef path, llvm::StringRef text) override;

private:
    std::string projectRoot_;
};

/// @brief Normalizes `path` against `projectRoot` and checks containment.
/// @param[in] projectRoot Absolute, normalized project root.
/// @param[in] path Absolute or project-relative path.
/// @return Normalized absolute path or `InvalidArgument`.
[[nodiscard]] llvm::Expected<std::string> resolveWithinRoot(llvm::StringRef projectRoot, llvm::StringRef path);

/// @brief Returns `path` absolute with `.` and `..` components removed.
[[nodiscard]] std::string normalizeAbsolutePath(llvm::StringRef path);

}  // namespace fsmcp

#endif  // FSMCP_SUPPORT_FILE_STORAGE_H
