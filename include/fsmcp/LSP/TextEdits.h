//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Applies LSP `TextEdit` lists to document text.
///
/// Positions are (line, character) pairs where characters count UTF-16 code
/// units, as in LSP. Text is stored as UTF-8, so columns are mapped to byte
/// offsets per line before splicing.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_LSP_TEXT_EDITS_H
#define FSMCP_LSP_TEXT_EDITS_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fsmcp::lsp
{

/// @brief Zero-based LSP position.
struct TextPosition final
{
    std::uint32_t line{0};
    std::uint32_t character{0};
};

/// @brief Replacement of the half-open range `[start, end)`.
struct TextEdit final
{
    TextPosition start;
    TextPosition end;
    std::string  newText;
};

/// @brief Result of applying an edit list.
struct EditApplication final
{
    /// @brief Resulting text.
    std::string text;

    /// @brief Number of edits applied.
    std::size_t editCount{0};

    /// @brief `true` when `text` differs from the input.
    bool changed{false};
};

/// @brief Converts an LSP `TextEdit[]` payload.
/// @param[in] value JSON array of `{range, newText}` objects, or `null`.
/// @return Parsed edits, or `ProtocolError` naming the malformed entry.
[[nodiscard]] llvm::Expected<std::vector<TextEdit>> parseTextEdits(const llvm::json::Value& value);

/// @brief Applies edits to `original`.
///
/// Edits are applied back to front by start position; among edits with the
/// same start, later entries are applied first so that inserts at one
/// position keep their input order. Out-of-range positions clamp to the line
/// or document end. An edit whose start follows its end, or edits that
/// overlap, are rejected with `InvalidArgument`.
///
/// @param[in] original Document text.
/// @param[in] edits Edits expressed against `original`.
/// @return Edited text or error.
[[nodiscard]] llvm::Expected<EditApplication> applyTextEdits(llvm::StringRef original, std::vector<TextEdit> edits);

/// @brief Maps a UTF-16 column to a byte offset within one line.
/// @param[in] line Line text without its `\n` terminator.
/// @param[in] column UTF-16 code unit column.
/// @return Byte offset, clamped to the line end (before a trailing `\r`).
[[nodiscard]] std::size_t utf16ColumnToByteOffset(llvm::StringRef line, std::uint32_t column);

}  // namespace fsmcp::lsp

#endif  // FSMCP_LSP_TEXT_EDITS_H
