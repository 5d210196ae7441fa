//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `TextEdit` parsing and application.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/TextEdits.h"

#include "fsmcp/Support/ClientError.h"

#include <algorithm>
#include <limits>
#include <tuple>
#include <utility>

namespace fsmcp::lsp
{
namespace
{

std::vector<std::string> splitLines(const llvm::StringRef text)
{
    std::vector<std::string> lines;
    std::size_t              start = 0U;
    while (true)
    {
        const std::size_t newline = text.find('\n', start);
        if (newline == llvm::StringRef::npos)
        {
            lines.push_back(text.substr(start).str());
            return lines;
        }
        lines.push_back(text.substr(start, newline - start).str());
        start = newline + 1U;
    }
}

/// Position after clamping, in line index and byte offset.
struct ResolvedPosition final
{
    std::size_t line{0};
    std::size_t byte{0};

    bool operator<(const ResolvedPosition& other) const
    {
        return std::tie(line, byte) < std::tie(other.line, other.byte);
    }
    bool operator==(const ResolvedPosition& other) const
    {
        return line == other.line && byte == other.byte;
    }
};

struct ResolvedEdit final
{
    std::size_t      index{0};
    ResolvedPosition start;
    ResolvedPosition end;
    std::string      newText;
};

ResolvedPosition resolvePosition(const std::vector<std::string>& lines, const TextPosition& position)
{
    if (position.line >= lines.size())
    {
        return ResolvedPosition{lines.size() - 1U, lines.back().size()};
    }
    return ResolvedPosition{position.line, utf16ColumnToByteOffset(lines[position.line], position.character)};
}

std::string joinLines(const std::vector<std::string>& lines)
{
    std::size_t total = lines.size();
    for (const std::string& line : lines)
    {
        total += line.size();
    }
    std::string out;
    out.reserve(total);
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i != 0U)
        {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

bool parsePosition(const llvm::json::Object* object, TextPosition& position)
{
    if (!object)
    {
        return false;
    }
    const auto line      = object->getInteger("line");
    const auto character = object->getInteger("character");
    constexpr std::int64_t Max = std::numeric_limits<std::uint32_t>::max();
    if (!line || !character || *line < 0 || *character < 0 || *line > Max || *character > Max)
    {
        return false;
    }
    position.line      = static_cast<std::uint32_t>(*line);
    position.character = static_cast<std::uint32_t>(*character);
    return true;
}

}  // namespace

std::size_t utf16ColumnToByteOffset(const llvm::StringRef line, const std::uint32_t column)
{
    std::size_t limit = line.size();
    if (limit > 0U && line[limit - 1U] == '\r')
    {
        --limit;
    }

    std::size_t   offset = 0U;
    std::uint32_t units  = 0U;
    while (offset < limit && units < column)
    {
        const auto    lead   = static_cast<unsigned char>(line[offset]);
        std::size_t   length = 1U;
        std::uint32_t width  = 1U;
        if (lead >= 0xF0U)
        {
            length = 4U;
            width  = 2U;
        }
        else if (lead >= 0xE0U)
        {
            length = 3U;
        }
        else if (lead >= 0xC0U)
        {
            length = 2U;
        }
        if (units + width > column)
        {
            // Column points into a surrogate pair; stay before the character.
            break;
        }
        offset += std::min(length, limit - offset);
        units += width;
    }
    return offset;
}

llvm::Expected<std::vector<TextEdit>> parseTextEdits(const llvm::json::Value& value)
{
    std::vector<TextEdit> edits;
    if (value.kind() == llvm::json::Value::Null)
    {
        return edits;
    }

    const auto* array = value.getAsArray();
    if (!array)
    {
        return makeClientError(ClientErrorKind::ProtocolError, "expected a TextEdit array");
    }

    edits.reserve(array->size());
    for (std::size_t i = 0; i < array->size(); ++i)
    {
        const auto* object = (*array)[i].getAsObject();
        if (!object)
        {
            return makeClientError(ClientErrorKind::ProtocolError,
                                   "TextEdit at index " + std::to_string(i) + " is not an object");
        }
        const auto* range   = object->getObject("range");
        const auto  newText = object->getString("newText");
        TextEdit    edit;
        if (!range || !newText || !parsePosition(range->getObject("start"), edit.start) ||
            !parsePosition(range->getObject("end"), edit.end))
        {
            return makeClientError(ClientErrorKind::ProtocolError, "malformed TextEdit at index " + std::to_string(i));
        }
        edit.newText = newText->str();
        edits.push_back(std::move(edit));
    }
    return edits;
}

llvm::Expected<EditApplication> applyTextEdits(const llvm::StringRef original, std::vector<TextEdit> edits)
{
    EditApplication application;
    if (edits.empty())
    {
        application.text = original.str();
        return application;
    }

    std::vector<std::string> lines = splitLines(original);

    std::vector<ResolvedEdit> resolved;
    resolved.reserve(edits.size());
    for (std::size_t i = 0; i < edits.size(); ++i)
    {
        const TextEdit& edit = edits[i];
        if (std::tie(edit.start.line, edit.start.character) > std::tie(edit.end.line, edit.end.character))
        {
            return makeClientError(ClientErrorKind::InvalidArgument,
                                   "TextEdit " + std::to_string(i) + " starts after it ends");
        }
        resolved.push_back(ResolvedEdit{i,
                                        resolvePosition(lines, edit.start),
                                        resolvePosition(lines, edit.end),
                                        std::move(edits[i].newText)});
    }

    // Back to front; wider ranges first at a shared start, then later input first.
    std::sort(resolved.begin(), resolved.end(), [](const ResolvedEdit& lhs, const ResolvedEdit& rhs) {
        if (!(lhs.start == rhs.start))
        {
            return rhs.start < lhs.start;
        }
        if (!(lhs.end == rhs.end))
        {
            return rhs.end < lhs.end;
        }
        return lhs.index > rhs.index;
    });

    for (std::size_t i = 1; i < resolved.size(); ++i)
    {
        if (resolved[i - 1U].start < resolved[i].end)
        {
            return makeClientError(ClientErrorKind::InvalidArgument,
                                   "TextEdits " + std::to_string(resolved[i].index) + " and " +
                                       std::to_string(resolved[i - 1U].index) + " overlap");
        }
    }

    for (ResolvedEdit& edit : resolved)
    {
        const std::string prefix = lines[edit.start.line].substr(0, edit.start.byte);
        const std::string suffix = lines[edit.end.line].substr(edit.end.byte);

        if (edit.start.line == edit.end.line && edit.newText.find('\n') == std::string::npos)
        {
            lines[edit.start.line] = prefix + edit.newText + suffix;
            continue;
        }

        std::vector<std::string> replacement = splitLines(edit.newText);
        replacement.front().insert(0, prefix);
        replacement.back() += suffix;
        const auto first = lines.begin() + static_cast<std::ptrdiff_t>(edit.start.line);
        const auto last  = lines.begin() + static_cast<std::ptrdiff_t>(edit.end.line) + 1;
        const auto at    = lines.erase(first, last);
        lines.insert(at,
                     std::make_move_iterator(replacement.begin()),
                     std::make_move_iterator(replacement.end()));
    }

    application.text      = joinLines(lines);
    application.editCount = resolved.size();
    application.changed   = application.text != original;
    return application;
}

}  // namespace fsmcp::lsp
