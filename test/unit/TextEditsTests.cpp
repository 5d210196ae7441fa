//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>
#include <string>
#include <vector>

#include "fsmcp/LSP/TextEdits.h"
#include "fsmcp/Support/ClientError.h"
#include "llvm/Support/JSON.h"

namespace
{

using fsmcp::lsp::TextEdit;

TextEdit edit(std::uint32_t startLine,
              std::uint32_t startCharacter,
              std::uint32_t endLine,
              std::uint32_t endCharacter,
              std::string   newText)
{
    TextEdit result;
    result.start   = {startLine, startCharacter};
    result.end     = {endLine, endCharacter};
    result.newText = std::move(newText);
    return result;
}

/// Applies `edits` and compares against `expected`; reports under `label`.
bool expectApplied(const char*           label,
                   llvm::StringRef       original,
                   std::vector<TextEdit> edits,
                   const std::string&    expected)
{
    llvm::Expected<fsmcp::lsp::EditApplication> applied = fsmcp::lsp::applyTextEdits(original, std::move(edits));
    if (!applied)
    {
        std::cerr << label << ": unexpected error: " << llvm::toString(applied.takeError()) << "\n";
        return false;
    }
    if (applied->text != expected)
    {
        std::cerr << label << ": expected '" << expected << "' but got '" << applied->text << "'\n";
        return false;
    }
    return true;
}

bool expectRejected(const char* label, llvm::StringRef original, std::vector<TextEdit> edits)
{
    llvm::Expected<fsmcp::lsp::EditApplication> applied = fsmcp::lsp::applyTextEdits(original, std::move(edits));
    if (applied)
    {
        std::cerr << label << ": expected the edits to be rejected\n";
        return false;
    }
    if (fsmcp::takeClientErrorKind(applied.takeError()) != fsmcp::ClientErrorKind::InvalidArgument)
    {
        std::cerr << label << ": expected InvalidArgument\n";
        return false;
    }
    return true;
}

bool testApplication()
{
    bool ok = true;
    ok      = expectApplied("single-line replace", "let x = 1;\n", {edit(0, 4, 0, 5, "y")}, "let y = 1;\n") && ok;
    ok      = expectApplied("input order does not matter",
                       "abc\ndef\n",
                       {edit(0, 0, 0, 3, "ABC"), edit(1, 0, 1, 3, "DEF")},
                       "ABC\nDEF\n") &&
         ok;
    ok = expectApplied("descending input order",
                       "abc\ndef\n",
                       {edit(1, 0, 1, 3, "DEF"), edit(0, 0, 0, 3, "ABC")},
                       "ABC\nDEF\n") &&
         ok;
    ok = expectApplied("abutting multi-line edits",
                       "aa\nbb\ncc\ndd",
                       {edit(0, 1, 1, 1, "X\nY"), edit(1, 1, 3, 1, "Z")},
                       "aX\nYZd") &&
         ok;
    ok = expectApplied("abutting multi-line edits reversed",
                       "aa\nbb\ncc\ndd",
                       {edit(1, 1, 3, 1, "Z"), edit(0, 1, 1, 1, "X\nY")},
                       "aX\nYZd") &&
         ok;
    ok = expectApplied("multi-line replacement", "aaa\nbbb\nccc", {edit(0, 2, 2, 1, "X\nY")}, "aaX\nYcc") && ok;
    ok = expectApplied("insert line", "a\nb", {edit(1, 0, 1, 0, "new\n")}, "a\nnew\nb") && ok;
    ok = expectApplied("join lines", "ab\ncd", {edit(0, 1, 1, 0, "")}, "acd") && ok;
    ok = expectApplied("same-position inserts keep order",
                       "x",
                       {edit(0, 0, 0, 0, "a"), edit(0, 0, 0, 0, "b")},
                       "abx") &&
         ok;
    ok = expectApplied("insert before replaced range",
                       "hello",
                       {edit(0, 0, 0, 5, "HELLO"), edit(0, 0, 0, 0, ">")},
                       ">HELLO") &&
         ok;
    ok = expectApplied("adjacent edits", "abcd", {edit(0, 0, 0, 2, "X"), edit(0, 2, 0, 4, "Y")}, "XY") && ok;
    ok = expectApplied("full replacement over CRLF", "a\r\nb\r\n", {edit(0, 0, 2, 0, "X\n")}, "X\n") && ok;
    ok = expectApplied("full replacement over mixed endings", "a\nb\r\nc", {edit(0, 0, 9, 0, "X")}, "X") && ok;
    return ok;
}

bool testClamping()
{
    bool ok = true;
    ok      = expectApplied("character past line end", "ab\ncd", {edit(0, 10, 0, 10, "?")}, "ab?\ncd") && ok;
    ok      = expectApplied("line past document end", "ab", {edit(5, 0, 5, 0, "!")}, "ab!") && ok;
    ok      = expectApplied("range running past the end", "ab\ncd", {edit(1, 1, 9, 9, "")}, "ab\nc") && ok;
    ok      = expectApplied("carriage return stays", "ab\r\ncd\r\n", {edit(0, 5, 0, 5, "Z")}, "abZ\r\ncd\r\n") && ok;
    return ok;
}

bool testUtf16Columns()
{
    const std::string emojiLine = "a\xF0\x9F\x98\x80" "b";
    if (fsmcp::lsp::utf16ColumnToByteOffset(emojiLine, 3) != 5 ||
        fsmcp::lsp::utf16ColumnToByteOffset(emojiLine, 1) != 1)
    {
        std::cerr << "astral characters count as two UTF-16 units\n";
        return false;
    }
    if (fsmcp::lsp::utf16ColumnToByteOffset(emojiLine, 2) != 1)
    {
        std::cerr << "a column inside a surrogate pair should stop before the character\n";
        return false;
    }
    if (fsmcp::lsp::utf16ColumnToByteOffset("\xC3\xA9x", 1) != 2 ||
        fsmcp::lsp::utf16ColumnToByteOffset("\xE2\x9C\x93x", 1) != 3)
    {
        std::cerr << "two- and three-byte sequences count as one UTF-16 unit\n";
        return false;
    }
    return expectApplied("edit after astral character",
                         emojiLine,
                         {edit(0, 3, 0, 4, "B")},
                         "a\xF0\x9F\x98\x80" "B");
}

bool testRejections()
{
    bool ok = true;
    ok      = expectRejected("overlapping ranges", "abcdef", {edit(0, 0, 0, 3, "x"), edit(0, 2, 0, 4, "y")}) && ok;
    ok      = expectRejected("inverted range", "abcdef", {edit(0, 4, 0, 2, "x")}) && ok;
    ok      = expectRejected("nested ranges", "a\nb\nc", {edit(0, 0, 2, 1, ""), edit(1, 0, 1, 1, "B")}) && ok;
    return ok;
}

bool testNoChange()
{
    llvm::Expected<fsmcp::lsp::EditApplication> none = fsmcp::lsp::applyTextEdits("same\n", {});
    if (!none || none->changed || none->editCount != 0 || none->text != "same\n")
    {
        std::cerr << "an empty edit list should leave the text unchanged\n";
        return false;
    }
    llvm::Expected<fsmcp::lsp::EditApplication> identity =
        fsmcp::lsp::applyTextEdits("same\n", {edit(0, 0, 0, 4, "same")});
    if (!identity || identity->changed || identity->editCount != 1)
    {
        std::cerr << "an edit that rewrites identical text should report no change\n";
        return false;
    }
    return true;
}

bool testParsing()
{
    llvm::Expected<std::vector<TextEdit>> empty = fsmcp::lsp::parseTextEdits(nullptr);
    if (!empty || !empty->empty())
    {
        std::cerr << "null formatting result should parse as no edits\n";
        return false;
    }

    const llvm::json::Value valid = llvm::json::Array{llvm::json::Object{
        {"range",
         llvm::json::Object{
             {"start", llvm::json::Object{{"line", 2}, {"character", 4}}},
             {"end", llvm::json::Object{{"line", 2}, {"character", 8}}},
         }},
        {"newText", "  "},
    }};
    llvm::Expected<std::vector<TextEdit>> parsed = fsmcp::lsp::parseTextEdits(valid);
    if (!parsed || parsed->size() != 1 || (*parsed)[0].start.line != 2 || (*parsed)[0].end.character != 8 ||
        (*parsed)[0].newText != "  ")
    {
        std::cerr << "well-formed TextEdit did not parse as expected\n";
        return false;
    }

    const llvm::json::Value malformed = llvm::json::Array{
        valid.getAsArray()->front(),
        llvm::json::Object{{"range", llvm::json::Object{}}},
    };
    llvm::Expected<std::vector<TextEdit>> rejected = fsmcp::lsp::parseTextEdits(malformed);
    if (rejected)
    {
        std::cerr << "TextEdit without newText should be rejected\n";
        return false;
    }
    const std::string message = llvm::toString(rejected.takeError());
    if (message.find("index 1") == std::string::npos)
    {
        std::cerr << "parse error should name the offending index: " << message << "\n";
        return false;
    }

    const llvm::json::Value negative = llvm::json::Array{llvm::json::Object{
        {"range",
         llvm::json::Object{
             {"start", llvm::json::Object{{"line", -1}, {"character", 0}}},
             {"end", llvm::json::Object{{"line", 0}, {"character", 0}}},
         }},
        {"newText", ""},
    }};
    llvm::Expected<std::vector<TextEdit>> negativeParsed = fsmcp::lsp::parseTextEdits(negative);
    if (negativeParsed ||
        fsmcp::takeClientErrorKind(negativeParsed.takeError()) != fsmcp::ClientErrorKind::ProtocolError)
    {
        std::cerr << "negative positions should be a protocol error\n";
        return false;
    }

    llvm::Expected<std::vector<TextEdit>> notArray = fsmcp::lsp::parseTextEdits(llvm::json::Object{});
    if (notArray)
    {
        std::cerr << "a non-array formatting result should be rejected\n";
        return false;
    }
    llvm::consumeError(notArray.takeError());
    return true;
}

}  // namespace

bool runTextEditsTests()
{
    bool ok = true;
    ok      = testApplication() && ok;
    ok      = testClamping() && ok;
    ok      = testUtf16Columns() && ok;
    ok      = testRejections() && ok;
    ok      = testNoChange() && ok;
    ok      = testParsing() && ok;
    return ok;
}
