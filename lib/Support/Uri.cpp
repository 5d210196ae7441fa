//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `file://` URI encoding and decoding.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/Support/Uri.h"

#include "llvm/ADT/StringExtras.h"

#include <cctype>

namespace fsmcp
{
namespace
{

bool isUnreserved(const unsigned char ch)
{
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/';
}

}  // namespace

std::string pathToUri(const llvm::StringRef absolutePath)
{
    std::string normalized = absolutePath.str();
    for (char& ch : normalized)
    {
        if (ch == '\\')
        {
            ch = '/';
        }
    }

    std::string uri = "file://";
    // Drive-letter paths (`C:/x`) still need the empty authority slash.
    if (normalized.empty() || normalized.front() != '/')
    {
        uri.push_back('/');
    }
    const bool hasDriveLetter =
        normalized.size() >= 2 && std::isalpha(static_cast<unsigned char>(normalized[0])) != 0 && normalized[1] == ':';
    for (std::size_t i = 0; i < normalized.size(); ++i)
    {
        const char ch   = normalized[i];
        const auto byte = static_cast<unsigned char>(ch);
        if (isUnreserved(byte) || (hasDriveLetter && i == 1))
        {
            uri.push_back(ch);
            continue;
        }
        uri.push_back('%');
        uri.push_back(llvm::hexdigit(byte >> 4U, false));
        uri.push_back(llvm::hexdigit(byte & 0x0FU, false));
    }
    return uri;
}

std::string uriToPath(const llvm::StringRef uri)
{
    llvm::StringRef rest = uri;
    if (!rest.consume_front("file://"))
    {
        return uri.str();
    }

    std::string decoded;
    decoded.reserve(rest.size());
    for (std::size_t i = 0; i < rest.size(); ++i)
    {
        const char ch = rest[i];
        if (ch == '%' && i + 2 < rest.size() && llvm::isHexDigit(rest[i + 1]) && llvm::isHexDigit(rest[i + 2]))
        {
            decoded.push_back(static_cast<char>((llvm::hexDigitValue(rest[i + 1]) << 4U) |
                                                llvm::hexDigitValue(rest[i + 2])));
            i += 2;
            continue;
        }
        decoded.push_back(ch);
    }

    // `file:///C:/x` decodes to `/C:/x`; strip the authority slash.
    if (decoded.size() >= 3 && decoded[0] == '/' && std::isalpha(static_cast<unsigned char>(decoded[1])) != 0 &&
        decoded[2] == ':')
    {
        decoded.erase(decoded.begin());
    }
    return decoded;
}

}  // namespace fsmcp
