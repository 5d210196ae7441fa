//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Conversion between absolute filesystem paths and `file://` URIs.
///
//===----------------------------------------------------------------------===//
#ifndef FSMCP_SUPPORT_URI_H
#define FSMCP_SUPPORT_URI_H

#include "llvm/ADT/StringRef.h"

#include <string>

namespace fsmcp
{

/// @brief Encodes an absolute path as a `file://` URI.
/// @param[in] absolutePath Absolute path using `/` or `\` separators.
/// @return Percent-encoded URI.
[[nodiscard]] std::string pathToUri(llvm::StringRef absolutePath);

/// @brief Decodes a `file://` URI into a filesystem path.
/// @param[in] uri Document URI.
/// @return Decoded path, or `uri` unchanged when it is not a `file://` URI.
[[nodiscard]] std::string uriToPath(llvm::StringRef uri);

}  // namespace fsmcp

#endif  // FSMCP_SUPPORT_URI_H
