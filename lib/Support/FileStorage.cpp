//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements filesystem-backed document storage.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/Support/FileStorage.h"

#include "fsmcp/Support/ClientError.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <system_error>

namespace fsmcp
{

std::string normalizeAbsolutePath(const llvm::StringRef path)
{
    llvm::SmallString<256> absolute(path);
    if (const std::error_code ec = llvm::sys::fs::make_absolute(absolute))
    {
        absolute = path;
    }
    llvm::sys::path::remove_dots(absolute, true);
    if (absolute.size() > 1U && llvm::sys::path::is_separator(absolute.back()))
    {
        absolute.pop_back();
    }
    return std::string(absolute.str());
}

llvm::Expected<std::string> resolveWithinRoot(const llvm::StringRef projectRoot, const llvm::StringRef path)
{
    if (path.empty())
    {
        return makeClientError(ClientErrorKind::InvalidArgument, "empty document path");
    }

    llvm::SmallString<256> candidate;
    if (llvm::sys::path::is_absolute(path))
    {
        candidate = path;
    }
    else
    {
        candidate = projectRoot;
        llvm::sys::path::append(candidate, path);
    }
    llvm::sys::path::remove_dots(candidate, true);
    std::string resolved(candidate.str());

    bool inside = resolved == projectRoot;
    if (!inside && resolved.size() > projectRoot.size() &&
        resolved.compare(0, projectRoot.size(), projectRoot.data(), projectRoot.size()) == 0)
    {
        inside = llvm::sys::path::is_separator(resolved[projectRoot.size()]) ||
                 llvm::sys::path::is_separator(projectRoot.back());
    }
    if (!inside)
    {
        return makeClientError(ClientErrorKind::InvalidArgument,
                               "path '" + path.str() + "' is outside the project root '" + projectRoot.str() + "'");
    }
    return resolved;
}

FileStorage::FileStorage(const llvm::StringRef projectRoot)
    : projectRoot_(normalizeAbsolutePath(projectRoot))
{
}

llvm::Expected<std::string> FileStorage::resolvePath(const llvm::StringRef path) const
{
    return resolveWithinRoot(projectRoot_, path);
}

llvm::Expected<std::string> FileStorage::readText(const llvm::StringRef path)
{
    llvm::Expected<std::string> resolved = resolvePath(path);
    if (!resolved)
    {
        return resolved.takeError();
    }

    llvm::ErrorOr<std::unique_ptr<llvm::MemoryBuffer>> buffer =
        llvm::MemoryBuffer::getFile(*resolved, /*IsText=*/false, /*RequiresNullTerminator=*/false);
    if (!buffer)
    {
        return makeClientError(ClientErrorKind::StorageFailure,
                               "cannot read '" + *resolved + "': " + buffer.getError().message());
    }
    return (*buffer)->getBuffer().str();
}

llvm::Error FileStorage::writeText(const llvm::StringRef path, const llvm::StringRef text)
{
    llvm::Expected<std::string> resolved = resolvePath(path);
    if (!resolved)
    {
        return resolved.takeError();
    }

    std::error_code      ec;
    llvm::raw_fd_ostream out(*resolved, ec, llvm::sys::fs::OF_None);
    if (ec)
    {
        return makeClientError(ClientErrorKind::StorageFailure, "cannot open '" + *resolved + "': " + ec.message());
    }
    out << text;
    out.close();
    if (out.has_error())
    {
        const std::error_code writeError = out.error();
        out.clear_error();
        return makeClientError(ClientErrorKind::StorageFailure,
                               "cannot write '" + *resolved + "': " + writeError.message());
    }
    return llvm::Error::success();
}

}  // namespace fsmcp
