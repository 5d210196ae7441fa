//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include "TestDoubles.h"

#include "fsmcp/Support/ClientError.h"

#include <iostream>
#include <thread>
#include <utility>

namespace fsmcp::test
{

ScriptedTransport::ScriptedTransport(FakeServerBehavior behavior)
    : script_(behavior)
{
}

llvm::Error ScriptedTransport::start(lsp::TransportCallbacks callbacks)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (startFailure_)
    {
        return makeClientError(ClientErrorKind::LaunchFailure, *startFailure_);
    }
    callbacks_ = std::move(callbacks);
    running_.store(true);
    return llvm::Error::success();
}

llvm::Error ScriptedTransport::write(const llvm::StringRef bytes)
{
    std::vector<std::string> replies;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failWrites_ || !running_.load())
        {
            return makeClientError(ClientErrorKind::Unavailable, "scripted transport is not writable");
        }
        framer_.append(bytes);
        for (const std::string& payload : framer_.drain())
        {
            llvm::json::Value message(nullptr);
            std::string       error;
            if (!lsp::parsePayload(payload, message, error))
            {
                continue;
            }
            received_.push_back(message);
            for (const llvm::json::Value& reply : script_.handle(message))
            {
                replies.push_back(lsp::encodeMessage(reply));
            }
        }
    }
    for (const std::string& reply : replies)
    {
        deliver(reply);
    }
    return llvm::Error::success();
}

void ScriptedTransport::terminate()
{
    terminated_.store(true);
    if (running_.exchange(false) && callbacks_.onClosed)
    {
        callbacks_.onClosed("scripted server terminated");
    }
}

bool ScriptedTransport::running() const
{
    return running_.load();
}

std::string ScriptedTransport::describe() const
{
    return "scripted server";
}

void ScriptedTransport::failStart(std::string message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    startFailure_ = std::move(message);
}

void ScriptedTransport::failWrites()
{
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = true;
}

void ScriptedTransport::sendToClient(const llvm::json::Value& message)
{
    deliver(lsp::encodeMessage(message));
}

void ScriptedTransport::sendRawToClient(std::string bytes)
{
    deliver(bytes);
}

void ScriptedTransport::closeFromServer(std::string reason)
{
    if (running_.exchange(false) && callbacks_.onClosed)
    {
        callbacks_.onClosed(std::move(reason));
    }
}

std::vector<std::string> ScriptedTransport::methods() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return script_.methods();
}

std::size_t ScriptedTransport::countMethod(const llvm::StringRef method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t                 count = 0;
    for (const std::string& seen : script_.methods())
    {
        if (seen == method)
        {
            ++count;
        }
    }
    return count;
}

llvm::json::Value ScriptedTransport::lastMessage(const llvm::StringRef method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = received_.rbegin(); it != received_.rend(); ++it)
    {
        const auto* object = it->getAsObject();
        if (!object)
        {
            continue;
        }
        if (const auto seen = object->getString("method"); seen && *seen == method)
        {
            return *it;
        }
    }
    return nullptr;
}

std::vector<llvm::json::Value> ScriptedTransport::clientReplies() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return script_.clientReplies();
}

std::string ScriptedTransport::serverText(const llvm::StringRef uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return script_.documentText(uri);
}

void ScriptedTransport::deliver(const std::string& bytes)
{
    if (running_.load() && callbacks_.onData)
    {
        callbacks_.onData(bytes);
    }
}

InMemoryStorage::InMemoryStorage(std::string projectRoot)
    : projectRoot_(std::move(projectRoot))
{
}

llvm::Expected<std::string> InMemoryStorage::resolvePath(const llvm::StringRef path) const
{
    return resolveWithinRoot(projectRoot_, path);
}

llvm::Expected<std::string> InMemoryStorage::readText(const llvm::StringRef path)
{
    llvm::Expected<std::string> resolved = resolvePath(path);
    if (!resolved)
    {
        return resolved.takeError();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = files_.find(*resolved);
    if (it == files_.end())
    {
        return makeClientError(ClientErrorKind::StorageFailure, "no such file '" + *resolved + "'");
    }
    return it->second;
}

llvm::Error InMemoryStorage::writeText(const llvm::StringRef path, const llvm::StringRef text)
{
    llvm::Expected<std::string> resolved = resolvePath(path);
    if (!resolved)
    {
        return resolved.takeError();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (failWrites_)
    {
        return makeClientError(ClientErrorKind::StorageFailure, "read-only storage");
    }
    files_[*resolved] = text.str();
    ++writes_;
    return llvm::Error::success();
}

void InMemoryStorage::put(const llvm::StringRef path, std::string text)
{
    llvm::Expected<std::string> resolved = resolvePath(path);
    if (!resolved)
    {
        llvm::consumeError(resolved.takeError());
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    files_[*resolved] = std::move(text);
}

std::string InMemoryStorage::get(const llvm::StringRef path) const
{
    llvm::Expected<std::string> resolved = resolvePath(path);
    if (!resolved)
    {
        llvm::consumeError(resolved.takeError());
        return {};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = files_.find(*resolved);
    return it == files_.end() ? std::string() : it->second;
}

void InMemoryStorage::failWrites()
{
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = true;
}

std::size_t InMemoryStorage::writeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

bool waitUntil(const std::function<bool()>& predicate, const std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

bool expectErrorKind(llvm::Error error, const ClientErrorKind kind, const llvm::StringRef label)
{
    if (!error)
    {
        std::cerr << label.str() << ": expected " << clientErrorKindName(kind).str() << " but the call succeeded\n";
        return false;
    }

    bool        matched = false;
    std::string message;
    llvm::handleAllErrors(
        std::move(error),
        [&](const ClientError& clientError) {
            matched = clientError.kind() == kind;
            message = clientErrorKindName(clientError.kind()).str() + ": " + clientError.message();
        },
        [&](const llvm::ErrorInfoBase& other) { message = other.message(); });
    if (!matched)
    {
        std::cerr << label.str() << ": expected " << clientErrorKindName(kind).str() << " but got " << message
                  << "\n";
    }
    return matched;
}

bool expectSuccess(llvm::Error error, const llvm::StringRef label)
{
    if (error)
    {
        std::cerr << label.str() << ": unexpected error: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    return true;
}

}  // namespace fsmcp::test
