//===----------------------------------------------------------------------===//
//
// Part of the fsmcp project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request/response correlation.
///
//===----------------------------------------------------------------------===//

#include "fsmcp/LSP/RpcCorrelator.h"

#include "fsmcp/LSP/JsonRpcFramer.h"
#include "llvm/Support/raw_ostream.h"

#include <utility>
#include <vector>

namespace fsmcp::lsp
{
namespace
{

std::string describeId(const llvm::json::Value& id)
{
    std::string              text;
    llvm::raw_string_ostream stream(text);
    stream << id;
    stream.flush();
    return text;
}

}  // namespace

RpcCorrelator::RpcCorrelator(std::string name, EventLoop& loop, WriteFn write, Logger& logger, Telemetry* telemetry)
    : name_(std::move(name))
    , loop_(loop)
    , write_(std::move(write))
    , logger_(logger)
    , telemetry_(telemetry)
{
}

RpcCorrelator::~RpcCorrelator()
{
    for (const auto& [_, request] : pending_)
    {
        loop_.cancelTimer(request.timer);
    }
}

void RpcCorrelator::setNotificationHandler(NotificationHandler handler)
{
    notificationHandler_ = std::move(handler);
}

void RpcCorrelator::setRequestHandler(RequestHandler handler)
{
    requestHandler_ = std::move(handler);
}

std::int64_t RpcCorrelator::sendRequest(const llvm::StringRef           method,
                                        llvm::json::Value               params,
                                        const std::chrono::milliseconds timeout,
                                        Completion                      completion)
{
    const std::int64_t id = nextId_++;
    llvm::json::Object message{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
    };
    if (params.kind() != llvm::json::Value::Null)
    {
        message["params"] = std::move(params);
    }

    std::string error;
    if (!writeMessage(llvm::json::Value(std::move(message)), error))
    {
        logger_.error(name_, "cannot send " + method + " #" + llvm::Twine(id) + ": " + error);
        if (completion)
        {
            completion(RpcOutcome{RpcStatus::Unavailable, nullptr, 0, std::move(error)});
        }
        return id;
    }
    logger_.trace(name_, "--> " + method + " #" + llvm::Twine(id));

    PendingRequest request;
    request.method     = method.str();
    request.completion = std::move(completion);
    request.start      = Clock::now();
    request.timer      = loop_.scheduleAfter(timeout, [this, id, timeout]() { expire(id, timeout); });
    pending_.emplace(id, std::move(request));
    return id;
}

bool RpcCorrelator::sendNotification(const llvm::StringRef method, llvm::json::Value params)
{
    llvm::json::Object message{
        {"jsonrpc", "2.0"},
        {"method", method},
    };
    if (params.kind() != llvm::json::Value::Null)
    {
        message["params"] = std::move(params);
    }

    std::string error;
    if (!writeMessage(llvm::json::Value(std::move(message)), error))
    {
        logger_.error(name_, "cannot send " + method + ": " + error);
        return false;
    }
    logger_.trace(name_, "--> " + method);
    return true;
}

void RpcCorrelator::handleMessage(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        logger_.error(name_, "ignoring non-object JSON-RPC message");
        return;
    }

    const llvm::json::Value* id     = object->get("id");
    const auto               method = object->getString("method");
    if (method)
    {
        const llvm::json::Value* params = object->get("params");
        const llvm::json::Value  empty(nullptr);
        if (id)
        {
            handleServerRequest(*method, *id, params ? *params : empty);
            return;
        }
        logger_.trace(name_, "<-- " + *method);
        if (notificationHandler_)
        {
            notificationHandler_(*method, params ? *params : empty);
        }
        return;
    }

    if (id)
    {
        handleResponse(*object, *id);
        return;
    }
    logger_.error(name_, "ignoring JSON-RPC message with neither id nor method");
}

void RpcCorrelator::failAll(const RpcStatus status, const std::string& reason)
{
    std::vector<std::int64_t> ids;
    ids.reserve(pending_.size());
    for (const auto& [id, _] : pending_)
    {
        ids.push_back(id);
    }
    for (const std::int64_t id : ids)
    {
        complete(id, RpcOutcome{status, nullptr, 0, reason});
    }
}

void RpcCorrelator::handleResponse(const llvm::json::Object& message, const llvm::json::Value& id)
{
    const auto numericId = id.getAsInteger();
    if (!numericId || pending_.find(*numericId) == pending_.end())
    {
        // Late answers to timed-out requests land here.
        logger_.trace(name_, "<-- discarding response for unknown id " + describeId(id));
        return;
    }

    if (const auto* error = message.getObject("error"))
    {
        RpcOutcome outcome;
        outcome.status = RpcStatus::RemoteError;
        if (const auto code = error->getInteger("code"))
        {
            outcome.errorCode = *code;
        }
        if (const auto text = error->getString("message"))
        {
            outcome.errorMessage = text->str();
        }
        else
        {
            outcome.errorMessage = "server returned an error without a message";
        }
        logger_.trace(name_, "<-- error #" + llvm::Twine(*numericId) + ": " + outcome.errorMessage);
        complete(*numericId, std::move(outcome));
        return;
    }

    RpcOutcome outcome;
    if (const llvm::json::Value* result = message.get("result"))
    {
        outcome.result = *result;
    }
    logger_.trace(name_, "<-- result #" + llvm::Twine(*numericId));
    complete(*numericId, std::move(outcome));
}

void RpcCorrelator::handleServerRequest(const llvm::StringRef    method,
                                        const llvm::json::Value& id,
                                        const llvm::json::Value& params)
{
    logger_.trace(name_, "<-- request " + method + " " + describeId(id));

    RpcOutcome outcome{RpcStatus::RemoteError, nullptr, MethodNotFoundCode, "Method not found: " + method.str()};
    if (requestHandler_)
    {
        outcome = requestHandler_(method, params);
    }

    llvm::json::Object response{{"jsonrpc", "2.0"}, {"id", id}};
    if (outcome.ok())
    {
        response["result"] = std::move(outcome.result);
    }
    else
    {
        const std::int64_t code = outcome.status == RpcStatus::RemoteError ? outcome.errorCode : MethodNotFoundCode;
        response["error"] = llvm::json::Object{{"code", code}, {"message", std::move(outcome.errorMessage)}};
    }

    std::string error;
    if (!writeMessage(llvm::json::Value(std::move(response)), error))
    {
        logger_.error(name_, "cannot answer " + method + ": " + error);
    }
}

void RpcCorrelator::expire(const std::int64_t id, const std::chrono::milliseconds timeout)
{
    const auto it = pending_.find(id);
    if (it == pending_.end())
    {
        return;
    }
    it->second.timer = 0;
    const std::string message =
        it->second.method + " #" + std::to_string(id) + " timed out after " + std::to_string(timeout.count()) + " ms";
    logger_.info(name_, message);
    complete(id, RpcOutcome{RpcStatus::Timeout, nullptr, 0, message});
}

void RpcCorrelator::complete(const std::int64_t id, RpcOutcome outcome)
{
    const auto it = pending_.find(id);
    if (it == pending_.end())
    {
        return;
    }
    PendingRequest request = std::move(it->second);
    pending_.erase(it);
    if (request.timer != 0)
    {
        loop_.cancelTimer(request.timer);
    }

    if (telemetry_)
    {
        const auto latency = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - request.start);
        telemetry_->record(RequestMetric{name_,
                                         request.method,
                                         static_cast<std::uint64_t>(latency.count()),
                                         outcome.status});
    }
    if (request.completion)
    {
        request.completion(std::move(outcome));
    }
}

bool RpcCorrelator::writeMessage(const llvm::json::Value& message, std::string& error)
{
    if (!write_)
    {
        error = "no connection";
        return false;
    }
    if (llvm::Error writeError = write_(encodeMessage(message)))
    {
        error = llvm::toString(std::move(writeError));
        return false;
    }
    return true;
}

}  // namespace fsmcp::lsp
