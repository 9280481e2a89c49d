#pragma once

#include "esmcache/operation.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace esmcache {

/// Executes one family of operation payloads.
class OperationHandler {
public:
    virtual ~OperationHandler() = default;

    virtual bool can_handle(const OperationPayload& payload) const = 0;

    /// Runs the payload to completion. Handlers poll `token` between units of
    /// work and throw OperationCancelled when it fires.
    virtual OperationOutcome execute(const OperationPayload& payload,
                                     const CancellationToken& token) = 0;

    /// Family name for logging and metrics ("bulk_archive", "file_transfer").
    virtual std::string operation_type() const = 0;
};

/// Dispatches a payload to the first registered handler that accepts it.
class OperationRouter {
public:
    OperationRouter() = default;
    OperationRouter(const OperationRouter&) = delete;
    OperationRouter& operator=(const OperationRouter&) = delete;

    void register_handler(std::shared_ptr<OperationHandler> handler);

    /// Throws NoHandlerFound when nothing accepts the payload.
    std::shared_ptr<OperationHandler> route(const OperationPayload& payload) const;

    OperationOutcome execute(const OperationPayload& payload, const CancellationToken& token) const;

    size_t handler_count() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<OperationHandler>> handlers_;
};

}  // namespace esmcache
