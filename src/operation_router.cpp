#include "esmcache/operation_router.hpp"
#include "esmcache/errors.hpp"
#include "esmcache/log.hpp"

namespace esmcache {

void OperationRouter::register_handler(std::shared_ptr<OperationHandler> handler) {
    if (!handler) throw ValidationError("cannot register a null handler");
    std::lock_guard lock(mutex_);
    log_debug("Registered handler: %s", handler->operation_type().c_str());
    handlers_.push_back(std::move(handler));
}

std::shared_ptr<OperationHandler> OperationRouter::route(const OperationPayload& payload) const {
    std::lock_guard lock(mutex_);
    for (const auto& handler : handlers_) {
        if (handler->can_handle(payload)) return handler;
    }
    throw NoHandlerFound(payload_kind(payload));
}

OperationOutcome OperationRouter::execute(const OperationPayload& payload,
                                          const CancellationToken& token) const {
    // Handler runs outside the router lock
    auto handler = route(payload);
    return handler->execute(payload, token);
}

size_t OperationRouter::handler_count() const {
    std::lock_guard lock(mutex_);
    return handlers_.size();
}

}  // namespace esmcache
