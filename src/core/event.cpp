#include <nagoya-cpp/core/error.hpp>
#include <nagoya-cpp/core/event.hpp>

#include <algorithm>

namespace nagoya_cpp {

std::string toString(LifecyclePhase phase)
{
    switch (phase) {
        case LifecyclePhase::PRE:
            return "pre";
        case LifecyclePhase::POST:
            return "post";
    }
    return "unknown";
}

std::string toString(LifecycleEvent event)
{
    switch (event) {
        case LifecycleEvent::INIT:
            return "init";
        case LifecycleEvent::CREATE:
            return "create";
        case LifecycleEvent::START:
            return "start";
        case LifecycleEvent::STOP:
            return "stop";
        case LifecycleEvent::REMOVE:
            return "remove";
    }
    return "unknown";
}

LifecyclePhase parseLifecyclePhase(const std::string& text)
{
    if (text == "pre") {
        return LifecyclePhase::PRE;
    }
    if (text == "post") {
        return LifecyclePhase::POST;
    }
    throw BuildError(ErrorCode::INVALID_CALLBACK, "Event part '" + text + "' is not valid");
}

LifecycleEvent parseLifecycleEvent(const std::string& text)
{
    static const std::unordered_map<std::string, LifecycleEvent> events = {
        {"init", LifecycleEvent::INIT},
        {"create", LifecycleEvent::CREATE},
        {"start", LifecycleEvent::START},
        {"stop", LifecycleEvent::STOP},
        {"remove", LifecycleEvent::REMOVE},
    };

    auto it = events.find(text);
    if (it == events.end()) {
        throw BuildError(ErrorCode::INVALID_CALLBACK, "Event '" + text + "' is not valid");
    }
    return it->second;
}

void CallbackRegistry::add(EventCallback callback)
{
    if (!callback.handler) {
        throw BuildError(ErrorCode::INVALID_CALLBACK,
                         "Empty handler for " + toString(callback.phase) + "_" +
                             toString(callback.event));
    }
    callbacks_.push_back(std::move(callback));
}

void CallbackRegistry::add(LifecyclePhase phase,
                           LifecycleEvent event,
                           CallbackHandler handler,
                           std::string handler_name)
{
    add(EventCallback{phase, event, std::move(handler), std::move(handler_name)});
}

void CallbackRegistry::dispatch(LifecyclePhase phase,
                                LifecycleEvent event,
                                runtime::Container& container) const
{
    for (const auto& callback : callbacks_) {
        if (callback.phase == phase && callback.event == event) {
            callback.handler(container);
        }
    }
}

size_t CallbackRegistry::count(LifecyclePhase phase, LifecycleEvent event) const
{
    return static_cast<size_t>(
        std::count_if(callbacks_.begin(), callbacks_.end(), [&](const EventCallback& callback) {
            return callback.phase == phase && callback.event == event;
        }));
}

void HandlerCatalog::registerHandler(const std::string& name, CallbackHandler handler)
{
    if (name.empty()) {
        throw BuildError(ErrorCode::INVALID_CALLBACK, "Handler name cannot be empty");
    }
    handlers_[name] = std::move(handler);
}

bool HandlerCatalog::hasHandler(const std::string& name) const
{
    return handlers_.find(name) != handlers_.end();
}

const CallbackHandler& HandlerCatalog::resolve(const std::string& name) const
{
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw BuildError(ErrorCode::HANDLER_NOT_FOUND, "No handler registered as '" + name + "'");
    }
    return it->second;
}

} // namespace nagoya_cpp
