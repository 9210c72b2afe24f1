#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nagoya_cpp {

namespace runtime {
class Container;
} // namespace runtime

enum class LifecyclePhase { PRE, POST };

enum class LifecycleEvent { INIT, CREATE, START, STOP, REMOVE };

std::string toString(LifecyclePhase phase);
std::string toString(LifecycleEvent event);

/**
 * @brief Parse "pre" / "post"; anything else is an INVALID_CALLBACK error
 */
LifecyclePhase parseLifecyclePhase(const std::string& text);

/**
 * @brief Parse "init" / "create" / "start" / "stop" / "remove"
 */
LifecycleEvent parseLifecycleEvent(const std::string& text);

using CallbackHandler = std::function<void(runtime::Container&)>;

struct EventCallback {
    LifecyclePhase phase;
    LifecycleEvent event;
    CallbackHandler handler;
    std::string handler_name;
};

/**
 * @brief Ordered table of lifecycle callbacks attached to one container
 *
 * Dispatch is synchronous and follows registration order. Exceptions thrown
 * by a handler propagate to the caller of dispatch().
 */
class CallbackRegistry {
public:
    void add(EventCallback callback);
    void add(LifecyclePhase phase,
             LifecycleEvent event,
             CallbackHandler handler,
             std::string handler_name = "");

    void dispatch(LifecyclePhase phase, LifecycleEvent event, runtime::Container& container) const;

    size_t count(LifecyclePhase phase, LifecycleEvent event) const;
    size_t size() const
    {
        return callbacks_.size();
    }
    bool empty() const
    {
        return callbacks_.empty();
    }

private:
    std::vector<EventCallback> callbacks_;
};

/**
 * @brief Named handlers the host application makes available to configuration
 */
class HandlerCatalog {
public:
    void registerHandler(const std::string& name, CallbackHandler handler);
    bool hasHandler(const std::string& name) const;
    const CallbackHandler& resolve(const std::string& name) const;

private:
    std::unordered_map<std::string, CallbackHandler> handlers_;
};

} // namespace nagoya_cpp
