/**
 * @file registry.cpp
 * @brief Handler registry implementation.
 */

#include <ubjson/registry.hpp>

namespace ubjson {

HandlerRegistry::HandlerRegistry()
    : native_{typeid(Null),       typeid(bool),         typeid(Integer), typeid(double),
              typeid(HugeNumber), typeid(std::string),  typeid(Array),   typeid(UnsizedArray),
              typeid(Object),     typeid(UnsizedObject)} {}

HandlerRegistry::HandlerRegistry(Handler default_handler, TypeHandlers handlers,
                                 std::vector<Capability> capabilities)
    : HandlerRegistry() {
    for (auto& [type, handler] : handlers) {
        if (!handler) {
            native_.erase(type);
            continue;
        }
        exact_.insert_or_assign(type, std::move(handler));
    }

    capabilities_.reserve(capabilities.size());
    for (auto& capability : capabilities) {
        if (capability.matches && capability.handler) {
            capabilities_.push_back(std::move(capability));
        }
    }

    default_ = std::move(default_handler);
}

Resolution HandlerRegistry::resolve(const Value& value) const {
    if (value.is_noop()) {
        return {Route::Noop, nullptr};
    }

    std::type_index key = value.type_key();

    auto found = exact_.find(key);
    if (found != exact_.end()) {
        return {Route::Adapt, &found->second};
    }
    if (native_.count(key) != 0) [[likely]] {
        return {Route::Native, nullptr};
    }

    for (const auto& capability : capabilities_) {
        if (capability.matches(value)) {
            return {Route::Adapt, &capability.handler};
        }
    }

    if (default_) {
        return {Route::Adapt, &default_};
    }

    return {Route::Unsupported, nullptr};
}

} // namespace ubjson
