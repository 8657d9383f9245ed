/**
 * @file registry.hpp
 * @brief Handler registry resolving a value to its encode route.
 *
 * Resolution order:
 * 1. the Noop sentinel always takes the noop route
 * 2. exact type match (override handlers first, then native encoders)
 * 3. first matching capability, in registration order
 * 4. the default handler
 *
 * Capabilities are first-match, not best-match: overlapping registrations
 * resolve to whichever was registered first.
 *
 * A handler adapts a value into another Value; its result is encoded by
 * the native encoders and is never dispatched through the registry again.
 */

#ifndef UBJSON_REGISTRY_HPP
#define UBJSON_REGISTRY_HPP

#include "value.hpp"

#include <functional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ubjson {

/// Adapts a value into one the native encoders accept
using Handler = std::function<Value(const Value&)>;

/// Exact type overrides; an empty Handler removes the native encoder for that type
using TypeHandlers = std::unordered_map<std::type_index, Handler>;

/**
 * @brief Category of values sharing a capability (e.g. "string-like").
 */
struct Capability {
    std::string name;
    std::function<bool(const Value&)> matches;
    Handler handler;
};

/**
 * @brief How a value is to be encoded.
 */
enum class Route {
    Noop,       ///< Emit the no-op marker
    Native,     ///< Encode with the built-in encoder for its alternative
    Adapt,      ///< Run handler, then encode its result natively
    Unsupported ///< Nothing resolves the value
};

struct Resolution {
    Route route = Route::Unsupported;
    const Handler* handler = nullptr; ///< Set for Route::Adapt
};

/**
 * @brief Immutable type → handler table built once per encoder.
 */
class HandlerRegistry {
public:
    /**
     * @brief Registry with native encoders only.
     */
    HandlerRegistry();

    /**
     * @brief Registry with caller extensions merged in.
     *
     * @param default_handler Fallback when nothing else matches (may be empty)
     * @param handlers Exact type overrides
     * @param capabilities Categories tried in order after exact lookup
     */
    HandlerRegistry(Handler default_handler, TypeHandlers handlers,
                    std::vector<Capability> capabilities);

    /**
     * @brief Resolve the encode route for a value.
     */
    [[nodiscard]] Resolution resolve(const Value& value) const;

    [[nodiscard]] bool has_default() const noexcept { return static_cast<bool>(default_); }

private:
    std::unordered_set<std::type_index> native_;
    TypeHandlers exact_;
    std::vector<Capability> capabilities_;
    Handler default_;
};

} // namespace ubjson

#endif // UBJSON_REGISTRY_HPP
