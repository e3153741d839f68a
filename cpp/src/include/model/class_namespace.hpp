#pragma once
/**
 * @file class_namespace.hpp
 * @brief The mutable member table of a class that is still being defined.
 *
 * A ClassNamespace plays the role of a class body under evaluation: authors
 * add constants, methods, listeners and default providers to it, a
 * PropertyBuilder injects accessor pairs and the storage layout into it, and
 * `Class::build()` finally consumes it.
 *
 * Members keep their insertion order. Replacing an existing member keeps its
 * original position.
 */
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "fieldkit_export.h"

namespace fieldkit::model
{

/// Dynamically typed field value. `null` stands for "no value".
using Value = nlohmann::json;

/// Ordered (name, value) pairs, e.g. the arguments a constructor received.
using Arguments = std::vector<std::pair<std::string, Value>>;

class Instance;
class ManagedAccessor;
class PropertyBuilder;

using AccessorPtr = std::shared_ptr<const ManagedAccessor>;

/// Computes a field's fallback value; called on every read until the field is written.
using DefaultProvider = std::function<Value(const Instance &)>;
using MethodFn = std::function<Value(Instance &, const std::vector<Value> &)>;
using ListenerFn = std::function<void(Instance &, const std::string &slot, const Value &old_value,
                                      const Value &new_value)>;
using ConstructorFn = std::function<void(Instance &, const Arguments &)>;

// ============================================================================
// Reserved names
// ============================================================================

inline constexpr std::string_view kLayoutKey = "__layout__";
inline constexpr std::string_view kConstructorKey = "__init__";
inline constexpr std::string_view kSlotPrefix = "_";
inline constexpr std::string_view kDirtySlot = "_dirty";
inline constexpr std::string_view kArgsSlot = "_args";
/// Method invoked by fields declared with `listener = true`.
inline constexpr std::string_view kGenericListener = "on_field_changed";

/// Storage slot identifier backing the field `public_name`.
inline std::string slot_name(std::string_view public_name)
{
    std::string slot(kSlotPrefix);
    slot.append(public_name);
    return slot;
}

// ============================================================================
// Member kinds
// ============================================================================

struct Provider
{
    DefaultProvider fn;
    std::string doc;
};

struct Method
{
    MethodFn fn;
    std::string doc;
};

struct Constructor
{
    ConstructorFn fn;
};

/// Mutable layout declaration. Shared, so extending it is visible to every holder.
struct SlotList
{
    std::shared_ptr<std::vector<std::string>> names;
};

/// Immutable layout declaration. Merging replaces it instead of extending it.
struct FrozenSlotList
{
    std::vector<std::string> names;
};

/// Transient binding of an open PropertyBuilder.
struct BuilderAlias
{
    const PropertyBuilder *builder = nullptr;
};

using Member = std::variant<Value, Provider, Method, Constructor, AccessorPtr, SlotList,
                            FrozenSlotList, BuilderAlias>;

// ============================================================================
// ClassNamespace
// ============================================================================

class FIELDKIT_EXPORT ClassNamespace
{
  public:
    explicit ClassNamespace(std::string class_name);

    const std::string &class_name() const noexcept { return m_class_name; }

    /// Inserts or replaces `name`.
    void set(const std::string &name, Member member);

    /// @return true if `name` was bound.
    bool erase(const std::string &name);

    bool contains(const std::string &name) const;
    Member *find(const std::string &name);
    const Member *find(const std::string &name) const;

    template <typename T> T *find_as(const std::string &name)
    {
        Member *m = find(name);
        return m != nullptr ? std::get_if<T>(m) : nullptr;
    }

    template <typename T> const T *find_as(const std::string &name) const
    {
        const Member *m = find(name);
        return m != nullptr ? std::get_if<T>(m) : nullptr;
    }

    /// Member names in insertion order.
    const std::vector<std::string> &names() const noexcept { return m_order; }
    std::size_t size() const noexcept { return m_order.size(); }

    // --- Typed helpers ---
    void define_constant(const std::string &name, Value value);
    void define_provider(const std::string &name, DefaultProvider fn, std::string doc = {});
    void define_method(const std::string &name, MethodFn fn, std::string doc = {});

    /// Wraps `fn` as a method receiving `(slot, old_value, new_value)`.
    void define_listener(const std::string &name, ListenerFn fn, std::string doc = {});
    void define_constructor(ConstructorFn fn);

    /**
     * @brief Binds the layout declaration directly.
     * @param frozen true for an immutable sequence, false for a mutable one.
     */
    void declare_layout(std::vector<std::string> slots, bool frozen = false);

    /// Current layout declaration; empty when none is bound.
    std::vector<std::string> layout() const;

  private:
    std::string m_class_name;
    std::map<std::string, Member, std::less<>> m_members;
    std::vector<std::string> m_order;
};

/// Wraps a constant as a default provider.
inline DefaultProvider constant_default(Value value)
{
    return [value = std::move(value)](const Instance &) { return value; };
}

} // namespace fieldkit::model
