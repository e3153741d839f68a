#pragma once
/**
 * @file field_accessor.hpp
 * @brief FieldDefinition and the getter/setter pair generated from it.
 *
 * An accessor pair is stateless apart from the definition it closes over; all
 * per-object state lives in the Instance's storage slots.
 *
 * Getter: the stored value if the slot was ever assigned, otherwise the
 * default provider's result. The default is recomputed on every read and
 * never written back, so defaults may depend on state that changes between
 * reads.
 *
 * Setter (absent for read-only fields): compares against the stored value
 * (`null` when unset) and does nothing on equality. Otherwise it writes the
 * slot, raises the dirty flag when auto-dirty is on, and finally calls the
 * listener with `(slot, old_value, new_value)`. The listener therefore sees
 * the new value through the getter.
 */
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "fieldkit_export.h"
#include "model/class_namespace.hpp"

namespace fieldkit::model
{

struct FieldDefinition
{
    std::string name;                    ///< Public attribute name
    std::string slot;                    ///< Backing storage slot, `slot_name(name)`
    DefaultProvider provider;            ///< Fallback value while the slot is unset
    bool read_only{false};               ///< No setter is generated
    std::optional<std::string> listener; ///< Method called after each change
    bool auto_dirty{false};              ///< Mark `_dirty` on each change
    std::string doc;                     ///< Carried over from the provider
};

class FIELDKIT_EXPORT ManagedAccessor
{
  public:
    using Getter = std::function<Value(const Instance &)>;
    using Setter = std::function<void(Instance &, const Value &)>;

    ManagedAccessor(std::shared_ptr<const FieldDefinition> definition, Getter getter,
                    Setter setter);

    const FieldDefinition &definition() const noexcept { return *m_definition; }
    const std::string &name() const noexcept { return m_definition->name; }
    const std::string &slot() const noexcept { return m_definition->slot; }
    const std::string &doc() const noexcept { return m_definition->doc; }

    bool has_setter() const noexcept { return static_cast<bool>(m_setter); }

    Value get(const Instance &self) const;

    /// @throws ReadOnlyFieldError when the field has no setter.
    void set(Instance &self, const Value &value) const;

  private:
    std::shared_ptr<const FieldDefinition> m_definition;
    Getter m_getter;
    Setter m_setter;
};

/**
 * @brief Generates the accessor pair for one field.
 * @throws ConfigurationError if the definition is read-only and observable,
 *         or has no default provider.
 */
FIELDKIT_EXPORT AccessorPtr make_accessor(FieldDefinition definition);

} // namespace fieldkit::model
