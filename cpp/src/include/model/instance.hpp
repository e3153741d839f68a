#pragma once
/**
 * @file instance.hpp
 * @brief An object of a built Class, with fixed slot storage.
 *
 * The storage holds exactly one optional value per slot of the class layout.
 * Nothing outside that layout can ever be stored: assigning an undeclared
 * attribute raises FieldInjectionError.
 *
 * Attribute resolution for `get`/`set`:
 *   1. an accessor pair installed under the name (setter may be absent);
 *   2. a storage slot of that exact name (e.g. `_speed`, `_dirty`);
 *   3. for `get` only, a class constant.
 *
 * Instances carry no synchronization; concurrent mutation of one instance
 * must be serialized by the caller.
 */
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fieldkit_export.h"
#include "model/class_namespace.hpp"

namespace fieldkit::model
{

class Class;

class FIELDKIT_EXPORT Instance
{
  public:
    const Class &type() const noexcept { return *m_class; }
    const std::shared_ptr<const Class> &type_ptr() const noexcept { return m_class; }

    /// @throws UnknownAttributeError if nothing readable is bound to `name`.
    Value get(const std::string &name) const;

    /**
     * @throws ReadOnlyFieldError for a read-only field.
     * @throws FieldInjectionError for a name outside the declared fields and slots.
     */
    void set(const std::string &name, const Value &value);

    /// Invokes a class method bound to this instance.
    Value call(const std::string &method, const std::vector<Value> &args = {});

    // --- Slot storage ---

    bool has_slot(const std::string &slot) const;

    /**
     * @return The slot content, std::nullopt while never assigned.
     * @throws FieldInjectionError if the class declares no such slot.
     */
    const std::optional<Value> &slot(const std::string &slot) const;

    /// @throws FieldInjectionError if the class declares no such slot.
    void write_slot(const std::string &slot, Value value);

    // --- Dirty tracking ---

    /// @return true once an auto-dirty field has changed since the last clear.
    bool dirty() const;
    void clear_dirty();

  private:
    friend class Class;
    explicit Instance(std::shared_ptr<const Class> cls);

    std::size_t index_of(const std::string &slot) const;

    std::shared_ptr<const Class> m_class;
    std::vector<std::optional<Value>> m_slots;
};

} // namespace fieldkit::model
