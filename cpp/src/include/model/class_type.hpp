#pragma once
/**
 * @file class_type.hpp
 * @brief A finished class: the frozen result of a ClassNamespace.
 *
 * `Class::build()` is the host-side class construction. It validates the
 * namespace before any instance can exist:
 * - no PropertyBuilder alias may still be bound (the builder was not released);
 * - the layout declaration holds no duplicate slot identifiers;
 * - every accessor's slot (and `_dirty` for auto-dirty fields) is in the layout;
 * - every listener names a method of the class.
 *
 * @code
 *   ClassNamespace ns("Car");
 *   with_properties(ns, "p", [](PropertyBuilder &p) {
 *       p.prop("speed", constant_default(0), {.listener = "on_speed"});
 *   });
 *   ns.define_listener("on_speed", on_speed);
 *   auto car_class = Class::build(std::move(ns));
 *   Instance car = car_class->create({{"speed", 10}});
 * @endcode
 */
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "fieldkit_export.h"
#include "model/class_namespace.hpp"
#include "model/instance.hpp"

namespace fieldkit::model
{

class Class;
using ClassPtr = std::shared_ptr<const Class>;

class FIELDKIT_EXPORT Class : public std::enable_shared_from_this<Class>
{
  public:
    /**
     * @brief Builds a class from a finished namespace.
     * @throws UsageError if a builder alias is still bound.
     * @throws ConfigurationError on any layout or listener inconsistency.
     */
    static ClassPtr build(ClassNamespace ns);

    const std::string &name() const noexcept { return m_members.class_name(); }

    /// Finalized storage layout, in declaration order.
    const std::vector<std::string> &layout() const noexcept { return m_layout; }
    std::optional<std::size_t> slot_index(const std::string &slot) const;
    bool has_slot(const std::string &slot) const { return slot_index(slot).has_value(); }

    bool has_member(const std::string &name) const { return m_members.contains(name); }
    const std::vector<std::string> &member_names() const noexcept { return m_members.names(); }

    /// Public names of the managed fields, in declaration order.
    std::vector<std::string> field_names() const;

    /// @return nullptr when `name` is not a managed field.
    AccessorPtr accessor(const std::string &name) const;
    const Method *method(const std::string &name) const;
    const Value *constant(const std::string &name) const;

    /// Documentation of a field or method; empty when none.
    std::string doc(const std::string &name) const;

    /**
     * @brief Creates an instance with storage equal to the layout.
     * @details Runs the class constructor with `args` when one is defined;
     *          otherwise copies `args` into their slots with copy_fields().
     */
    Instance create(const Arguments &args = {}) const;

  private:
    Class(ClassNamespace members, std::vector<std::string> layout);

    ClassNamespace m_members;
    std::vector<std::string> m_layout;
    std::unordered_map<std::string, std::size_t> m_slot_index;
};

} // namespace fieldkit::model
