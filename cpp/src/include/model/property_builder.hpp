#pragma once
/**
 * @file property_builder.hpp
 * @brief Scoped builder that declares managed fields into a ClassNamespace.
 *
 * Lifecycle is strictly one-shot: Pending → Open (`enter()`) → Released
 * (`exit()`). While open, the builder is bound in the namespace under its
 * alias and every `prop()` call
 *   1. appends `_dirty` to the manifest once, if the field is auto-dirty,
 *   2. appends the field's own slot `_name`,
 *   3. installs the generated accessor pair under `name`.
 *
 * On release the manifest is merged into the namespace layout declaration:
 *   - none bound           → bound to the manifest (mutable);
 *   - mutable SlotList     → extended in place;
 *   - immutable FrozenSlotList → replaced by the concatenation.
 * `_dirty` is shared: a session needing it reuses one already in the layout.
 * Any other slot already in the layout is a ConfigurationError. Fields whose
 * slot would be `_dirty` or `_args` are rejected at declaration.
 * The alias is then removed, and the builder drops its namespace reference
 * and manifest. Any further use raises UsageError.
 *
 * @code
 *   ClassNamespace ns("Car");
 *   with_properties(ns, "p", [](PropertyBuilder &p) {
 *       p.prop("brand", constant_default(nullptr), {.read_only = true});
 *       p.prop("speed", constant_default(0), {.listener = "on_speed"});
 *   });
 * @endcode
 */
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fieldkit_export.h"
#include "model/class_namespace.hpp"
#include "utils/scope_guard.hpp"

namespace fieldkit::model
{

/**
 * @brief Listener option of a field: none, a method name, or `true` for the
 *        generic `on_field_changed` method.
 */
class FIELDKIT_EXPORT ListenerOption
{
  public:
    ListenerOption() = default;
    ListenerOption(bool generic) : m_generic(generic) {}
    ListenerOption(const char *method)
    {
        if (method != nullptr)
            m_method = method;
    }
    ListenerOption(std::string method) : m_method(std::move(method)) {}

    bool enabled() const noexcept { return m_generic || !m_method.empty(); }

    /// Name of the method to call, std::nullopt when disabled.
    std::optional<std::string> resolve() const;

  private:
    bool m_generic{false};
    std::string m_method;
};

struct PropOptions
{
    bool read_only{false};
    ListenerOption listener{};
    bool auto_dirty{false};
    std::string doc{}; ///< Overrides the provider's documentation when set
};

class FIELDKIT_EXPORT PropertyBuilder
{
  public:
    /**
     * @param ns         Namespace of the class being defined; borrowed until release.
     * @param alias      Name under which the builder is bound while open.
     * @param auto_dirty Default auto-dirty policy for every field declared here.
     */
    PropertyBuilder(ClassNamespace &ns, std::string alias, bool auto_dirty = false);

    /// Releases a still-open builder; failures are logged.
    ~PropertyBuilder();

    PropertyBuilder(const PropertyBuilder &) = delete;
    PropertyBuilder &operator=(const PropertyBuilder &) = delete;
    PropertyBuilder(PropertyBuilder &&) = delete;
    PropertyBuilder &operator=(PropertyBuilder &&) = delete;

    /**
     * @brief Opens the scope and binds the alias.
     * @throws UsageError if already entered or released, or if the alias is taken.
     */
    PropertyBuilder &enter();

    /**
     * @brief Merges the manifest and releases the builder.
     * @throws UsageError if the builder is not open.
     * @throws ConfigurationError if a manifest slot is already in the layout.
     *         The builder is released regardless.
     */
    void exit();

    /// exit() for cleanup paths: never throws, logs failures.
    void exit_noexcept() noexcept;

    /**
     * @brief Declares a managed field.
     * @return The accessor pair installed under `name`.
     * @throws UsageError outside the open scope.
     * @throws ConfigurationError for read-only + listener, a reserved or
     *         duplicate name, a name backed by `_dirty` or `_args`, or an
     *         empty provider.
     */
    AccessorPtr prop(const std::string &name, DefaultProvider provider,
                     const PropOptions &options = {});

    /**
     * @brief Declares a managed field from the Provider already bound under
     *        `name` in the namespace, replacing it.
     */
    AccessorPtr prop(const std::string &name, const PropOptions &options = {});

    bool is_open() const noexcept { return m_state == State::Open; }
    bool is_released() const noexcept { return m_state == State::Released; }
    const std::string &alias() const noexcept { return m_alias; }
    bool auto_dirty() const noexcept { return m_auto_dirty; }

    /// @throws UsageError once released.
    const std::vector<std::string> &manifest() const;

  private:
    enum class State
    {
        Pending,
        Open,
        Released
    };

    void require_open(const char *operation) const;
    void merge_manifest();
    void release() noexcept;

    ClassNamespace *m_ns;
    std::string m_alias;
    bool m_auto_dirty;
    State m_state{State::Pending};
    std::vector<std::string> m_manifest;
};

/**
 * @brief Runs `body` with an open builder and releases it on every exit path.
 * @details On the normal path errors from the release propagate. When `body`
 *          throws, the release still merges and unbinds, and the original
 *          exception propagates.
 */
template <typename Body>
void with_properties(ClassNamespace &ns, const std::string &alias, Body &&body,
                     bool auto_dirty = false)
{
    PropertyBuilder builder(ns, alias, auto_dirty);
    builder.enter();
    auto guard = basics::make_scope_guard([&builder]() noexcept { builder.exit_noexcept(); });
    std::forward<Body>(body)(builder);
    guard.dismiss();
    builder.exit();
}

} // namespace fieldkit::model
