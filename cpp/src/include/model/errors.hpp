#pragma once
/**
 * @file errors.hpp
 * @brief Exception taxonomy of the field model.
 *
 * All errors are programmer errors raised synchronously at declaration time,
 * class-build time, or at the offending attribute access. None are retried.
 *
 * @code
 *   ModelError (std::runtime_error)
 *   ├── ConfigurationError       bad declaration, bad layout, bad schema
 *   │   └── FieldInjectionError  write to an attribute outside the layout
 *   ├── UsageError               builder used outside its open scope
 *   └── UnknownAttributeError    read of a missing attribute or unset slot
 *       └── ReadOnlyFieldError   assignment to a read-only field
 * @endcode
 */
#include <stdexcept>
#include <string>

#include "fieldkit_export.h"

namespace fieldkit::model
{

class FIELDKIT_EXPORT ModelError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class FIELDKIT_EXPORT ConfigurationError : public ModelError
{
  public:
    using ModelError::ModelError;
};

/**
 * @brief Raised when an instance is asked to hold an attribute its class never declared.
 */
class FIELDKIT_EXPORT FieldInjectionError : public ConfigurationError
{
  public:
    FieldInjectionError(const std::string &class_name, const std::string &attribute)
        : ConfigurationError("'" + class_name + "' object has no slot for attribute '" +
                             attribute + "'"),
          m_attribute(attribute)
    {
    }

    const std::string &attribute() const noexcept { return m_attribute; }

  private:
    std::string m_attribute;
};

class FIELDKIT_EXPORT UsageError : public ModelError
{
  public:
    using ModelError::ModelError;
};

class FIELDKIT_EXPORT UnknownAttributeError : public ModelError
{
  public:
    UnknownAttributeError(const std::string &message, const std::string &attribute)
        : ModelError(message), m_attribute(attribute)
    {
    }

    const std::string &attribute() const noexcept { return m_attribute; }

  private:
    std::string m_attribute;
};

class FIELDKIT_EXPORT ReadOnlyFieldError : public UnknownAttributeError
{
  public:
    ReadOnlyFieldError(const std::string &class_name, const std::string &field)
        : UnknownAttributeError("field '" + field + "' of '" + class_name + "' is read-only",
                                field)
    {
    }
};

} // namespace fieldkit::model
