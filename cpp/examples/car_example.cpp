/**
 * @file car_example.cpp
 * @brief Example declaring a Car class with managed fields.
 *
 * This example shows how to:
 * 1. Declare read-only and observed fields with a PropertyBuilder
 * 2. Build the class and create an instance from constructor arguments
 * 3. Watch listeners fire on changes, and not on repeated writes
 * 4. Get a FieldInjectionError for an undeclared attribute
 */
#include "fk_model.hpp"
#include <iostream>

using namespace fieldkit::model;

// ============================================================================
// Class definition
// ============================================================================

static ClassPtr define_car()
{
    ClassNamespace ns("Car");

    ns.define_listener("on_speed",
                       [](Instance &self, const std::string &, const Value &old_value,
                          const Value &new_value)
                       {
                           std::cout << "  on_speed: " << old_value.dump() << " -> "
                                     << new_value.dump() << " (engine on: "
                                     << self.get("on").dump() << ")\n";
                       });
    ns.define_listener("on_power",
                       [](Instance &, const std::string &, const Value &old_value,
                          const Value &new_value)
                       {
                           std::cout << "  on_power: " << old_value.dump() << " -> "
                                     << new_value.dump() << "\n";
                       });

    with_properties(ns, "p",
                    [](PropertyBuilder &p)
                    {
                        p.prop("brand", constant_default(nullptr),
                               {.read_only = true, .doc = "Manufacturer"});
                        p.prop("speed", constant_default(0), {.listener = "on_speed"});
                        p.prop("on", constant_default(false), {.listener = "on_power"});
                    });

    return Class::build(std::move(ns));
}

// ============================================================================
// Main
// ============================================================================

int main()
{
    std::cout << "=== fieldkit Car Example ===\n\n";

    ClassPtr car_class = define_car();

    std::cout << "Layout:";
    for (const auto &slot : car_class->layout())
        std::cout << " " << slot;
    std::cout << "\n\n";

    Instance car = car_class->create({{"brand", "Ford"}});
    std::cout << "brand = " << car.get("brand").dump() << ", speed = " << car.get("speed").dump()
              << ", on = " << car.get("on").dump() << "\n\n";

    std::cout << "speed = 50\n";
    car.set("speed", 50);
    std::cout << "on = true\n";
    car.set("on", true);
    std::cout << "speed = 50 (again, no listener)\n";
    car.set("speed", 50);

    std::cout << "\nbrand = \"Opel\"\n";
    try
    {
        car.set("brand", "Opel");
    }
    catch (const ReadOnlyFieldError &e)
    {
        std::cout << "  rejected: " << e.what() << "\n";
    }

    std::cout << "model = 2020\n";
    try
    {
        car.set("model", 2020);
    }
    catch (const FieldInjectionError &e)
    {
        std::cout << "  rejected: " << e.what() << "\n";
    }

    std::cout << "\n=== Example complete ===\n";
    return 0;
}
