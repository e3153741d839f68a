/**
 * @file fieldkit_inspect.cpp
 * @brief fieldkit-inspect — loads a JSON class schema and prints the class.
 *
 * ## Usage
 *
 *     fieldkit-inspect --schema <path.json>                    # Print layout and fields
 *     fieldkit-inspect --schema <path.json> --log-level debug  # Also log declarations
 *
 * The class is built exactly as a host program would build it, so every
 * declaration error is reported here. Listeners named by the schema are bound
 * to no-op methods, and `default_provider` entries to providers returning null.
 *
 * Exit status: 0 when the class builds, 1 otherwise.
 */

#include "fk_model.hpp"
#include "inspect_report.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace fieldkit::model;
using fieldkit::tools::format_class_report;
using fieldkit::tools::placeholder_bindings;
using fieldkit::utils::Logger;

namespace
{

struct InspectArgs
{
    std::string schema_path;
    Logger::Level log_level{Logger::Level::L_WARNING};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " --schema <path.json> [--log-level <level>]\n\n"
              << "Options:\n"
              << "  --schema <path>     Path to a JSON class schema (required)\n"
              << "  --log-level <lvl>   trace | debug | info | warn | error (default: warn)\n"
              << "  --help              Show this message\n";
}

InspectArgs parse_args(int argc, char *argv[])
{
    InspectArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--schema" && i + 1 < argc)
        {
            args.schema_path = argv[++i];
        }
        else if (arg == "--log-level" && i + 1 < argc)
        {
            auto lvl = Logger::parse_level(argv[++i]);
            if (!lvl)
            {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                std::exit(1);
            }
            args.log_level = *lvl;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (args.schema_path.empty())
    {
        std::cerr << "Error: --schema <path> is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    const InspectArgs args = parse_args(argc, argv);
    Logger::instance().set_level(args.log_level);

    ClassSchema schema;
    ClassPtr cls;
    try
    {
        schema = load_class_schema(args.schema_path);
        cls = define_class(schema, placeholder_bindings(schema));
    }
    catch (const ModelError &e)
    {
        std::cerr << "Schema error: " << e.what() << "\n";
        Logger::instance().flush();
        return 1;
    }

    std::cout << format_class_report(schema, *cls);

    Logger::instance().flush();
    return 0;
}
