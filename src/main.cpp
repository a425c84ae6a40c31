// main.cpp

#include "batch.hpp"
#include "cmdargs.hpp"
#include "config.hpp"
#include "dump.hpp"

#include <elfscan/error.hpp>
#include <elfscan/log.hpp>
#include <elfscan/object_introspector.hpp>

#include <iostream>
#include <sstream>
#include <vector>

template<typename T>
static std::string to_string(const T& value)
{
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

static void handle_exception()
{
    try
    {
        throw;
    }
    catch (const elfscan::exception& e)
    {
        std::cerr << "elfscan exception: " << e.what() << "\n";
    }
    catch (const escan::cfg::exception& e)
    {
        std::cerr << "Config exception: " << e.what() << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << "Other exception: " << e.what() << "\n";
    }
    catch (...)
    {
        std::cerr << "Unknown exception\n";
    }
}

int main(int argc, char* argv[])
{
    try
    {
        using namespace escan;
        using elfscan::log;

        std::optional<arguments> args = parse_arguments(argc, argv);
        if (!args)
            return exit_error;
        log::init(args->logargs.quiet, args->logargs.path);

        elfscan::tool tool;
        std::vector<cfg::target_t> targets;
        if (args->config.present())
        {
            cfg::config_t config(args->config);
            if (config.tool())
                tool.program = *config.tool();
            targets = config.targets();
            log::logline(log::debug, "config: %s", to_string(config).c_str());
        }
        if (args->tool)
            tool.program = *args->tool;
        for (const auto& file : args->files)
            targets.push_back({ file, args->member.value_or(file) });
        if (targets.empty())
        {
            std::cerr << "no target files to inspect\n";
            return exit_error;
        }
        log::logline(log::debug, "arguments: %s", to_string(*args).c_str());

        batch_result result = introspect_all(targets, tool);
        std::ostream& output = args->output;
        output << report_dump{ result.objects, args->functions };
        return result.exit_status();
    }
    catch (...)
    {
        handle_exception();
        return escan::exit_error;
    }
}
