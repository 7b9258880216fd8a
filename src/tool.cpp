#include <iostream>

#include <boost/program_options.hpp>

#include <treediff/config.h>
#include <treediff/diff.h>
#include <treediff/encodings/json.h>
#include <treediff/fs/file_io.h>
#include <treediff/version.h>

using namespace treediff;

static void
show_version_info()
{
    std::cout << "treediff " << TREEDIFF_VERSION << "\n";
}

static void
write_output(optional<file_path> const& output, string const& text)
{
    if (output)
        dump_string_to_file(*output, text + "\n");
    else
        std::cout << text << "\n";
}

static string
diff_files(file_path const& lhs_path, file_path const& rhs_path, int indent)
{
    TREEDIFF_LOG_CALL(<< TREEDIFF_LOG_ARG(lhs_path) << TREEDIFF_LOG_ARG(rhs_path))
    auto lhs = read_value_file(lhs_path);
    auto rhs = read_value_file(rhs_path);
    return value_diff_to_json(compute_value_diff(lhs, rhs), indent);
}

static string
patch_file(
    file_path const& target_path,
    file_path const& patch_path,
    bool revert,
    int indent)
{
    TREEDIFF_LOG_CALL(
        << TREEDIFF_LOG_ARG(target_path) << TREEDIFF_LOG_ARG(patch_path)
        << TREEDIFF_LOG_ARG(revert))
    auto target = read_value_file(target_path);
    auto records = read_value_file(patch_path);
    if (revert)
    {
        if (records.type() != value_type::NIL)
            revert_value_diff(target, some(read_value_diff(records)));
    }
    else
    {
        apply_value_diff(target, records);
    }
    return value_to_json(target, indent);
}

static int
run(int argc, char const* const* argv)
{
    namespace po = boost::program_options;

    po::options_description desc("Supported options");
    // clang-format off
    desc.add_options()
        ("help", "show help message")
        ("version", "show version information")
        ("config-file", po::value<string>(),
            "specify the configuration file to use")
        ("log-level", po::value<string>(),
            "set the minimum level to log (trace, debug, info, warn, err, "
            "critical, off)")
        ("diff", po::value<std::vector<string>>()->multitoken(),
            "compute the differences between files LHS and RHS")
        ("apply", po::value<std::vector<string>>()->multitoken(),
            "apply the differences in file PATCH to file TARGET")
        ("revert", po::value<std::vector<string>>()->multitoken(),
            "revert the differences in file PATCH from file TARGET")
        ("output", po::value<string>(),
            "write the result to a file instead of stdout")
    ;
    // clang-format on

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    po::notify(vm);

    if (vm.count("help"))
    {
        show_version_info();
        std::cout << "usage: treediff --diff LHS RHS\n"
                  << "       treediff --apply TARGET PATCH\n"
                  << "       treediff --revert TARGET PATCH\n";
        std::cout << desc;
        return 0;
    }

    if (vm.count("version"))
    {
        show_version_info();
        return 0;
    }

    tool_config config;
    if (vm.count("config-file"))
    {
        config = read_tool_config(
            read_value_file(file_path(vm["config-file"].as<string>())));
    }
    if (vm.count("log-level"))
        config.log_level = vm["log-level"].as<string>();
    initialize_logging(get_logging_config(config));

    optional<file_path> output;
    if (vm.count("output"))
        output = file_path(vm["output"].as<string>());

    int command_count = int(vm.count("diff")) + int(vm.count("apply"))
                        + int(vm.count("revert"));
    if (command_count != 1)
    {
        std::cerr << "exactly one of --diff, --apply and --revert is required\n"
                  << desc;
        return 1;
    }

    char const* command
        = vm.count("diff") ? "diff" : vm.count("apply") ? "apply" : "revert";
    auto files = vm[command].as<std::vector<string>>();
    if (files.size() != 2)
    {
        std::cerr << "--" << command << " takes exactly two files\n";
        return 1;
    }

    int indent = get_indent(config);
    if (vm.count("diff"))
    {
        write_output(output, diff_files(files[0], files[1], indent));
    }
    else
    {
        write_output(
            output,
            patch_file(files[0], files[1], !vm.count("apply"), indent));
    }
    return 0;
}

int
main(int argc, char const* const* argv)
{
    try
    {
        return run(argc, argv);
    }
    catch (std::exception& e)
    {
        std::cerr << "treediff: " << e.what() << "\n";
        return 1;
    }
}
