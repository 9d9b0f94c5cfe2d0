#include "xdslc/common/conversion_exceptions.hpp"
#include "xdslc/conversion/converter.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace
{

struct CommandLine
{
    std::string input_path;
    std::string output_path;
    xdslc::OutputMode mode{xdslc::OutputMode::Script};
    xdslc::ConverterConfig config;
};

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program
              << " <input.xdsl> [-o <output>] [--mode script|model]"
                 " [--no-weights] [--no-comments] [--strict]\n"
              << "\n"
              << "Converts an XDSL network into a pyAgrum construction script (default)\n"
              << "or prints a summary of the in-memory influence diagram (--mode model).\n";
}

CommandLine parse_command_line(int argc, char** argv)
{
    CommandLine cmd;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "-o" || arg == "--output")
        {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for " + arg);
            }
            cmd.output_path = argv[++i];
        }
        else if (arg == "--mode")
        {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for --mode");
            }
            std::string mode = argv[++i];
            if (mode == "script")
            {
                cmd.mode = xdslc::OutputMode::Script;
            }
            else if (mode == "model")
            {
                cmd.mode = xdslc::OutputMode::Model;
            }
            else
            {
                throw std::invalid_argument("Unknown mode '" + mode + "'");
            }
        }
        else if (arg == "--no-weights")
        {
            cmd.config.apply_utility_weights = false;
        }
        else if (arg == "--no-comments")
        {
            cmd.config.emit_comments = false;
        }
        else if (arg == "--strict")
        {
            cmd.config.treat_warnings_as_errors = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        }
        else if (cmd.input_path.empty())
        {
            cmd.input_path = arg;
        }
        else
        {
            throw std::invalid_argument("Unexpected argument '" + arg + "'");
        }
    }
    if (cmd.input_path.empty())
    {
        throw std::invalid_argument("No input file given");
    }
    return cmd;
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw std::runtime_error("Cannot open '" + path + "' for reading");
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

void write_output(const std::string& path, const std::string& text)
{
    if (path.empty())
    {
        std::cout << text << std::flush;
        return;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error("Cannot open '" + path + "' for writing");
    }
    out << text;
    if (!out)
    {
        throw std::runtime_error("Failed writing '" + path + "'");
    }
}

std::string describe_model(const xdslc::InfluenceDiagram& diagram)
{
    std::ostringstream oss;
    oss << "Influence diagram '" << diagram.name() << "': " << diagram.size() << " node(s), "
        << diagram.arcs().size() << " arc(s)\n";
    for (const auto& name : diagram.names())
    {
        const auto& node = diagram.node(name);
        oss << "  " << xdslc::to_string(node.kind) << " " << name;
        if (!node.variable.labels.empty())
        {
            oss << " {";
            for (size_t i = 0; i < node.variable.labels.size(); ++i)
            {
                oss << (i > 0 ? ", " : "") << node.variable.labels[i];
            }
            oss << "}";
        }
        if (!node.parents.empty())
        {
            oss << " <-";
            for (const auto& parent : node.parents)
            {
                oss << " " << parent;
            }
        }
        if (node.filled)
        {
            oss << " [" << node.table.size() << " values]";
        }
        oss << "\n";
    }
    return oss.str();
}

} // namespace

int main(int argc, char** argv)
{
    CommandLine cmd;
    try
    {
        cmd = parse_command_line(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    // Progress goes to stdout only when stdout is not the output itself.
    const bool verbose = !cmd.output_path.empty();

    try
    {
        if (verbose)
        {
            std::cout << "====== xdslc ======\n" << std::flush;
        }

        xdslc::Converter converter{cmd.config};
        xdslc::ModelGraph graph = converter.parse(read_file(cmd.input_path));
        if (verbose)
        {
            std::cout << "Parsed '" << cmd.input_path << "': " << graph.node_count()
                      << " node(s), " << graph.arcs().size() << " arc(s)\n";
        }

        auto report = converter.validate(graph);
        for (const auto& warning : report->warnings())
        {
            std::cerr << "warning: " << xdslc::format_item(warning) << "\n";
        }

        xdslc::EmissionPlan plan = converter.plan(graph, report);

        std::string output;
        switch (cmd.mode)
        {
        case xdslc::OutputMode::Script:
            output = converter.generate_script(graph, plan);
            break;
        case xdslc::OutputMode::Model:
            output = describe_model(*converter.generate_model(graph, plan));
            break;
        }
        write_output(cmd.output_path, output);

        if (verbose)
        {
            std::cout << "Wrote '" << cmd.output_path << "'\n"
                      << "====== normal exit ======\n" << std::flush;
        }
    }
    catch (const xdslc::ValidationError& e)
    {
        std::cerr << "Error:\n" << e.what() << std::flush;
        if (verbose)
        {
            std::cout << "====== abnormal exit ======\n" << std::flush;
        }
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\nError:\n" << e.what() << "\n" << std::flush;
        if (verbose)
        {
            std::cout << "====== abnormal exit ======\n" << std::flush;
        }
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
