//===----------------------------------------------------------------------===//
//
// Part of the Rosella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument parsing and the `compile` command of the rosella tool.
/// @details Parsing never exits the process; usage errors come back as
///          diagnostics so runRosella can map them to exit status 2.

#include "cli.hpp"
#include "frontends/script/Compiler.hpp"
#include "tools/common/ArgvView.hpp"
#include "tools/common/source_loader.hpp"
#include "usage.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>

namespace rosella::tools
{

using frontends::script::Target;

namespace
{

support::Expected<CliCommand> usageError(std::string message)
{
    return support::Expected<CliCommand>(support::makeError({}, std::move(message)));
}

/// @brief Parse the flags following `rosella compile`.
support::Expected<CliCommand> parseCompileArgs(ArgvView &args)
{
    CliCommand command;
    command.action = CliAction::Compile;
    CompileConfig &config = command.compile;
    bool targetGiven = false;

    while (!args.done())
    {
        const std::string_view arg = args.next();

        if (arg == "-h" || arg == "--help")
        {
            command.action = CliAction::Help;
            return support::Expected<CliCommand>(std::move(command));
        }
        else if (arg == "-i" || arg == "--input" || arg == "-o" || arg == "--output" ||
                 arg == "--target")
        {
            auto value = args.value();
            if (!value || value->empty())
                return usageError(std::string(arg) + " requires an argument");

            if (arg == "--target")
            {
                if (targetGiven)
                    return usageError("--target given more than once");
                targetGiven = true;
                if (*value == "both" || *value == "all")
                {
                    config.targets = {Target::Shell, Target::Batch};
                }
                else if (auto target = frontends::script::parseTargetName(*value))
                {
                    config.targets = {*target};
                }
                else
                {
                    return usageError("unknown target '" + std::string(*value) +
                                      "'; expected shell, batch or both");
                }
            }
            else if (arg == "-i" || arg == "--input")
            {
                if (!config.inputPath.empty())
                    return usageError("multiple input files not supported");
                config.inputPath = std::string(*value);
            }
            else
            {
                config.outputPath = std::string(*value);
            }
        }
        else if (arg == "--no-normalize-paths")
        {
            config.options.normalizePaths = false;
        }
        else if (arg == "--lf")
        {
            config.options.batchCrlf = false;
        }
        else if (arg == "--dump-tokens")
        {
            config.options.dumpTokens = true;
        }
        else if (arg == "--dump-ast")
        {
            config.options.dumpAst = true;
        }
        else
        {
            return usageError("unknown argument: " + std::string(arg));
        }
    }

    if (config.inputPath.empty())
        return usageError("no input file specified (use -i <file>)");
    if (!targetGiven)
        config.targets = {Target::Shell, Target::Batch};
    if (!config.outputPath.empty() && config.targets.size() > 1)
        return usageError("-o requires a single --target");

    return support::Expected<CliCommand>(std::move(command));
}

bool writeOutput(const std::string &path, const std::string &text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return false;
    out << text;
    out.close();
    return !out.fail();
}

} // namespace

support::Expected<CliCommand> parseCommandLine(int argc, char **argv)
{
    ArgvView args(argc, argv);
    args.skip();

    if (args.done())
        return usageError("no command given");

    const std::string_view command = args.next();
    if (command == "-h" || command == "--help")
    {
        CliCommand help;
        help.action = CliAction::Help;
        return support::Expected<CliCommand>(std::move(help));
    }
    if (command == "--version")
    {
        CliCommand version;
        version.action = CliAction::Version;
        return support::Expected<CliCommand>(std::move(version));
    }
    if (command != "compile")
        return usageError("unknown command: " + std::string(command));

    return parseCompileArgs(args);
}

std::string defaultOutputPath(const std::string &inputPath, Target target)
{
    std::filesystem::path path(inputPath);
    path.replace_extension(frontends::script::targetExtension(target));
    return path.string();
}

int runCompile(const CompileConfig &config)
{
    support::SourceManager sm;
    auto loaded = common::loadSourceBuffer(config.inputPath, sm);
    if (!loaded)
    {
        support::printDiag(loaded.error(), std::cerr, &sm);
        return kExitCompileError;
    }

    frontends::script::CompilerInput input;
    input.source = loaded.value().buffer;
    input.path = config.inputPath;
    input.fileId = loaded.value().fileId;

    std::vector<std::pair<std::string, std::string>> outputs;
    for (Target target : config.targets)
    {
        frontends::script::CompilerOptions options = config.options;
        options.target = target;
        auto result = frontends::script::compile(input, options, sm);
        if (!result.succeeded())
        {
            result.diagnostics.printAll(std::cerr, &sm);
            return kExitCompileError;
        }
        std::string path =
            config.outputPath.empty() ? defaultOutputPath(config.inputPath, target)
                                      : config.outputPath;
        outputs.emplace_back(std::move(path), std::move(result.script));
    }

    for (size_t i = 0; i < outputs.size(); ++i)
    {
        const auto &[path, script] = outputs[i];
        if (!writeOutput(path, script))
        {
            std::cerr << "error: unable to write " << path << "\n";
            return kExitCompileError;
        }

        if (config.targets[i] != Target::Shell)
            continue;
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::permissions(path,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add,
                        ec);
        if (ec)
            std::cerr << "warning: unable to mark " << path << " executable: " << ec.message()
                      << "\n";
    }
    return kExitSuccess;
}

int runRosella(int argc, char **argv)
{
    auto parsed = parseCommandLine(argc, argv);
    if (!parsed)
    {
        support::printDiag(parsed.error(), std::cerr);
        std::cerr << "\n";
        printUsage(std::cerr);
        return kExitUsageError;
    }

    const CliCommand &command = parsed.value();
    switch (command.action)
    {
        case CliAction::Help:
            printUsage(std::cout);
            return kExitSuccess;
        case CliAction::Version:
            printVersion();
            return kExitSuccess;
        case CliAction::Compile:
            break;
    }
    return runCompile(command.compile);
}

} // namespace rosella::tools
