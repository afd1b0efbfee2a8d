// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <jsonmend/jsonmend.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

constexpr int EXIT_REPAIR_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CliOptions
{
  std::optional<std::string> configFile;
  std::optional<std::string> logLevel;
  std::string resource{"stdin"};
  std::optional<std::string> inputFile;
  bool pretty{false};
  bool showSteps{false};
  bool help{false};
};

class UsageError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// \brief Print help message
void printHelp()
{
  std::cout << "Usage: jsonmend [options] [file]\n"
            << "Repairs malformed JSON read from <file> or stdin and prints it.\n\n"
            << "  -h, --help                 Show this help message\n"
            << "  -c, --config <file>        Configuration file path\n"
            << "  -l, --log-level <level>    Log level (trace, debug, info, "
               "warning, error, fatal)\n"
            << "  -r, --resource <name>      Resource name used in diagnostics\n"
            << "      --pretty               Pretty-print the repaired JSON\n"
            << "      --steps                Print applied repair steps to stderr\n\n"
            << "Exit status: 0 repaired, 1 not repairable, 2 usage error.\n";
}

/// \brief Parse command-line arguments
CliOptions parseCliArgs(int argc, char **argv)
{
  CliOptions options;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    auto requireValue = [&]() -> std::string
    {
      if (i + 1 >= argc)
      {
        throw UsageError("Missing value for option: " + arg);
      }
      return argv[++i];
    };

    if (arg == "-c" || arg == "--config")
    {
      options.configFile = requireValue();
    }
    else if (arg == "-l" || arg == "--log-level")
    {
      options.logLevel = requireValue();
    }
    else if (arg == "-r" || arg == "--resource")
    {
      options.resource = requireValue();
    }
    else if (arg == "--pretty")
    {
      options.pretty = true;
    }
    else if (arg == "--steps")
    {
      options.showSteps = true;
    }
    else if (arg == "-h" || arg == "--help")
    {
      options.help = true;
    }
    else if (arg.length() > 1 && arg[0] == '-')
    {
      throw UsageError("Unknown option: " + arg);
    }
    else if (options.inputFile)
    {
      throw UsageError("Only one input file may be given");
    }
    else
    {
      options.inputFile = arg;
    }
  }
  if (options.inputFile && *options.inputFile != "-" && options.resource == "stdin")
  {
    options.resource = *options.inputFile;
  }
  return options;
}

/// \brief Load settings from the given file, or from the default file when it
/// exists.
jsonmend::processing::ProcessorSettings loadSettings(const CliOptions &options)
{
  std::string path = options.configFile.value_or(JSONMEND_DEFAULT_CONFIG_FILE_PATH);
  if (!options.configFile && !std::filesystem::exists(path))
  {
    return {};
  }
  try
  {
    jsonmend::core::ConfigLoader loader(path);
    JSONMEND_LOG_DEBUG("Using config file: " << path);
    return jsonmend::processing::loadProcessorSettings(loader);
  }
  catch (const std::exception &e)
  {
    if (options.configFile)
    {
      throw UsageError(e.what());
    }
    jsonmend::core::Logger::warning("Failed to load TOML config: " + std::string(e.what()));
    return {};
  }
}

std::string readInput(const CliOptions &options)
{
  if (!options.inputFile || *options.inputFile == "-")
  {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream in(*options.inputFile, std::ios::binary);
  if (!in)
  {
    throw UsageError("Cannot open input file: " + *options.inputFile);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void printSteps(const std::vector<std::string> &steps, const std::vector<std::string> &diagnostics)
{
  std::cerr << "Steps (" << steps.size() << "):";
  for (const auto &step : steps)
  {
    std::cerr << " " << step;
  }
  std::cerr << "\n";
  for (const auto &line : diagnostics)
  {
    std::cerr << "  " << line << "\n";
  }
}

} // namespace

int main(int argc, char **argv)
{
  using namespace jsonmend;
  jsonmend::core::Logger::init(jsonmend::core::Logger::Level::Warning);
  try
  {
    CliOptions options = parseCliArgs(argc, argv);
    if (options.help)
    {
      printHelp();
      return 0;
    }

    processing::ProcessorSettings settings = loadSettings(options);
    if (options.logLevel)
    {
      settings.logLevel = options.logLevel;
    }
    try
    {
      processing::applyLogSettings(settings);
    }
    catch (const std::invalid_argument &e)
    {
      throw UsageError(e.what());
    }

    processing::JsonProcessor processor = [&settings]()
    {
      try
      {
        return settings.makeProcessor();
      }
      catch (const std::invalid_argument &e)
      {
        throw UsageError(e.what());
      }
    }();

    std::string input = readInput(options);
    auto result = processor.parseAndValidate(input, options.resource, settings.completionOptions());

    if (options.showSteps)
    {
      printSteps(result.steps(), result.diagnostics());
    }
    if (!result.ok())
    {
      const auto &error = result.error();
      std::cerr << "Error: " << error.what() << "\n"
                << "--- original ---\n"
                << error.originalText() << "\n"
                << "--- final ---\n"
                << error.finalText() << std::endl;
      return EXIT_REPAIR_FAILED;
    }

    parsers::SerializeOptions serializeOptions;
    serializeOptions.pretty = options.pretty;
    std::cout << result.value().serialize(serializeOptions) << std::endl;
  }
  catch (const UsageError &e)
  {
    std::cerr << "jsonmend: " << e.what() << "\n"
              << "Try 'jsonmend --help' for more information." << std::endl;
    return EXIT_USAGE;
  }
  catch (const std::exception &e)
  {
    std::cerr << "jsonmend: " << e.what() << std::endl;
    return EXIT_REPAIR_FAILED;
  }
  return 0;
}
