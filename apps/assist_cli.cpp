#include "assist/assistant.hpp"
#include "assist/config.hpp"
#include "assist/document.hpp"
#include "assist/error.hpp"
#include "assist/logging.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitSkipped = 2;

struct CliArguments {
  std::string path;
  std::vector<assist::SelectionRange> selections;
  std::optional<std::string> model;
  bool in_place = false;
};

void print_usage(std::ostream& out)
{
  out << "usage: assist_cli <file> [--select START:END]... [--model NAME] [--in-place]\n"
      << "Reads OPENAI_API_KEY, OPENAI_BASE_URL, ASSIST_MODEL and OPENAI_LOG from the environment.\n";
}

std::optional<assist::SelectionRange> parse_selection(const std::string& value)
{
  auto colon = value.find(':');
  if (colon == std::string::npos)
  {
    return std::nullopt;
  }
  try
  {
    std::size_t consumed = 0;
    const unsigned long long start = std::stoull(value.substr(0, colon), &consumed);
    if (consumed != colon)
    {
      return std::nullopt;
    }
    const std::string end_text = value.substr(colon + 1);
    const unsigned long long end = std::stoull(end_text, &consumed);
    if (consumed != end_text.size())
    {
      return std::nullopt;
    }
    return assist::SelectionRange{static_cast<std::size_t>(start), static_cast<std::size_t>(end)};
  }
  catch (const std::logic_error&)
  {
    return std::nullopt;
  }
}

std::optional<CliArguments> parse_arguments(int argc, char** argv)
{
  CliArguments args;
  for (int i = 1; i < argc; ++i)
  {
    const std::string arg = argv[i];
    if (arg == "--select" && i + 1 < argc)
    {
      auto selection = parse_selection(argv[++i]);
      if (!selection)
      {
        std::cerr << "invalid selection: " << argv[i] << "\n";
        return std::nullopt;
      }
      args.selections.push_back(*selection);
    }
    else if (arg == "--model" && i + 1 < argc)
    {
      args.model = argv[++i];
    }
    else if (arg == "--in-place")
    {
      args.in_place = true;
    }
    else if (!arg.empty() && arg[0] != '-' && args.path.empty())
    {
      args.path = arg;
    }
    else
    {
      std::cerr << "unexpected argument: " << arg << "\n";
      return std::nullopt;
    }
  }
  if (args.path.empty())
  {
    return std::nullopt;
  }
  return args;
}

}  // namespace

int main(int argc, char** argv)
{
  auto args = parse_arguments(argc, argv);
  if (!args)
  {
    print_usage(std::cerr);
    return kExitFailure;
  }

  std::ifstream input(args->path, std::ios::binary);
  if (!input)
  {
    std::cerr << "cannot read " << args->path << "\n";
    return kExitFailure;
  }
  std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  input.close();

  try
  {
    assist::AssistOptions options;
    if (args->model)
    {
      options.model = *args->model;
    }
    options.logger = assist::make_stderr_logger();
    options = assist::load_options_from_env(std::move(options));
    if (options.log_level == assist::LogLevel::Off)
    {
      options.log_level = assist::LogLevel::Error;
    }

    assist::Document document(std::move(text));
    assist::Assistant assistant(std::move(options));

    const assist::AssistStatus status = assistant.invoke(document, args->selections);
    if (status == assist::AssistStatus::Skipped)
    {
      std::cerr << "OPENAI_API_KEY is not set; nothing to do\n";
      return kExitSkipped;
    }

    const std::string result = document.text();
    if (args->in_place)
    {
      std::ofstream output(args->path, std::ios::binary | std::ios::trunc);
      if (!output || !(output << result))
      {
        std::cerr << "cannot write " << args->path << "\n";
        return kExitFailure;
      }
    }
    else
    {
      std::cout << result;
    }
    return status == assist::AssistStatus::Completed ? kExitOk : kExitFailure;
  }
  catch (const assist::AssistError& ex)
  {
    std::cerr << "error: " << ex.what() << "\n";
    return kExitFailure;
  }
  catch (const std::exception& ex)
  {
    std::cerr << "unexpected error: " << ex.what() << "\n";
    return kExitFailure;
  }
}
