#include <mender/core/config.h>
#include <mender/core/diagnostics.h>
#include <mender/core/error.h>
#include <mender/filters/event_printer.h>
#include <mender/filters/html_writer.h>
#include <mender/html/parser.h>

#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char kProgramName[] = "mender";
constexpr const char kVersionString[] = "mender 0.1.0";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " [--events] [--fragment] [--encoding=LABEL] [--report-errors]"
            " [--no-balance] [--feature=NAME=on|off] [--property=NAME=VALUE] [file]\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_switch(std::string_view text, bool& state) {
  if (text == "on" || text == "true" || text == "1") {
    state = true;
    return true;
  }
  if (text == "off" || text == "false" || text == "0") {
    state = false;
    return true;
  }
  return false;
}

// Splits "NAME=VALUE". Both parts must be non-empty.
bool split_assignment(std::string_view text, std::string& name, std::string& value) {
  const std::size_t separator = text.find('=');
  if (separator == std::string_view::npos || separator == 0 || separator + 1 >= text.size()) {
    return false;
  }
  name = std::string(text.substr(0, separator));
  value = std::string(text.substr(separator + 1));
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << kVersionString << "\n";
    return 0;
  }

  mender::html::Parser parser;
  bool print_events = false;
  std::vector<std::string> positional_args;

  try {
    for (int index = 1; index < argc; ++index) {
      const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
      constexpr std::string_view kEncodingPrefix = "--encoding=";
      constexpr std::string_view kFeaturePrefix = "--feature=";
      constexpr std::string_view kPropertyPrefix = "--property=";

      if (argument == "--events") {
        print_events = true;
      } else if (argument == "--fragment") {
        parser.set_feature("document-fragment", true);
      } else if (argument == "--report-errors") {
        parser.set_feature("report-errors", true);
      } else if (argument == "--no-balance") {
        parser.set_feature("balance-tags", false);
      } else if (starts_with(argument, kEncodingPrefix)) {
        parser.set_property("default-encoding", argument.substr(kEncodingPrefix.size()));
        parser.set_feature("ignore-specified-charset", true);
      } else if (starts_with(argument, kFeaturePrefix)) {
        std::string name;
        std::string value;
        bool state = false;
        if (!split_assignment(argument.substr(kFeaturePrefix.size()), name, value) ||
            !parse_switch(value, state)) {
          std::cerr << "Invalid --feature: '" << argument
                    << "' (expected --feature=NAME=on|off)\n";
          print_usage(std::cerr);
          return 1;
        }
        parser.set_feature(name, state);
      } else if (starts_with(argument, kPropertyPrefix)) {
        std::string name;
        std::string value;
        if (!split_assignment(argument.substr(kPropertyPrefix.size()), name, value)) {
          std::cerr << "Invalid --property: '" << argument
                    << "' (expected --property=NAME=VALUE)\n";
          print_usage(std::cerr);
          return 1;
        }
        parser.set_property(name, value);
      } else if (starts_with(argument, "--")) {
        std::cerr << "Unknown option: '" << argument << "'\n";
        print_usage(std::cerr);
        return 1;
      } else {
        positional_args.emplace_back(argument);
      }
    }
  } catch (const mender::core::ConfigError& error) {
    std::cerr << error.what() << "\n";
    return 1;
  }

  if (positional_args.size() > 1) {
    print_usage(std::cerr);
    return 1;
  }

  parser.diagnostics().add_observer([](const mender::core::DiagnosticEvent& event) {
    std::cerr << mender::core::format_diagnostic(event) << "\n";
  });

  mender::filters::EventPrinter event_printer(std::cout);
  mender::filters::HtmlWriter html_writer(std::cout);
  mender::html::EventHandler& handler = print_events
      ? static_cast<mender::html::EventHandler&>(event_printer)
      : static_cast<mender::html::EventHandler&>(html_writer);

  try {
    if (positional_args.empty() || positional_args[0] == "-") {
      parser.parse(std::cin, handler);
    } else {
      std::ifstream file(positional_args[0], std::ios::binary);
      if (!file) {
        std::cerr << "Cannot open '" << positional_args[0] << "'\n";
        return 2;
      }
      parser.parse(file, handler);
    }
  } catch (const mender::core::IoError& error) {
    std::cerr << "I/O error: " << error.what() << "\n";
    return 2;
  } catch (const mender::core::LimitError& error) {
    std::cerr << error.what() << "\n";
    return 3;
  }

  if (!print_events) {
    std::cout << "\n";
  }
  return 0;
}
