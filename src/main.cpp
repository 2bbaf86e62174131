#include "styletree/core/config.h"
#include "styletree/styletree.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(std::ostream& stream) {
  stream << "usage: " << styletree::core::config::kProgramName
         << " <markup-file> <stylesheet-file> [--verbose]\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool read_file(const std::string& path, std::string& contents) {
  std::ifstream input(path, std::ios::in | std::ios::binary);
  if (!input) {
    return false;
  }
  std::ostringstream buffer;
  buffer << input.rdbuf();
  contents = buffer.str();
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << styletree::core::config::kVersionString << "\n";
    return 0;
  }

  bool verbose = false;
  std::vector<std::string> positional_args;
  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (argument == "--verbose" || argument == "-v") {
      verbose = true;
      continue;
    }
    positional_args.emplace_back(argument);
  }

  if (positional_args.size() != 2) {
    print_usage(std::cerr);
    return 1;
  }

  std::string markup;
  if (!read_file(positional_args[0], markup)) {
    std::cerr << "Cannot read markup file: " << positional_args[0] << "\n";
    return 1;
  }
  std::string css;
  if (!read_file(positional_args[1], css)) {
    std::cerr << "Cannot read stylesheet file: " << positional_args[1] << "\n";
    return 1;
  }

  styletree::core::DiagnosticEmitter diagnostics;
  diagnostics.set_min_severity(verbose ? styletree::core::Severity::Info
                                       : styletree::core::Severity::Error);
  diagnostics.add_observer([](const styletree::core::DiagnosticEvent& event) {
    std::cerr << styletree::core::format_diagnostic(event) << "\n";
  });

  try {
    const styletree::html::Node root = styletree::parse_markup(markup, diagnostics);
    const styletree::css::Stylesheet sheet = styletree::parse_stylesheet(css, diagnostics);
    const styletree::css::StyledNode styled = styletree::resolve_styles(root, sheet, diagnostics);
    std::cout << styletree::css::serialize_styled_tree(styled) << "\n";
  } catch (const styletree::core::ParseError&) {
    // Already reported through the diagnostics observer.
    return 1;
  }

  return 0;
}
