#include <fidelity/core/config.h>
#include <fidelity/core/diagnostics.h>
#include <fidelity/core/error.h>
#include <fidelity/core/utf8.h>
#include <fidelity/io/compression.h>
#include <fidelity/io/reader.h>
#include <fidelity/io/tree_writer.h>
#include <fidelity/text/probe.h>
#include <fidelity/text/sanitizer.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char kProgramName[] = "fidelity";

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFormat = 2;
constexpr int kExitIo = 3;

struct CommandLine {
  std::string command;
  std::string input_path;
  bool keep_comments = false;
  bool gzip_output = false;
  bool verbose = false;
};

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <probe|sanitize|check> [--keep-comments] [--gzip] [--verbose] <file|->\n"
         << "  probe     print xml, json or unknown\n"
         << "  sanitize  rewrite named entities to numeric references\n"
         << "  check     parse with the hardened reader and re-emit\n"
         << "gzip input is detected and inflated; --gzip compresses the output\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool is_command(std::string_view text) {
  return text == "probe" || text == "sanitize" || text == "check";
}

std::optional<CommandLine> parse_command_line(int argc, char** argv) {
  CommandLine result;
  std::vector<std::string> positional_args;

  for (int i = 1; i < argc; ++i) {
    const std::string_view argument(argv[i]);
    if (argument == "--keep-comments") {
      result.keep_comments = true;
    } else if (argument == "--gzip") {
      result.gzip_output = true;
    } else if (argument == "--verbose") {
      result.verbose = true;
    } else if (argument.size() > 1 && argument[0] == '-' && argument != "-") {
      std::cerr << "Unknown option: '" << argument << "'\n";
      return std::nullopt;
    } else {
      positional_args.emplace_back(argument);
    }
  }

  if (positional_args.size() != 2 || !is_command(positional_args[0])) {
    return std::nullopt;
  }
  result.command = positional_args[0];
  result.input_path = positional_args[1];
  return result;
}

std::string read_input(const std::string& path) {
  std::string content;
  if (path == "-") {
    content = fidelity::io::read_stream(std::cin);
  } else {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      throw fidelity::IoError("Cannot open '" + path + "'");
    }
    content = fidelity::io::read_stream(file);
  }
  if (fidelity::io::is_gzip(content)) {
    return fidelity::io::decompress_gzip(content);
  }
  return content;
}

void write_output(const CommandLine& cmd, const std::string& text) {
  if (cmd.gzip_output) {
    std::cout << fidelity::io::compress_gzip(text);
  } else {
    std::cout << text;
  }
  std::cout.flush();
  if (!std::cout) {
    throw fidelity::IoError("Failed to write to standard output");
  }
}

int run_check(const CommandLine& cmd, const std::string& input,
              fidelity::core::DiagnosticEmitter& diagnostics) {
  const std::optional<fidelity::Format> format =
      fidelity::text::probe_format(fidelity::utf8::strip_byte_order_mark(input));
  if (!format) {
    std::cerr << "Input is neither xml nor json\n";
    return kExitFormat;
  }

  fidelity::io::ReaderOptions options;
  options.ignore_comments = !cmd.keep_comments;
  options.diagnostics = &diagnostics;

  auto reader = fidelity::io::build_reader(input, *format, options);
  fidelity::io::DocumentTree tree = reader->read_document();

  if (tree.markup) {
    write_output(cmd, fidelity::io::to_markup_string(*tree.markup) + "\n");
  } else {
    write_output(cmd, fidelity::io::to_json_string(*tree.object) + "\n");
  }
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return kExitOk;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << fidelity::config::kVersionString << "\n";
    return kExitOk;
  }

  const std::optional<CommandLine> cmd = parse_command_line(argc, argv);
  if (!cmd) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  fidelity::core::DiagnosticEmitter diagnostics;
  if (cmd->verbose) {
    diagnostics.add_observer([](const fidelity::core::DiagnosticEvent& event) {
      std::cerr << fidelity::core::format_diagnostic(event) << "\n";
    });
  }

  try {
    const std::string input = read_input(cmd->input_path);

    if (cmd->command == "probe") {
      const std::optional<fidelity::Format> format =
          fidelity::text::probe_format(fidelity::utf8::strip_byte_order_mark(input));
      std::cout << (format ? fidelity::format_name(*format) : "unknown") << "\n";
      return kExitOk;
    }
    if (cmd->command == "sanitize") {
      write_output(*cmd, fidelity::text::sanitize_markup(input));
      return kExitOk;
    }
    return run_check(*cmd, input, diagnostics);
  } catch (const fidelity::FormatError& e) {
    std::cerr << e.what() << "\n";
    return kExitFormat;
  } catch (const fidelity::IoError& e) {
    std::cerr << e.what() << "\n";
    return kExitIo;
  }
}
