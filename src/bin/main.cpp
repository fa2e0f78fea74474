#include <ixb/binding_error.hpp>
#include <ixb/document.hpp>
#include <ixb/invoice.hpp>
#include <ixb/schema_validator.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_parse = 3;
static constexpr int exit_validate = 4;

struct check_options {
  std::string input_file;
  std::string output_file;
  std::string schema = std::string(ixb::zugferd_1p0);
  bool verbose = false;
  bool show_help = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: ixb check [options] <invoice.xml>\n"
     << "\n"
     << "Decode an invoice document, re-serialize it, and validate the\n"
     << "result against the schema profile.\n"
     << "\n"
     << "Options:\n"
     << "  --schema <name>   Schema profile (default: ZUGFeRD1p0)\n"
     << "  -o <file>         Write the re-serialized document to <file>\n"
     << "  --verbose         Report each stage on stderr\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "ixb " << IXB_VERSION << "\n";
}

static check_options
parse_check_args(int argc, char* argv[]) {
  check_options opts;

  // argv[0] is "ixb", argv[1] is "check", start at 2
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--verbose") {
      opts.verbose = true;
      continue;
    }

    if (arg == "--schema") {
      if (i + 1 >= argc) {
        std::cerr << "ixb check: --schema requires an argument\n";
        std::exit(exit_usage);
      }
      opts.schema = argv[++i];
      continue;
    }

    if (arg == "-o") {
      if (i + 1 >= argc) {
        std::cerr << "ixb check: -o requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_file = argv[++i];
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "ixb check: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.input_file.empty()) {
      std::cerr << "ixb check: only one input file may be given\n";
      std::exit(exit_usage);
    }
    opts.input_file = arg;
  }

  return opts;
}

static std::string
read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "ixb check: cannot open file: " << path << "\n";
    std::exit(exit_io);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static std::string
text_or_empty(const ixb::element& el, const char* field) {
  if (!el.has(field)) { return {}; }
  return el.leaf_at(field).to_string();
}

static void
print_summary(std::ostream& os, const ixb::document& doc) {
  const auto& header = doc.element_at("header");
  os << "document: " << text_or_empty(header, "id") << "\n";

  const auto& trade = doc.element_at("trade");
  os << "line items: " << trade.container_at("line_items").size() << "\n";

  if (trade.has("settlement")) {
    const auto& settlement = trade.element_at("settlement");
    if (settlement.has("monetary_summation")) {
      os << "grand total: "
         << text_or_empty(settlement.element_at("monetary_summation"),
                          "grand_total")
         << "\n";
    }
  }
}

static int
run_check(const check_options& opts) {
  std::string xml = read_file(opts.input_file);
  if (opts.verbose) {
    std::cerr << "ixb check: read " << xml.size() << " bytes from "
              << opts.input_file << "\n";
  }

  ixb::profile_validator validator;
  if (validator.find(opts.schema) == nullptr) {
    std::cerr << "ixb check: unknown schema profile: " << opts.schema << "\n";
    return exit_usage;
  }

  ixb::document doc = ixb::make_invoice_document();
  try {
    doc = ixb::document::parse(xml, ixb::invoice_document_type(),
                               opts.schema);
  } catch (const std::exception& e) {
    std::cerr << "ixb check: " << opts.input_file << ": " << e.what() << "\n";
    return exit_parse;
  }
  if (opts.verbose) { std::cerr << "ixb check: decoded document\n"; }

  std::string output;
  try {
    output = doc.serialize(validator);
  } catch (const ixb::binding_error& e) {
    std::cerr << "ixb check: " << opts.input_file << ": " << e.what() << "\n";
    return exit_validate;
  }
  if (opts.verbose) {
    std::cerr << "ixb check: validated against " << opts.schema << "\n";
  }

  if (!opts.output_file.empty()) {
    std::ofstream out(opts.output_file, std::ios::binary);
    if (!out) {
      std::cerr << "ixb check: cannot write file: " << opts.output_file
                << "\n";
      return exit_io;
    }
    out << output << "\n";
  }

  print_summary(std::cout, doc);
  return exit_success;
}

int
main(int argc, char* argv[]) {
  if (argc >= 2 && std::string(argv[1]) == "check") {
    auto opts = parse_check_args(argc, argv);

    if (opts.show_help) {
      print_usage(std::cerr);
      return exit_success;
    }

    if (opts.input_file.empty()) {
      std::cerr << "ixb check: no input file\n";
      print_usage(std::cerr);
      return exit_usage;
    }

    return run_check(opts);
  }

  if (argc >= 2) {
    std::string arg = argv[1];
    if (arg == "-h" || arg == "--help") {
      print_usage(std::cerr);
      return exit_success;
    }
    if (arg == "--version") {
      print_version(std::cerr);
      return exit_success;
    }
    std::cerr << "ixb: unknown command: " << arg << "\n";
  }

  print_usage(std::cerr);
  return exit_usage;
}
