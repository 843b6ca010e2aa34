// vdot-gentable: precomputes the equivalence table and writes it as an
// embeddable blob, a C++ source defining the blob symbol, or a CSV dump.

#include <vdot/codec.hpp>
#include <vdot/generator.hpp>

#include <chrono>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace vdot;

namespace {

enum class OutputFormat { Blob, Cpp, Csv };

struct Options {
  std::string output;                  // empty -> stdout
  std::string symbol = "kEmbeddedTableBlob";
  OutputFormat format = OutputFormat::Blob;
  GeneratorConfig gen{};
  EncodeOptions enc{};
  bool show_help = false;
};

bool debug_enabled() {
  const char* env = std::getenv("VDOT_DEBUG");
  return env && env[0] != '\0' && env[0] != '0';
}

void debug_log(const std::string& msg) {
  if (debug_enabled()) std::cerr << "[gentable] " << msg << "\n";
}

void print_usage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n\n";
  std::cerr << "Options:\n";
  std::cerr << "  --output=FILE     Write to FILE instead of stdout\n";
  std::cerr << "  --format=FORMAT   blob, cpp or csv (default: blob)\n";
  std::cerr << "  --workers=N       Worker threads for generation (default: 1)\n";
  std::cerr << "  --width=N         Blob line width, 0 = no wrapping (default: 88)\n";
  std::cerr << "  --symbol=NAME     Array defined by --format=cpp (default: kEmbeddedTableBlob)\n";
  std::cerr << "  --help            Show this help message\n";
}

bool extract_arg_value(const char* arg, const char* key, std::string& value) {
  const std::size_t key_len = std::strlen(key);
  if (std::strncmp(arg, key, key_len) == 0 && arg[key_len] == '=') {
    value = arg + key_len + 1;
    return true;
  }
  return false;
}

bool parse_unsigned(const std::string& s, unsigned& out) {
  if (s.empty() || s.size() > 9) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  out = static_cast<unsigned>(std::stoul(s));
  return true;
}

bool is_identifier(const std::string& s) {
  if (s.empty()) return false;
  const unsigned char first = static_cast<unsigned char>(s.front());
  if (!std::isalpha(first) && first != '_') return false;
  for (char c : s) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

bool parse_args(int argc, char* argv[], Options& opt, std::string& error) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    std::string value;
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      opt.show_help = true;
    } else if (extract_arg_value(arg, "--output", value)) {
      opt.output = value;
    } else if (extract_arg_value(arg, "--format", value)) {
      if (value == "blob")     opt.format = OutputFormat::Blob;
      else if (value == "cpp") opt.format = OutputFormat::Cpp;
      else if (value == "csv") opt.format = OutputFormat::Csv;
      else { error = "Unknown format: " + value; return false; }
    } else if (extract_arg_value(arg, "--workers", value)) {
      if (!parse_unsigned(value, opt.gen.workers) || opt.gen.workers == 0) {
        error = "Invalid worker count: " + value;
        return false;
      }
    } else if (extract_arg_value(arg, "--width", value)) {
      unsigned w = 0;
      if (!parse_unsigned(value, w)) { error = "Invalid width: " + value; return false; }
      opt.enc.wrap_width = w;
    } else if (extract_arg_value(arg, "--symbol", value)) {
      if (!is_identifier(value)) { error = "Invalid symbol: " + value; return false; }
      opt.symbol = value;
    } else {
      error = std::string("Unknown argument: ") + arg;
      return false;
    }
  }
  return true;
}

std::string cpp_source(const std::string& blob, const std::string& symbol) {
  std::ostringstream ss;
  ss << "// Generated by vdot-gentable. Do not edit.\n"
     << "#include <vdot/store.hpp>\n\n"
     << "namespace vdot {\n\n"
     << "extern const char " << symbol << "[] = R\"VDOT(" << blob << ")VDOT\";\n\n"
     << "} // namespace vdot\n";
  return ss.str();
}

} // namespace

int main(int argc, char* argv[]) {
  Options opt;
  std::string error;
  if (!parse_args(argc, argv, opt, error)) {
    std::cerr << "[gentable] " << error << "\n\n";
    print_usage(argv[0]);
    return 2;
  }
  if (opt.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  const auto t0 = std::chrono::steady_clock::now();
  std::string payload;
  try {
    const PrecomputedTable table = generate_table(opt.gen);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - t0).count();
    debug_log("generated " + std::to_string(table.size()) + " rows in " +
              std::to_string(ms) + " ms using " + std::to_string(opt.gen.workers) + " worker(s)");

    if (opt.format == OutputFormat::Csv) {
      payload = dump_table(table);
    } else {
      const std::string blob = encode_table(table, opt.enc);
      // The artifact must decode back to exactly what was generated.
      if (!(decode_table(blob) == table)) {
        std::cerr << "[gentable] encoded table does not round-trip\n";
        return 1;
      }
      debug_log("blob is " + std::to_string(blob.size()) + " bytes");
      payload = (opt.format == OutputFormat::Cpp) ? cpp_source(blob, opt.symbol) : blob + "\n";
    }
  } catch (const GenerationError& e) {
    std::cerr << "[gentable] generation failed: " << e.what() << "\n";
    return 1;
  } catch (const TableError& e) {
    std::cerr << "[gentable] table error: " << e.what() << "\n";
    return 1;
  }

  if (opt.output.empty()) {
    std::cout << payload;
    return std::cout ? 0 : 1;
  }

  std::ofstream f(opt.output, std::ios::binary);
  if (!f) {
    std::cerr << "[gentable] cannot open " << opt.output << " for writing\n";
    return 1;
  }
  f << payload;
  if (!f) {
    std::cerr << "[gentable] write failed: " << opt.output << "\n";
    return 1;
  }
  std::cerr << "[gentable] wrote " << opt.output << "\n";
  return 0;
}
