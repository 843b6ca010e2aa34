#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vdot/table.hpp>

namespace vdot {

// Version written on the first line of a dump.
inline constexpr int kDumpVersion = 1;

struct EncodeOptions {
  std::size_t wrap_width = 88;  // 0 disables wrapping
};

// Textual dump: version line, CSV header, one integer row per grid index.
void dump_table(const PrecomputedTable& table, std::ostream& out);
std::string dump_table(const PrecomputedTable& table);

// Strict parser for dump_table output. Throws TableError.
PrecomputedTable parse_dump(std::istream& in);
PrecomputedTable parse_dump(const std::string& text);

// gzip (RFC 1952) with a zero mtime so equal input gives equal bytes.
std::string gzip_compress(const std::string& raw);
std::string gzip_decompress(const std::string& gz);  // throws TableError

std::string base64_encode(const std::string& bytes);
// Ignores line breaks and other whitespace. Throws TableError.
std::string base64_decode(const std::string& text);

std::string wrap_lines(const std::string& text, std::size_t width);

// dump -> gzip -> base64 -> wrap
std::string encode_table(const PrecomputedTable& table, const EncodeOptions& opt = {});
// Exact reverse of encode_table. Throws TableError.
PrecomputedTable decode_table(const std::string& blob);

} // namespace vdot
