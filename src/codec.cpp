#include <vdot/codec.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <istream>
#include <ostream>
#include <sstream>
#include <system_error>
#include <vector>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>

namespace vdot {

namespace {

namespace io = boost::iostreams;
namespace bai = boost::archive::iterators;

constexpr const char* kHeader =
  "v,five_k_time,ten_k_time,hm_time,m_time,e_pace_1,e_pace_2,m_pace,t_pace,i_pace,r_pace";
constexpr std::size_t kFieldCount = 11;

constexpr const char* kBlank = " \t\r\n\v\f";

std::string strip(const std::string& s) {
  const auto first = s.find_first_not_of(kBlank);
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(kBlank);
  return s.substr(first, last - first + 1);
}

bool to_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  const char* first = s.data();
  const char* last  = s.data() + s.size();
  const auto res = std::from_chars(first, last, out);
  return res.ec == std::errc{} && res.ptr == last;
}

[[noreturn]] void malformed(std::size_t line_no, const std::string& why) {
  throw TableError("malformed table dump (line " + std::to_string(line_no) + "): " + why);
}

// "# vdot-table v1 rows=551" -> 551
std::size_t parse_version_line(const std::string& line) {
  std::istringstream ss(line);
  std::string hash, tag, version, rows;
  ss >> hash >> tag >> version >> rows;
  if (hash != "#" || tag != "vdot-table") malformed(1, "missing version line");
  if (version != "v" + std::to_string(kDumpVersion)) malformed(1, "unsupported version '" + version + "'");
  int n = 0;
  if (rows.rfind("rows=", 0) != 0 || !to_int(rows.substr(5), n) || n < 0) {
    malformed(1, "bad row count '" + rows + "'");
  }
  return static_cast<std::size_t>(n);
}

// One comma-separated data line; every field must be an integer.
EquivalenceRow parse_row(const std::string& line, std::size_t line_no) {
  int f[kFieldCount];
  std::size_t count = 0;
  std::size_t pos = 0;
  while (true) {
    const std::size_t comma = line.find(',', pos);
    const std::size_t len = (comma == std::string::npos) ? std::string::npos : comma - pos;
    const std::string field = strip(line.substr(pos, len));
    if (count == kFieldCount) {
      malformed(line_no, "more than " + std::to_string(kFieldCount) + " fields");
    }
    if (!to_int(field, f[count])) malformed(line_no, "not an integer: '" + field + "'");
    ++count;
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }
  if (count != kFieldCount) {
    malformed(line_no, "expected " + std::to_string(kFieldCount) + " fields, got " +
                       std::to_string(count));
  }

  EquivalenceRow row{};
  row.v = f[0];
  for (std::size_t i = 0; i < kRaceCount; ++i) row.race_s[i] = f[1 + i];
  row.easy_slow  = f[5];
  row.easy_fast  = f[6];
  row.marathon   = f[7];
  row.threshold  = f[8];
  row.interval   = f[9];
  row.repetition = f[10];
  return row;
}

} // namespace

void dump_table(const PrecomputedTable& table, std::ostream& out) {
  out << "# vdot-table v" << kDumpVersion << " rows=" << table.size() << "\n";
  out << kHeader << "\n";
  for (const auto& r : table.rows()) {
    out << r.v;
    for (int t : r.race_s) out << ',' << t;
    out << ',' << r.easy_slow
        << ',' << r.easy_fast
        << ',' << r.marathon
        << ',' << r.threshold
        << ',' << r.interval
        << ',' << r.repetition << "\n";
  }
}

std::string dump_table(const PrecomputedTable& table) {
  std::ostringstream ss;
  dump_table(table, ss);
  return ss.str();
}

PrecomputedTable parse_dump(std::istream& in) {
  std::string line;
  std::size_t line_no = 0;

  if (!std::getline(in, line)) malformed(1, "empty dump");
  ++line_no;
  const std::size_t expected = parse_version_line(strip(line));

  if (!std::getline(in, line) || strip(line) != kHeader) malformed(2, "missing header row");
  ++line_no;

  std::vector<EquivalenceRow> rows;
  rows.reserve(expected);
  while (std::getline(in, line)) {
    ++line_no;
    const std::string raw = strip(line);
    if (raw.empty()) continue;
    rows.push_back(parse_row(raw, line_no));
  }
  if (rows.size() != expected) {
    malformed(line_no, "expected " + std::to_string(expected) + " rows, got " +
                       std::to_string(rows.size()));
  }
  // Duplicate and gap detection happens in the table itself.
  return PrecomputedTable{std::move(rows)};
}

PrecomputedTable parse_dump(const std::string& text) {
  std::istringstream ss(text);
  return parse_dump(ss);
}

std::string gzip_compress(const std::string& raw) {
  std::istringstream origin(raw);
  std::ostringstream compressed;
  io::filtering_streambuf<io::input> chain;
  io::gzip_params params(io::gzip::best_compression);
  params.mtime = 0;
  chain.push(io::gzip_compressor(params));
  chain.push(origin);
  io::copy(chain, compressed);
  return compressed.str();
}

std::string gzip_decompress(const std::string& gz) {
  std::istringstream origin(gz);
  std::ostringstream raw;
  try {
    io::filtering_streambuf<io::input> chain;
    chain.push(io::gzip_decompressor());
    chain.push(origin);
    io::copy(chain, raw);
  } catch (const std::exception& e) {
    throw TableError(std::string("gzip: ") + e.what());
  }
  return raw.str();
}

std::string base64_encode(const std::string& bytes) {
  using Enc = bai::base64_from_binary<bai::transform_width<std::string::const_iterator, 6, 8>>;
  std::string out(Enc(bytes.begin()), Enc(bytes.end()));
  out.append((3 - bytes.size() % 3) % 3, '=');
  return out;
}

std::string base64_decode(const std::string& text) {
  std::string in;
  in.reserve(text.size());
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c))) in.push_back(c);
  }
  if (in.size() % 4 != 0) throw TableError("base64: length is not a multiple of 4");

  std::size_t pad = 0;
  while (pad < 2 && pad < in.size() && in[in.size() - 1 - pad] == '=') ++pad;
  for (std::size_t i = 0; i < in.size() - pad; ++i) {
    const unsigned char c = static_cast<unsigned char>(in[i]);
    if (!(std::isalnum(c) || c == '+' || c == '/')) {
      throw TableError("base64: invalid character at offset " + std::to_string(i));
    }
  }
  std::replace(in.end() - static_cast<std::ptrdiff_t>(pad), in.end(), '=', 'A');

  using Dec = bai::transform_width<bai::binary_from_base64<std::string::const_iterator>, 8, 6>;
  std::string out;
  try {
    out.assign(Dec(in.cbegin()), Dec(in.cend()));
  } catch (const std::exception& e) {
    throw TableError(std::string("base64: ") + e.what());
  }
  out.resize(out.size() - pad);
  return out;
}

std::string wrap_lines(const std::string& text, std::size_t width) {
  if (width == 0 || text.size() <= width) return text;
  std::string out;
  out.reserve(text.size() + text.size() / width);
  for (std::size_t i = 0; i < text.size(); i += width) {
    if (i > 0) out.push_back('\n');
    out.append(text, i, width);
  }
  return out;
}

std::string encode_table(const PrecomputedTable& table, const EncodeOptions& opt) {
  return wrap_lines(base64_encode(gzip_compress(dump_table(table))), opt.wrap_width);
}

PrecomputedTable decode_table(const std::string& blob) {
  return parse_dump(gzip_decompress(base64_decode(blob)));
}

} // namespace vdot
