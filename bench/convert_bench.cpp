#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <simdjson.h>

#include "json_table/header_extract.hpp"
#include "json_table/json_loader.hpp"
#include "json_table/table_converter.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

// Object array with `cols` shared keys plus one sparse key every 7th row.
static std::string make_synth_objects(std::size_t rows, std::size_t cols) {
  std::string out;
  out.reserve(rows * cols * 16);
  out += "[";
  for (size_t r = 0; r < rows; ++r) {
    if (r) out += ",";
    out += "{";
    for (size_t c = 0; c < cols; ++c) {
      out += "\"k" + std::to_string(c) + "\":";
      if ((r + c) % 11 == 0) out += "null";
      else out += std::to_string((r % 10) * 1000 + c);
      if (c+1<cols) out += ",";
    }
    if (r % 7 == 0) out += ",\"sparse" + std::to_string(r % 97) + "\":\"x\"";
    out += "}";
  }
  out += "]";
  return out;
}

struct Args {
  std::string json_path;       // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--json") a.json_path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: convert_bench [--json=path] [--rows=N] [--cols=M] [--iters=K]\n"
        "If the path is omitted, a synthetic object array is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void report(const char* what, int k, std::size_t rows, double sec) {
  std::cout << "  " << what << " iter " << k
            << ": rows=" << rows
            << " time=" << sec << "s"
            << "  rows/s=" << (sec > 0.0 ? rows / sec : 0.0) << "\n";
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  jt::JsonLoader loader;
  jt::JsonValue root;
  try {
    if (!a.json_path.empty() && fs::exists(a.json_path)) {
      const fs::path p = fs::absolute(a.json_path);
      root = loader.load_from_file(p.filename().string(), p.parent_path());
    } else {
      root = loader.load_from_content(make_synth_objects(a.rows, a.cols));
    }
  } catch (const std::exception& e) {
    std::cerr << "[bench] " << e.what() << "\n";
    return 1;
  }
  std::cout << "[bench] input bytes=" << loader.bytes_read() << "\n";

  // header scan alone, over the capped record window
  jt::ConvertConfig cfg;
  std::vector<jt::JsonValue> records;
  simdjson::dom::array arr;
  if (!root.get_array().get(arr)) {
    for (jt::JsonValue e : arr) {
      if (records.size() >= cfg.max_objects) break;
      records.push_back(e);
    }
  }
  std::cout << "\n[header] records=" << records.size() << " iters=" << a.iters << "\n";
  for (int k=1;k<=a.iters;++k) {
    auto t0 = clk::now();
    auto h = jt::extract_headers(records, cfg);
    auto t1 = clk::now();
    std::cout << "  keys=" << h.size() << "\n";
    report("header", k, records.size(), std::chrono::duration<double>(t1-t0).count());
  }

  // full conversion, unlimited
  std::cout << "\n[convert] limit=0 iters=" << a.iters << "\n";
  jt::TableConverter conv(cfg, jt::null_sink());
  for (int k=1;k<=a.iters;++k) {
    try {
      auto t0 = clk::now();
      auto t = conv.convert(root, true, std::size_t{0});
      auto t1 = clk::now();
      report("convert", k, t.size(), std::chrono::duration<double>(t1-t0).count());
    } catch (const std::exception& e) {
      std::cerr << "[bench] " << e.what() << "\n";
      return 1;
    }
  }
  return 0;
}
