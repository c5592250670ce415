#include "json_table/app_config.hpp"
#include "json_table/artifact_writer.hpp"
#include "json_table/diagnostics.hpp"
#include "json_table/grid_table.hpp"
#include "json_table/http_server.hpp"
#include "json_table/metrics.hpp"
#include "json_table/path_utils.hpp"
#include "json_table/table_directive.hpp"
#include "json_table/table_document.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum class Emit { Grid, Json, None };

struct Cli {
  jt::AppConfig app;
  std::string config_file;
  bool header = false;
  std::optional<std::size_t> limit;
  Emit emit = Emit::Grid;
  bool serve_only = false;
  std::vector<std::string> converts; // paths relative to base_dir
  std::optional<std::string> inline_json;
};

[[noreturn]] void usage_and_exit(int code) {
  (code == 0 ? std::cout : std::cerr) <<
    "Usage: json-table [--config=FILE] [--base-dir=DIR] [--header] [--limit=N]\n"
    "                  [--default-cap=N] [--max-objects=N] [--max-keys=N] [--max-key-length=N]\n"
    "                  [--encoding=NAME] [--emit=grid|json|none] [--artifact-root=DIR]\n"
    "                  [--slug-mode=hashprefix|basename|keypath] [--slug-len=N]\n"
    "                  [--convert <file>|--convert=<file>]... [--inline=JSON]\n"
    "                  [--serve-only] [--port=N]\n";
  std::exit(code);
}

// Two passes: --config first so the command line overrides the file.
Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) c.config_file = a.substr(9);
  }
  if (!c.config_file.empty()) {
    std::string err;
    if (!jt::load_config_file(c.config_file, c.app, &err)) {
      std::cerr << "[config] " << err << "\n";
      std::exit(2);
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_n = [&](const char* pfx, std::size_t* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string v = a.substr(std::string(pfx).size());
      if (!jt::parse_count(v, *out)) {
        std::cerr << "[cli] " << pfx << " expects a non-negative integer, got '" << v << "'\n";
        usage_and_exit(2);
      }
      return true;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string v = a.substr(std::string(pfx).size());
      if (!jt::parse_small_int(v, *out)) {
        std::cerr << "[cli] " << pfx << " expects an integer in [0, 65535], got '" << v << "'\n";
        usage_and_exit(2);
      }
      return true;
    };

    std::string s;
    std::size_t n = 0;
    if (a.rfind("--config=", 0) == 0) continue;
    if (eat("--base-dir=", &c.app.base_dir)) continue;
    if (a == "--header") { c.header = true; continue; }
    if (eat_n("--limit=", &n)) { c.limit = n; continue; }
    if (eat_n("--default-cap=", &c.app.convert.default_cap)) continue;
    if (eat_n("--max-objects=", &c.app.convert.max_objects)) continue;
    if (eat_n("--max-keys=", &c.app.convert.max_keys)) continue;
    if (eat_n("--max-key-length=", &c.app.convert.max_key_length)) continue;
    if (eat("--encoding=", &c.app.encoding)) continue;
    if (eat("--emit=", &s)) {
      if (s == "grid") c.emit = Emit::Grid;
      else if (s == "json") c.emit = Emit::Json;
      else if (s == "none") c.emit = Emit::None;
      else { std::cerr << "[cli] unknown --emit value: " << s << "\n"; usage_and_exit(2); }
      continue;
    }
    if (eat("--artifact-root=", &c.app.artifact_root)) continue;
    if (eat("--slug-mode=", &c.app.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.app.slug_len)) continue;
    if (eat_i("--port=", &c.app.port)) continue;
    if (a == "--serve-only") { c.serve_only = true; continue; }
    if (a == "--convert" && i+1 < argc) { c.converts.push_back(argv[++i]); continue; }
    if (eat("--convert=", &s)) { c.converts.push_back(s); continue; }
    if (eat("--inline=", &s)) { c.inline_json = s; continue; }
    if (a == "-h" || a == "--help") usage_and_exit(0);
    std::cerr << "[cli] unknown argument: " << a << "\n";
    usage_and_exit(2);
  }

  if (c.app.slug_mode != "hashprefix" && c.app.slug_mode != "basename" &&
      c.app.slug_mode != "keypath") {
    std::cerr << "[cli] unknown --slug-mode: " << c.app.slug_mode << "\n";
    usage_and_exit(2);
  }
  try {
    c.app.convert.validate();
  } catch (const std::invalid_argument& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    usage_and_exit(2);
  }
  return c;
}

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // For hashprefix mode, hash the full absolute path to be stable across cwd.
  std::string key = (mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return jt::make_slug(key, mode, len);
}

// One source -> printed table + artifacts. Returns 0 on success.
int convert_one(const Cli& cli,
                const std::optional<std::string>& file,
                const std::optional<std::string>& content) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  const std::string source = file ? *file : std::string("<inline>");
  jt::MetricsRegistry metrics;

  jt::DirectiveOptions opts;
  opts.file = file;
  opts.content = content;
  opts.header = cli.header;
  opts.encoding = cli.app.encoding;
  opts.limit = cli.limit;

  jt::DirectiveResult r = jt::run_directive(opts, cli.app.base_dir, cli.app.convert,
                                            jt::stderr_sink("jsontable"), &metrics);

  jt::TableDocument doc;
  doc.title = file ? std::filesystem::path(*file).filename().string() : "Inline JSON";
  doc.source = source;
  doc.include_header = r.include_header;
  doc.table = r.table;
  doc.notes = r.diagnostics;
  doc.error = r.error;
  doc.conversion = r.stats;

  if (!r.ok) {
    std::cerr << "[convert] " << source << ": " << r.error << "\n";
  }

  metrics.start_stage("render");
  if (r.ok && cli.emit == Emit::Grid) {
    std::cout << jt::render_grid_table(r.table, r.include_header);
  }
  metrics.end_stage("render");

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const std::string table_json = jt::TableJsonWriter::to_json(doc, metrics.snapshot(wall_ms));
  if (cli.emit == Emit::Json) std::cout << table_json << "\n";

  // inline sources are keyed by their content
  const std::string slug = file
      ? make_slug_for((std::filesystem::path(cli.app.base_dir) / *file).string(),
                      cli.app.slug_mode, cli.app.slug_len)
      : "inline-" + jt::hex_hash_prefix(content.value_or(""), cli.app.slug_len);
  std::string err;
  if (!jt::write_table_dir(cli.app.artifact_root, slug, doc, table_json,
                           cli.app.template_dir, &err)) {
    std::cerr << "[convert] write_table_dir failed: " << err << "\n";
    return 2;
  }
  if (!err.empty()) std::cerr << "[convert] " << err;

  std::cerr << "[convert] " << (r.ok ? "ok: " : "failed: ") << source
            << " -> " << cli.app.artifact_root << "/" << slug << "/table.html\n";
  return r.ok ? 0 : 1;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);

  bool did_any = false;
  int rc = 0;

  if (!cli.serve_only) {
    for (const auto& f : cli.converts) {
      did_any = true;
      if (convert_one(cli, f, std::nullopt) != 0) rc = 1;
    }
    if (cli.inline_json) {
      did_any = true;
      if (convert_one(cli, std::nullopt, cli.inline_json) != 0) rc = 1;
    }
  }

  // Conversions requested: report and exit without serving.
  if (did_any) return rc;

  jt::HttpServer::Config cfg;
  cfg.port = cli.app.port;
  cfg.artifact_root = cli.app.artifact_root;
  cfg.index_title = "JSON Table Reports";

  jt::HttpServer server(cfg);
  int src = server.run();
  if (src != 0) {
    std::cerr << "Server failed to start on port " << cfg.port << "\n";
    return 1;
  }
  return 0;
}
