#include "json_table/artifact_writer.hpp"
#include "json_table/http_server.hpp"
#include "json_table/table_document.hpp"

#include <filesystem>
#include <iostream>
#include <fstream>
#include <string>
#include <thread>
#include <chrono>
#include <ctime>
#include "httplib.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

int main() {
  const int port = 18089;
  const fs::path art = fs::temp_directory_path() /
      ("json-table-http-" + std::to_string(std::time(nullptr)));
  fs::create_directories(art);

  // one report + a file outside the artifact root
  jt::TableDocument doc;
  doc.title = "people";
  doc.source = "people.json";
  doc.include_header = true;
  doc.table = {{"name", "age"}, {"Ada", "36"}};
  std::string err;
  if (!jt::write_table_dir(art.string(), "people", doc, "{\"ok\":true}", {}, &err)) {
    std::cerr << "[FAIL] could not write artifacts: " << err << "\n";
    return 1;
  }
  { std::ofstream(art.parent_path() / "json-table-http-secret.txt") << "secret"; }

  jt::HttpServer::Config cfg;
  cfg.port = port;
  cfg.host = "127.0.0.1";
  cfg.artifact_root = art.string();
  jt::HttpServer server(cfg);
  if (!server.start()) { std::cerr << "[FAIL] could not bind port " << port << "\n"; return 1; }
  std::thread th([&]{ (void)server.run(); });

  httplib::Client cli("127.0.0.1", port);
  bool up = false;
  for (int i=0;i<50;i++) {
    if (auto res = cli.Get("/")) {
      if (res->status == 200 && !res->body.empty()) { up = true; break; }
    }
    std::this_thread::sleep_for(100ms);
  }

  bool ok = up;
  if (!up) std::cerr << "[FAIL] server did not respond with 200 on /\n";

  if (up) {
    auto idx = cli.Get("/");
    if (!idx || idx->body.find("/reports/people/table.html") == std::string::npos ||
        idx->body.find("JSON Table Reports") == std::string::npos) {
      std::cerr << "[FAIL] index does not list the report\n"; ok = false;
    }
    auto page = cli.Get("/reports/people/table.html");
    if (!page || page->status != 200 || page->body.find("Ada") == std::string::npos ||
        page->get_header_value("Content-Type").find("text/html") == std::string::npos) {
      std::cerr << "[FAIL] table.html not served\n"; ok = false;
    }
    auto tj = cli.Get("/reports/people/table.json");
    if (!tj || tj->status != 200 || tj->body != "{\"ok\":true}") {
      std::cerr << "[FAIL] table.json not served\n"; ok = false;
    }
    auto missing = cli.Get("/reports/people/nope.html");
    if (!missing || missing->status != 404) {
      std::cerr << "[FAIL] missing file should be 404\n"; ok = false;
    }
    auto escape = cli.Get("/reports/people/../../json-table-http-secret.txt");
    if (escape && escape->status == 200) {
      std::cerr << "[FAIL] traversal out of the slug directory was served\n"; ok = false;
    }
  }

  server.stop();
  th.join();

  std::error_code ec;
  fs::remove_all(art, ec);
  fs::remove(art.parent_path() / "json-table-http-secret.txt", ec);

  if (!ok) return 1;
  std::cout << "[PASS] http server serves index and reports\n";
  return 0;
}
