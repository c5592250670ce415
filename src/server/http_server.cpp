#include "json_table/http_server.hpp"
#include "json_table/path_utils.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace jt {

static std::string guess_mime(const std::string& name) {
  auto ends = [&](const char* s){
    const size_t n = std::strlen(s), m = name.size();
    return m >= n && std::equal(s, s+n, name.c_str() + (m - n),
                                [](char a, char b){
                                  return std::tolower(static_cast<unsigned char>(a)) ==
                                         std::tolower(static_cast<unsigned char>(b));
                                });
  };
  if (ends(".html")) return "text/html; charset=utf-8";
  if (ends(".css"))  return "text/css; charset=utf-8";
  if (ends(".js"))   return "application/javascript; charset=utf-8";
  if (ends(".json")) return "application/json; charset=utf-8";
  if (ends(".txt"))  return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

static std::string html_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out += c;
    }
  }
  return out;
}

struct HttpServer::Impl {
  Config cfg;
  httplib::Server svr;
  bool bound = false;

  explicit Impl(Config c) : cfg(std::move(c)) {}

  std::vector<std::string> slugs() const {
    std::vector<std::string> out;
    std::error_code ec;
    std::filesystem::path root(cfg.artifact_root);
    if (!std::filesystem::exists(root, ec)) return out;
    for (auto& d : std::filesystem::directory_iterator(root, ec)) {
      if (d.is_directory()) out.push_back(d.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  std::string index_html() const {
    auto items = slugs();
    const std::string title = html_escape(cfg.index_title);
    std::string html = "<!doctype html><html><head><meta charset='utf-8'><title>";
    html += title + "</title></head><body><h1>" + title + "</h1><ul>";
    for (auto& s : items) {
      const std::string e = html_escape(s);
      html += "<li><a href=\"/reports/" + e + "/table.html\">" + e + "</a></li>";
    }
    html += "</ul></body></html>";
    return html;
  }

  // Serve a file under artifact_root/<slug>/<rel>, preventing traversal.
  void serve_under_slug(const std::string& slug,
                        const std::string& rel,
                        httplib::Response& res) const {
    if (slug.find("..") != std::string::npos || rel.find("..") != std::string::npos) {
      res.status = 400;
      return;
    }

    const std::filesystem::path base = std::filesystem::path(cfg.artifact_root) / slug;
    const std::filesystem::path target = base / rel;
    if (!is_within(base, target)) { res.status = 403; return; }

    std::ifstream in(target, std::ios::binary);
    if (!in) { res.status = 404; return; }

    std::ostringstream ss; ss << in.rdbuf();
    res.set_content(ss.str(), guess_mime(target.filename().string()).c_str());
  }

  void routes() {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
      res.set_content(index_html(), "text/html; charset=utf-8");
    });

    // table.html, table.json, table.css
    svr.Get(R"(/reports/([^/]+)/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
      serve_under_slug(req.matches[1].str(), req.matches[2].str(), res);
    });
  }
};

HttpServer::HttpServer(Config cfg) : p_(new Impl(std::move(cfg))) { p_->routes(); }
HttpServer::~HttpServer() { delete p_; }

bool HttpServer::start() {
  if (p_->bound) return true;
  p_->bound = p_->svr.bind_to_port(p_->cfg.host.c_str(), p_->cfg.port);
  if (!p_->bound) {
    std::cerr << "[serve] bind failed on " << p_->cfg.host << ":" << p_->cfg.port << "\n";
  }
  return p_->bound;
}

int HttpServer::run() {
  if (!start()) return -1;
  std::cerr << "[serve] listening on http://" << p_->cfg.host << ":" << p_->cfg.port << "/\n";
  return p_->svr.listen_after_bind() ? 0 : -1;
}

void HttpServer::stop() { p_->svr.stop(); }

}
