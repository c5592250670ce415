#pragma once
#include <string>

namespace jt {

// Tiny wrapper around cpp-httplib; serves `/` index + `/reports/<slug>/table.html`
class HttpServer {
public:
  struct Config {
    std::string artifact_root = "artifacts/json-table";
    std::string index_title   = "JSON Table Reports";
    std::string host          = "0.0.0.0";
    int port = 8080;
  };

  explicit HttpServer(Config cfg);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind only; returns false on bind error.
  bool start();

  // Blocking run; binds if needed and returns when the server stops.
  int run();

  // Stop if running.
  void stop();

private:
  struct Impl;
  Impl* p_;
};

}
