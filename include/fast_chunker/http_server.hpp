#pragma once
#include <cstddef>
#include <string>

namespace fc {

// Wrapper around cpp-httplib.
//   GET  /                         index of generated reports
//   GET  /reports/<slug>/<file>    files under <artifact_root>/<slug>
//   POST /chunk?size=&delimiters=&pattern=&prefix=&consecutive=
//        chunks the request body, answers
//        {"chunks":N,"hard_splits":H,"offsets":[s0,e0,s1,e1,...]}
class HttpServer {
public:
  struct Config {
    std::string artifact_root = "artifacts/fast-chunker";
    std::string index_title   = "fast-chunker reports";
    std::string host = "0.0.0.0";
    int port = 8080;
    std::size_t max_body_bytes = 64 * 1024 * 1024;
  };

  explicit HttpServer(Config cfg);
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds once; returns false on bind error.
  bool start();

  // Binds if needed, then blocks until stop() is called.
  int run();

  void stop();

private:
  struct Impl;
  Impl* p_;
};

}
