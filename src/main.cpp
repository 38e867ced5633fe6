// Entry point for the track statistics HTTP server.  It wires up the
// httplib server, loads configuration and exposes the REST endpoints handled by
// `HttpHandler`.
//
//   trackstats_server                      serve using config/settings.json
//   trackstats_server --analyze FILE.json  print the report for one document
//                     [--imperial] [--points]

#include "core/TrackAnalyzer.hpp"
#include "core/TrackReport.hpp"
#include "http/http_handler.hpp"
#include "models/TrackDocument.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

#include <algorithm>
#include <execinfo.h>
#include <filesystem>
#include <iterator>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <string>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;
inline json list_uploads_json(const std::string &dir);

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

// One-shot analysis of a document on disk; report goes to stdout.
static int run_analyze(const std::string &path, const StatsParams &params,
                       UnitSystem units, bool points) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "[ERROR] Cannot open " << path << "\n";
    return 1;
  }
  TrackDocument doc;
  try {
    json body;
    in >> body;
    doc = body.get<TrackDocument>();
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << path << ": " << e.what() << "\n";
    return 1;
  }
  TrackAnalysis analysis = TrackAnalyzer(params).analyze(doc);
  std::cout << TrackReport::build(analysis, units, points).dump(2) << "\n";
  return 0;
}

int main(int argc, char **argv) {
  install_bt_handlers();

  std::vector<std::string> args(argv + 1, argv + argc);
  auto has_flag = [&args](const char *f) {
    return std::find(args.begin(), args.end(), f) != args.end();
  };

  auto it = std::find(args.begin(), args.end(), "--analyze");
  const bool analyze_mode = it != args.end();

  // ---------------------- Load configuration ------------------------------
  // --analyze only needs the stats defaults, so it runs without a config file
  json settings = json::object();
  StatsParams defaults;
  std::ifstream cfg("config/settings.json");
  if (!cfg) {
    if (!analyze_mode) {
      std::cerr << "[ERROR] Cannot open config/settings.json\n";
      return 1;
    }
    std::cerr << "[INFO] no config/settings.json, using built-in defaults\n";
  }
  try {
    if (cfg)
      cfg >> settings;
    defaults = StatsParams::from_json(settings.value("stats", json::object()));
  } catch (const json::exception &e) {
    std::cerr << "[ERROR] config/settings.json: " << e.what() << "\n";
    return 1;
  }

  if (analyze_mode) {
    if (std::next(it) == args.end()) {
      std::cerr << "[ERROR] --analyze needs a file\n";
      return 1;
    }
    return run_analyze(*std::next(it), defaults,
                       has_flag("--imperial") ? UnitSystem::Imperial
                                              : UnitSystem::Metric,
                       has_flag("--points"));
  }

  const json server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 5005);
  const std::string upload_dir = server_cfg.value("upload_dir", "uploads");
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;
  std::cout << "[DEBUG] max_point_interval_ms="
            << defaults.max_point_interval_ms
            << " elevation_threshold_m=" << defaults.elevation_threshold_m
            << std::endl;

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 64ull); // 64MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  HttpHandler handler(defaults, upload_dir);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep : server_cfg.value("post_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST λ] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep : server_cfg.value("get_endpoints", json::array())) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[GET λ] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // Non-configurable helper endpoint listing uploaded documents
  server.Get("/uploads",
             [upload_dir](const httplib::Request &, httplib::Response &res) {
               nlohmann::json out = {{"files", list_uploads_json(upload_dir)}};
               res.set_content(out.dump(), "application/json");
             });

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[main] listen on port " << port << " failed\n";
    return 1;
  }
  return 0;
}

namespace fs = std::filesystem;

inline json list_uploads_json(const std::string &dir) {
  nlohmann::json arr = nlohmann::json::array();
  std::error_code ec;
  if (!fs::exists(dir, ec))
    return arr;

  // newest first
  std::vector<fs::directory_entry> entries;
  for (auto &de : fs::directory_iterator(dir, ec)) {
    if (de.is_regular_file())
      entries.push_back(de);
  }
  std::sort(entries.begin(), entries.end(), [](auto &a, auto &b) {
    return fs::last_write_time(a) > fs::last_write_time(b);
  });

  for (auto &de : entries) {
    const auto p = de.path();
    const auto bytes = (uint64_t)fs::file_size(p);
    const auto rel = (fs::path(dir) / p.filename())
                         .generic_string(); // e.g. "uploads/track_....json"
    nlohmann::json j{{"file", rel}, // <- value to POST back as ?map=
                     {"name", p.filename().string()},
                     {"bytes", bytes}};
    arr.push_back(j);
  }
  return arr;
}
