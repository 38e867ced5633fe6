#include "http_handler.hpp"
#include "core/DataSeries.hpp"
#include "core/TrackReport.hpp"
#include "core/Units.hpp"
#include "debug/json_debug.hpp"
#include "debug/track_inspect.hpp"
#include "models/TrackDocument.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>

using json = nlohmann::json;

// Parse-error snippets echo raw request bytes, which need not be valid UTF-8
static std::string dump_lenient(const json &j, int indent = -1) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

static void send_json(httplib::Response &res, const json &j, int status = 200) {
  res.status = status;
  res.set_content(dump_lenient(j), "application/json");
}

static void send_error(httplib::Response &res, int status,
                       const std::string &what) {
  send_json(res, {{"ok", false}, {"error", what}}, status);
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "stats") {
    handleStats(req, res);
  } else if (action == "series") {
    handleSeries(req, res);
  } else if (action == "inspect") {
    handleInspect(req, res);
  } else if (action == "upload") {
    handleUpload(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "health") {
    handleHealth(req, res);
  } else if (action == "config") {
    handleConfig(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== request plumbing =====

bool HttpHandler::parseBody(const httplib::Request &req,
                            httplib::Response &res, json &out) {
  if (req.body.empty()) {
    out = json::object();
    return true;
  }
  try {
    out = json::parse(req.body);
  } catch (const json::parse_error &e) {
    send_json(res, describe_parse_error(req.body, e), 400);
    return false;
  }
  if (!out.is_object()) {
    send_error(res, 400, "request body must be a JSON object");
    return false;
  }
  return true;
}

// Document comes inline as body["document"], or from an earlier upload via
// ?map=uploads/<file>.json
bool HttpHandler::loadDocument(const httplib::Request &req, const json &body,
                               httplib::Response &res, TrackDocument &doc) {
  json src;
  if (body.contains("document")) {
    src = body["document"];
  } else if (req.has_param("map")) {
    const std::string path = req.get_param_value("map");
    if (!isSafeUploadPath(path)) {
      send_error(res, 400, "bad map path");
      return false;
    }
    std::ifstream in(path);
    if (!in) {
      send_error(res, 404, "file not found");
      return false;
    }
    try {
      in >> src;
    } catch (const json::exception &e) {
      send_error(res, 400, std::string("cannot read stored document: ") +
                               e.what());
      return false;
    }
  } else {
    send_error(res, 400, "missing 'document'");
    return false;
  }

  try {
    doc = src.get<TrackDocument>();
  } catch (const json::exception &e) {
    send_error(res, 400, std::string("bad document: ") + e.what());
    return false;
  } catch (const std::runtime_error &e) {
    send_error(res, 400, std::string("bad document: ") + e.what());
    return false;
  }
  return true;
}

bool HttpHandler::isSafeUploadPath(const std::string &s) const {
  if (s.find("..") != std::string::npos)
    return false;
  for (char c : s) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' ||
          c == '-' || c == '/'))
      return false;
  }
  return s.rfind(upload_dir_ + "/", 0) == 0;
}

// ===== POST: /stats =====

void HttpHandler::handleStats(const httplib::Request &req,
                              httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;

  const auto units = Units::parse_unit_system(body.value("units", "metric"));
  if (!units) {
    send_error(res, 400, "units must be 'metric' or 'imperial'");
    return;
  }

  TrackDocument doc;
  if (!loadDocument(req, body, res, doc))
    return;

  StatsParams params;
  try {
    params = StatsParams::from_json(body.value("options", json::object()),
                                    defaults_);
  } catch (const json::exception &e) {
    send_error(res, 400, std::string("bad options: ") + e.what());
    return;
  }

  const auto t0 = std::chrono::steady_clock::now();
  TrackAnalyzer analyzer(params);
  TrackAnalysis analysis = analyzer.analyze(doc);
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                      std::chrono::steady_clock::now() - t0)
                      .count();
  std::cout << "[DEBUG] /stats analyzed " << analysis.stats.point_count
            << " points in " << us << " us\n";

  json out = TrackReport::build(analysis, *units,
                                body.value("include_points", false));
  out["ok"] = true;
  out["options"] = params.to_json();
  send_json(res, out);
}

// ===== POST: /series =====

void HttpHandler::handleSeries(const httplib::Request &req,
                               httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;

  const auto metric = DataSeries::parse_metric(body.value("metric", ""));
  const auto axis = DataSeries::parse_axis(body.value("axis", "distance"));
  const auto units = Units::parse_unit_system(body.value("units", "metric"));
  if (!metric) {
    send_error(res, 400,
               "metric must be elevation, heartrate, cadence or temperature");
    return;
  }
  if (!axis) {
    send_error(res, 400, "axis must be 'distance' or 'time'");
    return;
  }
  if (!units) {
    send_error(res, 400, "units must be 'metric' or 'imperial'");
    return;
  }

  TrackDocument doc;
  if (!loadDocument(req, body, res, doc))
    return;

  StatsParams params;
  try {
    params = StatsParams::from_json(body.value("options", json::object()),
                                    defaults_);
  } catch (const json::exception &e) {
    send_error(res, 400, std::string("bad options: ") + e.what());
    return;
  }

  TrackAnalysis analysis = TrackAnalyzer(params).analyze(doc);
  json out = TrackReport::series(analysis, *metric, *axis, *units);
  out["ok"] = true;
  send_json(res, out);
}

// ===== POST: /inspect =====

void HttpHandler::handleInspect(const httplib::Request &req,
                                httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;
  TrackDocument doc;
  if (!loadDocument(req, body, res, doc))
    return;
  json out = summarize(doc, body.value("samples", std::size_t{3}));
  out["ok"] = true;
  res.set_content(dump_lenient(out, 2), "application/json");
}

// ===== POST: /upload =====

void HttpHandler::handleUpload(const httplib::Request &req,
                               httplib::Response &res) {
  json body;
  if (!parseBody(req, res, body))
    return;

  // validate before storing so /stats?map= never sees a broken file
  try {
    (void)body.get<TrackDocument>();
  } catch (const std::exception &e) {
    send_error(res, 400, std::string("bad document: ") + e.what());
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(upload_dir_, ec);
  if (ec) {
    std::cerr << "[ERROR] cannot create " << upload_dir_ << ": "
              << ec.message() << "\n";
    send_error(res, 500, "cannot create upload directory");
    return;
  }

  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
  std::mt19937_64 rng{static_cast<unsigned long long>(ms)};
  unsigned long long r = rng();

  std::string filename = upload_dir_ + "/track_" + std::to_string(ms) + "_" +
                         std::to_string(r) + ".json";

  std::ofstream out(filename);
  out << body.dump(2);
  out.close();
  if (!out) {
    send_error(res, 500, "failed to save " + filename);
    return;
  }

  std::cout << "[INFO] stored upload " << filename << "\n";
  send_json(res, {{"ok", true}, {"file", filename}});
}

// ===== GET =====

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  send_json(res, {{"status", "ok"}});
}

void HttpHandler::handleConfig(const httplib::Request &,
                               httplib::Response &res) {
  send_json(res, {{"stats", defaults_.to_json()}, {"upload_dir", upload_dir_}});
}
