#pragma once

#include "core/TrackAnalyzer.hpp"
#include "httplib.h"
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  explicit HttpHandler(StatsParams defaults,
                       std::string upload_dir = "uploads")
      : defaults_(defaults), upload_dir_(std::move(upload_dir)) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

private:
  StatsParams defaults_;
  std::string upload_dir_;

  // Individual request handlers
  void handleStats(const httplib::Request &req, httplib::Response &res);
  void handleSeries(const httplib::Request &req, httplib::Response &res);
  void handleInspect(const httplib::Request &req, httplib::Response &res);
  void handleUpload(const httplib::Request &req, httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);
  void handleConfig(const httplib::Request &req, httplib::Response &res);

  // Shared request plumbing; each returns false after writing an error reply
  bool parseBody(const httplib::Request &req, httplib::Response &res,
                 nlohmann::json &out);
  bool loadDocument(const httplib::Request &req, const nlohmann::json &body,
                    httplib::Response &res, TrackDocument &doc);
  bool isSafeUploadPath(const std::string &path) const;
};
