#include "http_poster.hpp"
#include "civetweb.h"
#include "logging.hpp"

namespace chanscan {

CivetJsonPoster::CivetJsonPoster() { mg_init_library(0); }

CivetJsonPoster::~CivetJsonPoster() { mg_exit_library(); }

bool CivetJsonPoster::post(const HttpEndpoint &to, const std::string &body) {
  char err[256] = "";
  struct mg_connection *conn = mg_download(
      to.host.c_str(), to.port, to.tls ? 1 : 0, err, sizeof(err),
      "POST %s HTTP/1.1\r\n"
      "Host: %s\r\n"
      "Content-Type: application/json\r\n"
      "Content-Length: %zu\r\n"
      "Connection: close\r\n\r\n"
      "%s",
      to.path.c_str(), to.host.c_str(), body.size(), body.c_str());
  if (!conn) {
    log::error("Channel log server " + to.host + ":" +
               std::to_string(to.port) + " unreachable: " + err);
    return false;
  }
  const struct mg_response_info *info = mg_get_response_info(conn);
  int status = info ? info->status_code : 0;
  mg_close_connection(conn);
  if (status < 200 || status > 299) {
    log::error("Channel log server answered HTTP " + std::to_string(status));
    return false;
  }
  return true;
}

} // namespace chanscan
