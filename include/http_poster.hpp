#pragma once
#include "channel_log.hpp"
#include <string>

namespace chanscan {

// JsonPoster on top of the CivetWeb client, one connection per event.
class CivetJsonPoster : public JsonPoster {
public:
  CivetJsonPoster();
  ~CivetJsonPoster() override;

  CivetJsonPoster(const CivetJsonPoster &) = delete;
  CivetJsonPoster &operator=(const CivetJsonPoster &) = delete;

  bool post(const HttpEndpoint &to, const std::string &body) override;
};

} // namespace chanscan
