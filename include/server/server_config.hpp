#pragma once
#include <optional>
#include <ostream>
#include <string>

struct ServerConfig {
  std::string addr        = "0.0.0.0:50051"; // 0.0.0.0 listens on all local interfaces
  std::string db_path     = "db/prediction_market.db";
  int         max_retries = 3;
  std::string admin_email;
  std::string admin_name  = "Administrator";
  bool        quiet       = false;
};

void print_usage(std::ostream& os, const char* prog);

// std::nullopt on an unknown flag, a missing value or a bad number;
// the reason is written to err.
std::optional<ServerConfig> parse_args(int argc, char** argv, std::ostream& err);
