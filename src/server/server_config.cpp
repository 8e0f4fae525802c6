#include "server/server_config.hpp"

#include <stdexcept>

void print_usage(std::ostream& os, const char* prog) {
  os << "Usage:\n"
        "  " << prog << " [--addr HOST:PORT] [--db PATH] [--max-retries N]\n"
        "      [--admin-email EMAIL [--admin-name NAME]] [--quiet]\n"
        "  Example:\n"
        "  " << prog << " --addr 127.0.0.1:50051 --db db/pm.db --admin-email ops@example.com\n";
}

std::optional<ServerConfig> parse_args(int argc, char** argv, std::ostream& err) {
  ServerConfig cfg;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        err << "missing value for " << a << "\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (a == "--quiet") {
      cfg.quiet = true;
      continue;
    }

    if (a != "--addr" && a != "--db" && a != "--max-retries" &&
        a != "--admin-email" && a != "--admin-name") {
      err << "unknown flag: " << a << "\n";
      return std::nullopt;
    }

    auto v = value();
    if (!v) return std::nullopt;

    if (a == "--addr") {
      cfg.addr = *v;
    } else if (a == "--db") {
      cfg.db_path = *v;
    } else if (a == "--admin-email") {
      cfg.admin_email = *v;
    } else if (a == "--admin-name") {
      cfg.admin_name = *v;
    } else {
      try {
        std::size_t used = 0;
        const int n = std::stoi(*v, &used);
        if (used != v->size() || n < 1) throw std::invalid_argument(*v);
        cfg.max_retries = n;
      } catch (const std::exception&) {
        err << "--max-retries expects a positive integer, got " << *v << "\n";
        return std::nullopt;
      }
    }
  }

  if (cfg.addr.empty() || cfg.db_path.empty()) {
    err << "--addr and --db must not be empty\n";
    return std::nullopt;
  }
  return cfg;
}
