#include "cli/registry.hpp"
#include "gitwire/capabilities.hpp"
#include "gitwire/config.hpp"
#include "gitwire/connection.hpp"
#include "gitwire/consts.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/pkt_line.hpp"
#include "gitwire/upload_pack.hpp"

#include <arpa/inet.h>
#include <array>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <netinet/in.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct DaemonRequest {
  std::string service;
  std::string path;
  std::string extra; // everything after the first NUL: host=..., version=...
};

// "git-upload-pack /project.git\0host=example.com\0\0version=2\0"
std::optional<DaemonRequest> parse_request(std::string_view payload) {
  const auto nul = payload.find('\0');
  auto head = payload.substr(0, nul);
  if (!head.empty() && head.back() == '\n')
    head.remove_suffix(1);
  const auto sp = head.find(' ');
  if (sp == std::string_view::npos || sp + 1 == head.size())
    return std::nullopt;
  DaemonRequest req{std::string(head.substr(0, sp)), std::string(head.substr(sp + 1)), {}};
  if (nul != std::string_view::npos)
    req.extra = std::string(payload.substr(nul + 1));
  return req;
}

// Repository for a request path, confined to `base`.
std::optional<fs::path> locate_repo(const fs::path &base, const std::string &path) {
  const fs::path rel = fs::path(path).relative_path();
  for (const auto &part : rel) {
    if (part == "..")
      return std::nullopt;
  }
  if (auto dir = gitwire::resolve_git_dir(base / rel))
    return dir;
  return gitwire::resolve_git_dir(base / (rel.string() + ".git"));
}

void send_error(gitwire::Connection &conn, const std::string &msg) {
  conn.write_all(gitwire::pktline::encode("ERR " + msg + "\n"));
}

// The request packet, read byte-exact so nothing of the session is buffered here.
std::string read_request_packet(gitwire::Connection &conn) {
  const auto read_exact = [&](std::uint8_t *dst, std::size_t n) {
    std::size_t got = 0;
    while (got < n) {
      const auto r = conn.read_some(std::span(dst + got, n - got));
      if (r == 0)
        throw std::runtime_error("client closed before its request");
      got += r;
    }
  };

  std::array<std::uint8_t, gitwire::consts::kPktHeaderLen> hdr{};
  read_exact(hdr.data(), hdr.size());
  auto dec = gitwire::pktline::decode(hdr);
  if (!dec)
    throw dec.status().to_error();
  if (!dec.value().incomplete())
    throw std::runtime_error("expected a request line");

  const std::string len_hex(hdr.begin(), hdr.end());
  const std::size_t len = std::stoul(len_hex, nullptr, 16);
  std::string payload(len - hdr.size(), '\0');
  read_exact(reinterpret_cast<std::uint8_t *>(payload.data()), payload.size());
  return payload;
}

void handle_client(int cfd, const fs::path &base) {
  gitwire::FdConnection conn{cfd, cfd};
  const auto req = parse_request(read_request_packet(conn));
  if (!req)
    throw std::runtime_error("malformed request line");
  if (req->service != gitwire::consts::kServiceUpload) {
    send_error(conn, "service not enabled: " + req->service);
    return;
  }
  const auto git_dir = locate_repo(base, req->path);
  if (!git_dir) {
    send_error(conn, "no such repository: " + req->path);
    return;
  }

  gitwire::UploadPackOptions opts;
  opts.config = gitwire::load_server_config(*git_dir);
  opts.version = gitwire::capabilities::requested_version(req->extra);
  gitwire::LooseObjectStore store{*git_dir};
  gitwire::UploadPack session{store, std::move(opts)};

  const auto st = session.serve(conn);
  if (!st) {
    std::cerr << "daemon: " << req->path << ": " << st.message << "\n";
  } else if (const auto &stats = session.last_pack()) {
    std::cerr << "daemon: " << req->path << ": sent " << stats->total_objects << " objects ("
              << stats->delta_objects << " deltas, " << stats->compressed_size << " bytes)\n";
  }
}

} // namespace

auto cmd_daemon(int argc, char **argv) -> int {
  int port = gitwire::consts::portNumber;
  fs::path base = fs::current_path();
  constexpr std::string_view kBasePath = "--base-path=";
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg.starts_with(kBasePath)) {
      base = fs::path(arg.substr(kBasePath.size()));
      continue;
    }
    try {
      std::size_t used = 0;
      port = std::stoi(std::string(arg), &used);
      if (used != arg.size() || port <= 0 || port > 65535)
        throw std::out_of_range("port");
    } catch (const std::exception &) {
      std::cerr << "daemon: bad port " << arg << "\n";
      return gitwire::cli::usage_error("daemon");
    }
  }
  std::error_code ec;
  if (!fs::is_directory(base, ec)) {
    std::cerr << "daemon: not a directory: " << base.string() << "\n";
    return 1;
  }
  std::signal(SIGPIPE, SIG_IGN);

  gitwire::UniqueFd sfd{::socket(AF_INET6, SOCK_STREAM, 0)};
  if (!sfd) {
    perror("socket");
    return 1;
  }
  int yes = 1;
  setsockopt(sfd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
  struct sockaddr_in6 addr{};
  addr.sin6_family = AF_INET6;
  addr.sin6_addr = in6addr_any;
  addr.sin6_port = htons(static_cast<std::uint16_t>(port));
  if (bind(sfd.get(), reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0) {
    perror("bind");
    return 1;
  }
  if (listen(sfd.get(), 16) != 0) {
    perror("listen");
    return 1;
  }
  std::cout << "gitwire daemon serving " << base.string() << " on port " << port
            << " (Ctrl+C to stop)\n";
  while (true) {
    gitwire::UniqueFd cfd{accept(sfd.get(), nullptr, nullptr)};
    if (!cfd) {
      perror("accept");
      continue;
    }
    try {
      handle_client(cfd.get(), base);
    } catch (const std::exception &e) {
      std::cerr << "daemon: " << e.what() << "\n";
    }
  }
}
