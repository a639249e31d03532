#include "sessionsync/auth/callback_listener.hpp"

#include "sessionsync/observability/global.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#if !defined(_WIN32) && !defined(MSG_NOSIGNAL)
#define MSG_NOSIGNAL 0
#endif

namespace sessionsync::auth {

namespace {

constexpr int kListenBacklog = 1;
constexpr std::chrono::milliseconds kClientReadTimeout{5000};

#ifndef _WIN32
// Remaining milliseconds until deadline, clamped for poll().
int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0) {
    return 0;
  }
  return left.count() > 0x7fffffff ? 0x7fffffff : static_cast<int>(left.count());
}

std::string read_request_head(int client_fd) {
  std::string request;
  std::array<char, 1024> buf{};
  const auto deadline = std::chrono::steady_clock::now() + kClientReadTimeout;

  while (request.size() < MAX_CALLBACK_REQUEST_BYTES &&
         request.find("\r\n\r\n") == std::string::npos) {
    pollfd pfd{client_fd, POLLIN, 0};
    const int ready = poll(&pfd, 1, remaining_ms(deadline));
    if (ready <= 0) {
      break;
    }
    const std::size_t want = std::min(buf.size(), MAX_CALLBACK_REQUEST_BYTES - request.size());
    const ssize_t n = recv(client_fd, buf.data(), want, 0);
    if (n <= 0) {
      break;
    }
    request.append(buf.data(), static_cast<std::size_t>(n));
  }
  return request;
}

void send_all(int fd, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return;
    }
    sent += static_cast<std::size_t>(n);
  }
}
#endif

} // namespace

const std::string &callback_response_page() {
  static const std::string page =
      "<!DOCTYPE html>\n"
      "<html><head><meta charset=\"utf-8\"><title>Authorization Complete</title></head>\n"
      "<body style=\"font-family: sans-serif; text-align: center; padding-top: 4em;\">\n"
      "<h1>Authorization Complete</h1>\n"
      "<p>You can close this window and return to your terminal.</p>\n"
      "</body></html>\n";
  return page;
}

CallbackListener::~CallbackListener() { close(); }

void CallbackListener::close() {
#ifndef _WIN32
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
  }
#endif
  listen_fd_ = -1;
}

common::Status CallbackListener::bind(const std::string &host, std::uint16_t port) {
#ifdef _WIN32
  (void)host;
  (void)port;
  return common::Status::error("callback listener is not supported on this platform");
#else
  close();

  const int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  const std::string bind_host = host == "localhost" ? "127.0.0.1" : host;
  if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    ::close(fd);
    return common::Status::error("invalid bind host: " + host);
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    ::close(fd);
    return common::Status::error("bind failed on port " + std::to_string(port) + ": " + msg);
  }

  if (listen(fd, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    ::close(fd);
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    port_ = ntohs(actual.sin_port);
  } else {
    port_ = port;
  }
  listen_fd_ = fd;
  return common::Status::success();
#endif
}

common::Status CallbackListener::bind_first_free(const std::string &host, std::uint16_t first,
                                                 std::uint16_t last) {
  if (first == 0 || first > last) {
    return common::Status::error("invalid callback port range");
  }
  std::string last_error;
  for (std::uint32_t port = first; port <= last; ++port) {
    auto status = bind(host, static_cast<std::uint16_t>(port));
    if (status.ok()) {
      observability::log_debug("oauth", "callback listener bound on port " +
                                            std::to_string(port_));
      return status;
    }
    last_error = status.error();
  }
  return common::Status::error("no free callback port in " + std::to_string(first) + "-" +
                               std::to_string(last) + " (" + last_error + ")");
}

common::Result<std::optional<std::string>>
CallbackListener::accept_one(std::chrono::milliseconds timeout) {
  using ResultT = common::Result<std::optional<std::string>>;
#ifdef _WIN32
  (void)timeout;
  return ResultT::failure("callback listener is not supported on this platform");
#else
  if (listen_fd_ < 0) {
    return ResultT::failure("callback listener is not bound");
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  int client_fd = -1;
  while (client_fd < 0) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    const int ready = poll(&pfd, 1, remaining_ms(deadline));
    if (ready == 0) {
      close();
      return ResultT::success(std::nullopt);
    }
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string msg = std::strerror(errno);
      close();
      return ResultT::failure("poll failed: " + msg);
    }
    client_fd = accept(listen_fd_, nullptr, nullptr);
    if (client_fd < 0 && errno != EINTR && errno != EAGAIN) {
      const std::string msg = std::strerror(errno);
      close();
      return ResultT::failure("accept failed: " + msg);
    }
  }
  close();

  std::string request = read_request_head(client_fd);

  const std::string &page = callback_response_page();
  const std::string response = "HTTP/1.1 200 OK\r\n"
                               "Content-Type: text/html; charset=utf-8\r\n"
                               "Content-Length: " +
                               std::to_string(page.size()) +
                               "\r\n"
                               "Connection: close\r\n\r\n" +
                               page;
  send_all(client_fd, response);
  ::close(client_fd);

  if (request.empty()) {
    return ResultT::failure("callback connection closed without a request");
  }
  return ResultT::success(std::move(request));
#endif
}

} // namespace sessionsync::auth
