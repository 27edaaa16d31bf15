#include "h2mux/tcp-connector.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include "h2mux/base-fd.hpp"
#include "h2mux/errno-throw.hpp"
#include "h2mux/log.hpp"

namespace h2mux {

BaseFd ConnectTCP(std::string_view host, std::string_view port, int family) {
  // getaddrinfo expects null-terminated strings.
  const std::string hostStr(host);
  const std::string portStr(port);

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", host, port, ::gai_strerror(gai));
    throw std::system_error(std::make_error_code(std::errc::host_unreachable),
                            std::string("getaddrinfo failed: ") + ::gai_strerror(gai));
  }

  int lastErr = ECONNREFUSED;
  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
    BaseFd fd(::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol));
    if (!fd) [[unlikely]] {
      lastErr = errno;
      log::error("ConnectTCP: socket() failed for family={}: {}", rp->ai_family, std::strerror(lastErr));
      if (lastErr == EMFILE || lastErr == ENFILE) {
        break;  // no point in continuing
      }
      continue;
    }

    int rc;
    do {
      rc = ::connect(fd.fd(), rp->ai_addr, rp->ai_addrlen);
    } while (rc == -1 && errno == EINTR);

    if (rc == 0) {
      static constexpr int kEnable = 1;
      if (::setsockopt(fd.fd(), IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == -1) {
        log::warn("ConnectTCP: unable to set TCP_NODELAY: {}", std::strerror(errno));
      }
      log::debug("ConnectTCP: connected to {}:{} on fd # {}", host, port, fd.fd());
      return fd;
    }

    lastErr = errno;
    log::debug("ConnectTCP: connect() failed for family={}: {}", rp->ai_family, std::strerror(lastErr));
  }

  ThrowSystemError(lastErr, "unable to connect to {}:{}", host, port);
}

}  // namespace h2mux
