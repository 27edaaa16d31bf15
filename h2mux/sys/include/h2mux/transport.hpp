#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

#include "h2mux/base-fd.hpp"

namespace h2mux {

enum class TransportStatus : uint8_t {
  Ok,     // operation completed (read may return fewer bytes than requested)
  Eof,    // orderly close by the peer, or local shutdown
  Error,  // fatal I/O error (ECONNRESET, EPIPE, ...)
};

// Reliable, ordered byte-stream abstraction used by the Framer.
// Calls are blocking. One reader and one writer may use the transport concurrently.
class ITransport {
 public:
  virtual ~ITransport() = default;

  struct TransportResult {
    std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
    TransportStatus status;
  };

  // Blocking read of at most buf.size() bytes. Returns Ok with bytesProcessed > 0 as soon as some data is
  // available, Eof on orderly close.
  virtual TransportResult read(std::span<std::byte> buf) = 0;

  // Blocking write of the whole buffer. Returns Ok only if every byte was written.
  virtual TransportResult write(std::span<const std::byte> data) = 0;

  // Unblocks a pending read (which then reports Eof) and makes further writes fail.
  virtual void shutdown() noexcept = 0;
};

// Plain transport directly operates on a blocking socket fd.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(BaseFd fd) noexcept : _fd(std::move(fd)) {}

  TransportResult read(std::span<std::byte> buf) override;

  TransportResult write(std::span<const std::byte> data) override;

  void shutdown() noexcept override;

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
};

}  // namespace h2mux
