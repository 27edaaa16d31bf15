#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace h2mux {

// Growable contiguous byte buffer used for frame encoding and frame payload storage.
// Unlike std::vector, growing the size with addSize() / setSize() does not value-initialize the new bytes, which
// lets encoders reserve a frame header slot and backpatch it once the payload length is known.
class ByteBuffer {
 public:
  using value_type = std::byte;
  using size_type = std::size_t;
  using pointer = std::byte*;
  using const_pointer = const std::byte*;
  using iterator = std::byte*;
  using const_iterator = const std::byte*;

  ByteBuffer() noexcept = default;

  explicit ByteBuffer(size_type capacity);

  explicit ByteBuffer(std::span<const std::byte> data);

  ByteBuffer(const ByteBuffer& rhs);
  ByteBuffer(ByteBuffer&& rhs) noexcept;

  ByteBuffer& operator=(const ByteBuffer& rhs);
  ByteBuffer& operator=(ByteBuffer&& rhs) noexcept;

  ~ByteBuffer();

  void unchecked_append(std::span<const std::byte> data);

  void unchecked_push_back(std::byte byte) { _buf[_size++] = byte; }

  void append(std::span<const std::byte> data);

  void append(std::string_view data);

  // Append 'count' copies of 'value'.
  void append(size_type count, std::byte value);

  void push_back(std::byte byte);

  void assign(std::span<const std::byte> data);

  void clear() noexcept { _size = 0; }

  void erase_front(size_type n);

  void setSize(size_type newSize);

  void addSize(size_type delta);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  // Makes room for at least 'availableCapacity' bytes after the current end, growing exponentially.
  void ensureAvailableCapacity(size_type availableCapacity);

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  void swap(ByteBuffer& rhs) noexcept;

  std::byte& operator[](size_type pos) { return _buf[pos]; }
  std::byte operator[](size_type pos) const { return _buf[pos]; }

  operator std::span<const std::byte>() const noexcept { return {_buf, _size}; }

  [[nodiscard]] std::span<const std::byte> span() const noexcept { return {_buf, _size}; }

  bool operator==(const ByteBuffer& rhs) const noexcept;

  using trivially_relocatable = std::true_type;

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(ByteBuffer& lhs, ByteBuffer& rhs) noexcept { lhs.swap(rhs); }

// View the characters of a string as bytes.
inline std::span<const std::byte> AsBytes(std::string_view str) noexcept {
  return {reinterpret_cast<const std::byte*>(str.data()), str.size()};
}

// View bytes as characters.
inline std::string_view AsStringView(std::span<const std::byte> bytes) noexcept {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace h2mux
