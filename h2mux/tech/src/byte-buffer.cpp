#include "h2mux/byte-buffer.hpp"

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <new>
#include <span>
#include <string_view>
#include <utility>

namespace h2mux {

ByteBuffer::ByteBuffer(size_type capacity) : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

ByteBuffer::ByteBuffer(std::span<const std::byte> data) : ByteBuffer(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

ByteBuffer::ByteBuffer(const ByteBuffer& rhs) : ByteBuffer(rhs.span()) {}

ByteBuffer::ByteBuffer(ByteBuffer&& rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

ByteBuffer& ByteBuffer::operator=(const ByteBuffer& rhs) {
  if (this != &rhs) {
    assign(rhs.span());
  }
  return *this;
}

ByteBuffer& ByteBuffer::operator=(ByteBuffer&& rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

ByteBuffer::~ByteBuffer() { std::free(_buf); }

void ByteBuffer::unchecked_append(std::span<const std::byte> data) {
  if (!data.empty()) {
    std::memcpy(_buf + _size, data.data(), data.size());
    _size += data.size();
  }
}

void ByteBuffer::append(std::span<const std::byte> data) {
  ensureAvailableCapacity(data.size());
  unchecked_append(data);
}

void ByteBuffer::append(std::string_view data) { append(AsBytes(data)); }

void ByteBuffer::append(size_type count, std::byte value) {
  ensureAvailableCapacity(count);
  if (count != 0) {
    std::memset(_buf + _size, static_cast<int>(value), count);
    _size += count;
  }
}

void ByteBuffer::push_back(std::byte byte) {
  ensureAvailableCapacity(1U);
  _buf[_size++] = byte;
}

void ByteBuffer::assign(std::span<const std::byte> data) {
  _size = 0;
  ensureAvailableCapacity(data.size());
  unchecked_append(data);
}

void ByteBuffer::erase_front(size_type n) {
  assert(n <= _size);
  if (n != 0) {
    std::memmove(_buf, _buf + n, _size - n);
    _size -= n;
  }
}

void ByteBuffer::setSize(size_type newSize) {
  assert(newSize <= _capacity);
  _size = newSize;
}

void ByteBuffer::addSize(size_type delta) {
  assert(_size + delta <= _capacity);
  _size += delta;
}

void ByteBuffer::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void ByteBuffer::ensureAvailableCapacity(size_type availableCapacity) {
  static constexpr size_type kMaxCapacity = std::numeric_limits<size_type>::max() / 2;
  if (kMaxCapacity - _size < availableCapacity) [[unlikely]] {
    throw std::bad_alloc();
  }
  const size_type required = _size + availableCapacity;
  if (_capacity < required) {
    // NOLINTNEXTLINE(readability-use-std-min-max)
    size_type newCapacity = (_capacity * 2U) + 1U;
    if (newCapacity < required) {
      newCapacity = required;
    }
    reallocUp(newCapacity);
  }
}

void ByteBuffer::swap(ByteBuffer& rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

bool ByteBuffer::operator==(const ByteBuffer& rhs) const noexcept {
  if (size() != rhs.size()) {
    return false;
  }
  // memcmp with nullptr is undefined behavior even if size is zero
  return empty() || std::memcmp(data(), rhs.data(), size()) == 0;
}

void ByteBuffer::reallocUp(size_type newCapacity) {
  auto* newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace h2mux
