#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chatimport::common {

// Append-at-back, consume-from-front receive buffer.
class ByteBuffer {
 public:
  void append(const uint8_t* data, size_t size);
  void append(const std::vector<uint8_t>& data);
  void consume(size_t size);
  void clear();

  const uint8_t* data() const;
  size_t size() const;
  bool empty() const;

 private:
  void compact();

  std::vector<uint8_t> buffer_;
  size_t offset_ = 0;
};

}  // namespace chatimport::common
