#pragma once
#include <cann/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>

namespace cann::schema::encoding::bch {

// Appends Bitcoin Cash wire primitives to a byte buffer.
class writer final {
 public:
  explicit writer(cann::schema::bytes_t& out);

  void write_u8(uint8_t value);
  void write_u32(uint32_t value);
  void write_u64(uint64_t value);
  void write_compact_size(uint64_t value);
  void write_bytes(const cann::schema::bytes_view_t& bytes);
  void write_var_bytes(const cann::schema::bytes_view_t& bytes);
  // Writes a display-order hash in serialized (reversed) order.
  void write_hash(const cann::schema::hash32_t& hash);

 private:
  cann::schema::bytes_t& out_;
};

// Reads Bitcoin Cash wire primitives. Every read throws
// cann::common::error (decode_failure) when the input is truncated.
class reader final {
 public:
  explicit reader(const cann::schema::bytes_view_t& bytes);

  uint8_t read_u8();
  uint32_t read_u32();
  uint64_t read_u64();
  uint64_t read_compact_size();
  cann::schema::bytes_view_t read_bytes(size_t size);
  cann::schema::bytes_t read_var_bytes();
  cann::schema::hash32_t read_hash();

  size_t remaining() const;
  bool exhausted() const;

 private:
  cann::schema::bytes_view_t bytes_;
  size_t offset_{};
};

}  // namespace cann::schema::encoding::bch
