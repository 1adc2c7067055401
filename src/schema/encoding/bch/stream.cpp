#include <cann/common/error.hpp>
#include <cann/schema/encoding/bch/stream.hpp>

#include <boost/endian/buffers.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace cann::schema::encoding::bch {

writer::writer(cann::schema::bytes_t& out) : out_{out} {}

void writer::write_u8(const uint8_t value) {
  out_.push_back(value);
}

void writer::write_u32(const uint32_t value) {
  auto buffer = boost::endian::little_uint32_buf_t{value};
  out_.insert(std::end(out_), buffer.data(), buffer.data() + sizeof(buffer));
}

void writer::write_u64(const uint64_t value) {
  auto buffer = boost::endian::little_uint64_buf_t{value};
  out_.insert(std::end(out_), buffer.data(), buffer.data() + sizeof(buffer));
}

void writer::write_compact_size(const uint64_t value) {
  if (value < 0xfd) {
    write_u8(static_cast<uint8_t>(value));
  } else if (value <= 0xffff) {
    write_u8(0xfd);
    auto buffer = boost::endian::little_uint16_buf_t{
        static_cast<uint16_t>(value)};
    out_.insert(std::end(out_), buffer.data(), buffer.data() + sizeof(buffer));
  } else if (value <= 0xffffffff) {
    write_u8(0xfe);
    write_u32(static_cast<uint32_t>(value));
  } else {
    write_u8(0xff);
    write_u64(value);
  }
}

void writer::write_bytes(const cann::schema::bytes_view_t& bytes) {
  out_.insert(std::end(out_), std::begin(bytes), std::end(bytes));
}

void writer::write_var_bytes(const cann::schema::bytes_view_t& bytes) {
  write_compact_size(bytes.size());
  write_bytes(bytes);
}

void writer::write_hash(const cann::schema::hash32_t& hash) {
  out_.insert(std::end(out_), std::rbegin(hash), std::rend(hash));
}

reader::reader(const cann::schema::bytes_view_t& bytes) : bytes_{bytes} {}

cann::schema::bytes_view_t reader::read_bytes(const size_t size) {
  if (size > remaining()) {
    cann::common::throw_error(
        cann::common::error_code::decode_failure,
        fmt::format("unexpected end of input: wanted {} bytes at offset {}, "
                    "{} remaining",
                    size, offset_, remaining()));
  }
  auto view = bytes_.subspan(offset_, size);
  offset_ += size;
  return view;
}

uint8_t reader::read_u8() {
  return read_bytes(1)[0];
}

uint32_t reader::read_u32() {
  auto view = read_bytes(4);
  auto buffer = boost::endian::little_uint32_buf_t{};
  std::copy(std::begin(view), std::end(view), buffer.data());
  return buffer.value();
}

uint64_t reader::read_u64() {
  auto view = read_bytes(8);
  auto buffer = boost::endian::little_uint64_buf_t{};
  std::copy(std::begin(view), std::end(view), buffer.data());
  return buffer.value();
}

uint64_t reader::read_compact_size() {
  auto prefix = read_u8();
  if (prefix < 0xfd) {
    return prefix;
  }
  if (prefix == 0xfd) {
    auto view = read_bytes(2);
    auto buffer = boost::endian::little_uint16_buf_t{};
    std::copy(std::begin(view), std::end(view), buffer.data());
    return buffer.value();
  }
  if (prefix == 0xfe) {
    return read_u32();
  }
  return read_u64();
}

cann::schema::bytes_t reader::read_var_bytes() {
  auto size = read_compact_size();
  if (size > remaining()) {
    cann::common::throw_error(
        cann::common::error_code::decode_failure,
        fmt::format("length prefix {} exceeds remaining input", size));
  }
  return cann::schema::make_bytes(read_bytes(static_cast<size_t>(size)));
}

cann::schema::hash32_t reader::read_hash() {
  auto view = read_bytes(32);
  auto hash = cann::schema::hash32_t{};
  std::reverse_copy(std::begin(view), std::end(view), std::begin(hash));
  return hash;
}

size_t reader::remaining() const {
  return bytes_.size() - offset_;
}

bool reader::exhausted() const {
  return offset_ == bytes_.size();
}

}  // namespace cann::schema::encoding::bch
