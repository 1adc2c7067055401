#include <cann/crypto/hash.hpp>
#include <cann/script/script.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>

namespace cann::script {

namespace {

constexpr auto kOpDup = uint8_t{0x76};
constexpr auto kOpHash160 = uint8_t{0xa9};
constexpr auto kOpHash256 = uint8_t{0xaa};
constexpr auto kOpEqual = uint8_t{0x87};
constexpr auto kOpEqualVerify = uint8_t{0x88};
constexpr auto kOpCheckSig = uint8_t{0xac};

}  // namespace

cann::schema::bytes_t make_push(const cann::schema::bytes_view_t& data) {
  auto out = cann::schema::bytes_t{};
  out.reserve(data.size() + 5);
  if (data.size() <= kMaxDirectPush) {
    out.push_back(static_cast<uint8_t>(data.size()));
  } else if (data.size() <= 0xff) {
    out.push_back(kOpPushData1);
    out.push_back(static_cast<uint8_t>(data.size()));
  } else if (data.size() <= 0xffff) {
    out.push_back(kOpPushData2);
    auto length = boost::endian::little_uint16_buf_t{
        static_cast<uint16_t>(data.size())};
    out.insert(std::end(out), length.data(), length.data() + sizeof(length));
  } else {
    out.push_back(kOpPushData4);
    auto length = boost::endian::little_uint32_buf_t{
        static_cast<uint32_t>(data.size())};
    out.insert(std::end(out), length.data(), length.data() + sizeof(length));
  }
  out.insert(std::end(out), std::begin(data), std::end(data));
  return out;
}

cann::schema::locking_bytecode_t make_p2pkh_locking_bytecode(
    const cann::schema::hash20_t& public_key_hash) {
  auto out = cann::schema::locking_bytecode_t{kOpDup, kOpHash160, 0x14};
  out.insert(std::end(out), std::begin(public_key_hash),
             std::end(public_key_hash));
  out.push_back(kOpEqualVerify);
  out.push_back(kOpCheckSig);
  return out;
}

cann::schema::locking_bytecode_t make_p2sh32_locking_bytecode(
    const cann::schema::bytes_view_t& redeem_bytecode) {
  auto script_hash = cann::crypto::hash256(redeem_bytecode);
  auto out = cann::schema::locking_bytecode_t{kOpHash256, 0x20};
  out.insert(std::end(out), std::begin(script_hash), std::end(script_hash));
  out.push_back(kOpEqual);
  return out;
}

cann::schema::locking_bytecode_t make_op_return_locking_bytecode(
    const cann::schema::bytes_view_t& payload) {
  auto out = cann::schema::locking_bytecode_t{kOpReturn};
  auto push = make_push(payload);
  out.insert(std::end(out), std::begin(push), std::end(push));
  return out;
}

std::optional<cann::schema::hash20_t> try_extract_p2pkh_hash(
    const cann::schema::bytes_view_t& locking_bytecode) {
  if (locking_bytecode.size() != 25 || locking_bytecode[0] != kOpDup ||
      locking_bytecode[1] != kOpHash160 || locking_bytecode[2] != 0x14 ||
      locking_bytecode[23] != kOpEqualVerify ||
      locking_bytecode[24] != kOpCheckSig) {
    return std::nullopt;
  }
  auto hash = cann::schema::hash20_t{};
  std::copy_n(std::begin(locking_bytecode) + 3, hash.size(),
              std::begin(hash));
  return hash;
}

std::optional<cann::schema::bytes_t> try_extract_op_return_payload(
    const cann::schema::bytes_view_t& locking_bytecode) {
  if (locking_bytecode.empty() || locking_bytecode[0] != kOpReturn) {
    return std::nullopt;
  }
  if (locking_bytecode.size() == 1) {
    return cann::schema::bytes_t{};
  }

  auto cursor = size_t{1};
  auto opcode = locking_bytecode[cursor++];
  auto length = size_t{0};
  auto width = size_t{0};
  if (opcode <= kMaxDirectPush) {
    length = opcode;
  } else if (opcode == kOpPushData1) {
    width = 1;
  } else if (opcode == kOpPushData2) {
    width = 2;
  } else if (opcode == kOpPushData4) {
    width = 4;
  } else {
    return std::nullopt;
  }

  if (width > 0) {
    if (cursor + width > locking_bytecode.size()) {
      return std::nullopt;
    }
    // Push lengths are little endian.
    for (auto i = size_t{0}; i < width; ++i) {
      length |= static_cast<size_t>(locking_bytecode[cursor + i]) << (8 * i);
    }
    cursor += width;
  }

  if (cursor + length > locking_bytecode.size()) {
    return std::nullopt;
  }
  return cann::schema::bytes_t{std::begin(locking_bytecode) + cursor,
                               std::begin(locking_bytecode) + cursor + length};
}

}  // namespace cann::script
