#pragma once
#include <cann/common/critical.hpp>
#include <cann/common/error.hpp>
#include <cann/schema/encoding/bch/stream.hpp>
#include <cann/schema/encoding/bch/transaction.hpp>
#include <cann/schema/encoding/encoder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iterator>
#include <optional>
#include <utility>

namespace cann::schema::encoding {

struct bch_encoder_tag {};

// Bitcoin Cash network serialization (CashTokens aware).
template <>
struct encoder<bch_encoder_tag> final {
  template <typename T>
  cann::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cann::schema::bytes_t& out);

  template <typename T>
  T decode(const cann::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cann::schema::bytes_view_t& bytes);
};

template <typename T>
cann::schema::bytes_t encoder<bch_encoder_tag>::encode(const T& obj) {
  auto out = cann::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
void encoder<bch_encoder_tag>::encode(const T& obj,
                                      cann::schema::bytes_t& out) {
  auto stream = bch::writer{out};
  bch::encode(obj, stream);
}

template <typename T>
T encoder<bch_encoder_tag>::decode(const cann::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    cann::common::critical("failed to decode {} BCH bytes", bytes.size());
  }
  return std::move(*decoded);
}

template <typename T>
std::optional<T> encoder<bch_encoder_tag>::try_decode(
    const cann::schema::bytes_view_t& bytes) {
  auto obj = T{};
  auto stream = bch::reader{bytes};
  try {
    bch::decode(obj, stream);
  } catch (const cann::common::error& e) {
    spdlog::debug("BCH decode failed: {}", e.what());
    return std::nullopt;
  }
  if (!stream.exhausted()) {
    spdlog::debug("BCH decode left {} trailing bytes", stream.remaining());
    return std::nullopt;
  }
  return obj;
}

}  // namespace cann::schema::encoding
