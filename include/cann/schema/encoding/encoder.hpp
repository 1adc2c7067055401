#pragma once
#include <cann/schema/primitives.hpp>
#include <optional>
#include <span>

namespace cann::schema::encoding {

// Wire encoders are selected at build time by tag, e.g.
// encoder<bch_encoder_tag>.
template <typename Library>
struct encoder {
  template <typename T>
  cann::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, cann::schema::bytes_t& out);

  template <typename T>
  T decode(const cann::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const cann::schema::bytes_view_t& bytes);
};

}  // namespace cann::schema::encoding
