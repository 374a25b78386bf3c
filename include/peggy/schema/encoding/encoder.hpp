#pragma once
#include <peggy/schema/primitives.hpp>
#include <optional>
#include <span>

namespace peggy::schema::encoding {

/// Value codec selected at build time by tag. Every persisted record, query
/// payload and transaction envelope passes through one of these.
template <typename Library>
struct encoder {
  template <typename T>
  peggy::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, peggy::schema::bytes_t& out);

  template <typename T>
  T decode(const peggy::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const peggy::schema::bytes_view_t& bytes);
};

}  // namespace peggy::schema::encoding
