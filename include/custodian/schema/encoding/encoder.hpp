#pragma once
#include <custodian/schema/primitives.hpp>
#include <optional>
#include <span>

namespace custodian::schema::encoding {

// The wire library is chosen at build time through the tag type; callers
// hold an `encoder<Library>` and never touch the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  custodian::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, custodian::schema::bytes_t& out);

  template <typename T>
  T decode(const custodian::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const custodian::schema::bytes_view_t& bytes);
};

}  // namespace custodian::schema::encoding
