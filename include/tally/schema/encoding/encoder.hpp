#pragma once
#include <tally/schema/primitives.hpp>
#include <span>

namespace tally::schema::encoding {

// Encoding backend is picked at build time through the tag type; the ledger
// only ever talks to this interface.
template <typename Library>
struct encoder {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);
};

}  // namespace tally::schema::encoding
