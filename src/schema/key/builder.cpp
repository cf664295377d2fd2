#include <algorithm>
#include <iterator>
#include <ranges>
#include <tally/schema/key/builder.hpp>

using namespace tally::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), static_cast<std::ptrdiff_t>(str.size()),
                      std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), static_cast<std::ptrdiff_t>(bytes.size()),
                      std::back_inserter(data));
  return *this;
}
