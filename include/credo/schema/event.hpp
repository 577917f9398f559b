#pragma once

#include <credo/schema/event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: event.
// Ordered record of one state change (issuance, recovery, role edits, ...).
// `sequence` is assigned when the record is persisted.
namespace credo::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

}  // namespace credo::schema
