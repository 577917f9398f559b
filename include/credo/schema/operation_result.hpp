#pragma once

#include <credo/schema/error_code.hpp>
#include <credo/schema/event.hpp>
#include <credo/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace credo::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<event_t> events;
};

using operation_result_t = operation_result<1>;

inline error_code code_of(const operation_result_t& result) {
  return static_cast<error_code>(result.code);
}

inline error_kind kind_of(const operation_result_t& result) {
  return kind_of(code_of(result));
}

inline bool succeeded(const operation_result_t& result) {
  return result.code == 0;
}

}  // namespace credo::schema
