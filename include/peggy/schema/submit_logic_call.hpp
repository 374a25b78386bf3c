#pragma once
#include <peggy/schema/outgoing_logic_call.hpp>

namespace peggy::schema {

template <uint16_t Version>
struct submit_logic_call;

template <>
struct submit_logic_call<1> final {
  uint16_t version{1};
  outgoing_logic_call_t call;
};

using submit_logic_call_t = submit_logic_call<1>;

}  // namespace peggy::schema
