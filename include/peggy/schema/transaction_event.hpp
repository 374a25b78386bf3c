#pragma once

#include <peggy/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Bridge workflow: indexed emission consumed by orchestrators and relayers to
// learn about new valsets, batches and transfers without polling.
namespace peggy::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace peggy::schema
