#pragma once
#include <peggy/schema/primitives.hpp>

namespace peggy::blake3 {

/// 32 byte BLAKE3 digest. Used to fold executed transactions into the
/// rolling state root.
peggy::schema::hash32_t hash(const peggy::schema::bytes_view_t& bytes);

}  // namespace peggy::blake3
