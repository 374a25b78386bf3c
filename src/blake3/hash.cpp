#include <blake3.h>
#include <peggy/blake3/hash.hpp>

namespace peggy::blake3 {

peggy::schema::hash32_t hash(const peggy::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<peggy::schema::hash32_t>);
  auto root = peggy::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, root.data(), root.size());
  return root;
}

}  // namespace peggy::blake3
