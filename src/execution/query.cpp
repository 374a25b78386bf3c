#include <spdlog/spdlog.h>
#include <peggy/bridge/query_surface.hpp>
#include <peggy/execution/engine.hpp>
#include <peggy/schema/query_error_code.hpp>
#include <algorithm>
#include <charconv>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace peggy::schema;

// Query routes. Arguments are path segments; results are SCALE encoded into
// query_result::value.
//
//   /engine/info
//   /valset/current | /valset/last[/{n}] | /valset/pending/{validator}
//   /valset/confirm/{nonce}/{orchestrator} | /valset/confirms/{nonce}
//   /valset/{nonce}
//   /batch/last[/{n}] | /batch/pending/{validator}[/{contract}]
//   /batch/confirm/{nonce}/{contract}/{orchestrator}
//   /batch/confirms/{nonce}/{contract} | /batch/{nonce}/{contract}
//   /logic_call/last[/{n}] | /logic_call/pending/{validator}
//   /logic_call/confirm/{id_hex}/{nonce}/{orchestrator}
//   /logic_call/confirms/{id_hex}/{nonce} | /logic_call/{id_hex}/{nonce}
//   /pending_send_to_eth/{sender}
//   /erc20_to_denom/{contract} | /denom_to_erc20/{denom, may contain '/'}
//   /eth_address/{validator}
namespace {

using encoder_t = peggy::schema::encoding::scale_encoder_t;
using surface_t =
    peggy::bridge::query_surface<encoder_t, peggy::storage::rocksdb_storage_t>;
using segments_t = std::vector<std::string_view>;

constexpr auto kQueryCodespace = std::string_view{"peggy.query"};
constexpr auto kDenomToErc20Route = std::string_view{"denom_to_erc20"};

enum class route_status : uint8_t { ok, invalid_argument, unsupported_path };

struct route_outcome final {
  route_status status{route_status::ok};
  std::string info;
  peggy::schema::bytes_t value;
};

segments_t split_path(std::string_view path) {
  auto segments = segments_t{};
  if (path.starts_with('/')) {
    path.remove_prefix(1);
  }
  while (!path.empty()) {
    auto slash = path.find('/');
    segments.push_back(path.substr(0, slash));
    if (slash == std::string_view::npos) {
      break;
    }
    path.remove_prefix(slash + 1);
  }
  return segments;
}

std::optional<uint64_t> parse_uint64(const std::string_view text) {
  auto value = uint64_t{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<bytes_t> parse_invalidation_id(const std::string_view text) {
  auto decoded = try_from_hex(text);
  if (!decoded || decoded->empty()) {
    return std::nullopt;
  }
  return decoded;
}

std::optional<native_address_t> parse_native_address(
    const std::string_view text) {
  if (!is_valid_native_address(text)) {
    return std::nullopt;
  }
  return native_address_t{text};
}

route_outcome invalid(std::string info) {
  return route_outcome{.status = route_status::invalid_argument,
                       .info = std::move(info)};
}

route_outcome unsupported() {
  return route_outcome{.status = route_status::unsupported_path};
}

template <typename T>
route_outcome reply(encoder_t& encoder, const T& value) {
  return route_outcome{.value = encoder.encode(value)};
}

template <typename T>
route_outcome reply(encoder_t& encoder, const std::optional<T>& value) {
  if (!value) {
    return route_outcome{.info = "not found"};
  }
  return route_outcome{.value = encoder.encode(*value)};
}

route_outcome route_valset(surface_t& surface,
                           encoder_t& encoder,
                           const segments_t& s) {
  if (s.size() == 2 && s[1] == "current") {
    return reply(encoder, surface.current_valset());
  }
  if (s[1] == "last") {
    if (s.size() == 2) {
      return reply(encoder, surface.last_valset_requests());
    }
    auto count = s.size() == 3 ? parse_uint64(s[2]) : std::nullopt;
    if (!count) {
      return invalid("count must be an unsigned integer");
    }
    return reply(encoder, surface.last_valset_requests(*count));
  }
  if (s[1] == "pending" && s.size() == 3) {
    auto validator = parse_native_address(s[2]);
    if (!validator) {
      return invalid("invalid validator address");
    }
    return reply(encoder, surface.last_pending_valset_request(*validator));
  }
  if (s[1] == "confirm" && s.size() == 4) {
    auto nonce = parse_uint64(s[2]);
    auto orchestrator = parse_native_address(s[3]);
    if (!nonce || !orchestrator) {
      return invalid("expected /valset/confirm/{nonce}/{orchestrator}");
    }
    return reply(encoder, surface.valset_confirm(*nonce, *orchestrator));
  }
  if (s[1] == "confirms" && s.size() == 3) {
    auto nonce = parse_uint64(s[2]);
    if (!nonce) {
      return invalid("nonce must be an unsigned integer");
    }
    return reply(encoder, surface.valset_confirms(*nonce));
  }
  if (s.size() == 2) {
    auto nonce = parse_uint64(s[1]);
    if (!nonce) {
      return invalid("nonce must be an unsigned integer");
    }
    return reply(encoder, surface.valset(*nonce));
  }
  return unsupported();
}

route_outcome route_batch(surface_t& surface,
                          encoder_t& encoder,
                          const segments_t& s) {
  if (s[1] == "last") {
    if (s.size() == 2) {
      return reply(encoder, surface.last_batches());
    }
    auto count = s.size() == 3 ? parse_uint64(s[2]) : std::nullopt;
    if (!count) {
      return invalid("count must be an unsigned integer");
    }
    return reply(encoder, surface.last_batches(*count));
  }
  if (s[1] == "pending" && (s.size() == 3 || s.size() == 4)) {
    auto validator = parse_native_address(s[2]);
    if (!validator) {
      return invalid("invalid validator address");
    }
    auto contract = std::optional<eth_address_t>{};
    if (s.size() == 4) {
      contract = try_make_eth_address(s[3]);
      if (!contract) {
        return invalid("invalid token contract");
      }
    }
    return reply(encoder,
                 surface.last_pending_batch_request(*validator, contract));
  }
  if (s[1] == "confirm" && s.size() == 5) {
    auto nonce = parse_uint64(s[2]);
    auto contract = try_make_eth_address(s[3]);
    auto orchestrator = parse_native_address(s[4]);
    if (!nonce || !contract || !orchestrator) {
      return invalid(
          "expected /batch/confirm/{nonce}/{contract}/{orchestrator}");
    }
    return reply(encoder,
                 surface.batch_confirm(*nonce, *contract, *orchestrator));
  }
  if (s[1] == "confirms" && s.size() == 4) {
    auto nonce = parse_uint64(s[2]);
    auto contract = try_make_eth_address(s[3]);
    if (!nonce || !contract) {
      return invalid("expected /batch/confirms/{nonce}/{contract}");
    }
    return reply(encoder, surface.batch_confirms(*nonce, *contract));
  }
  if (s.size() == 3) {
    auto nonce = parse_uint64(s[1]);
    auto contract = try_make_eth_address(s[2]);
    if (!nonce || !contract) {
      return invalid("expected /batch/{nonce}/{contract}");
    }
    return reply(encoder, surface.batch(*nonce, *contract));
  }
  return unsupported();
}

route_outcome route_logic_call(surface_t& surface,
                               encoder_t& encoder,
                               const segments_t& s) {
  if (s[1] == "last") {
    if (s.size() == 2) {
      return reply(encoder, surface.last_logic_calls());
    }
    auto count = s.size() == 3 ? parse_uint64(s[2]) : std::nullopt;
    if (!count) {
      return invalid("count must be an unsigned integer");
    }
    return reply(encoder, surface.last_logic_calls(*count));
  }
  if (s[1] == "pending" && s.size() == 3) {
    auto validator = parse_native_address(s[2]);
    if (!validator) {
      return invalid("invalid validator address");
    }
    return reply(encoder, surface.last_pending_logic_call(*validator));
  }
  if (s[1] == "confirm" && s.size() == 5) {
    auto id = parse_invalidation_id(s[2]);
    auto nonce = parse_uint64(s[3]);
    auto orchestrator = parse_native_address(s[4]);
    if (!id || !nonce || !orchestrator) {
      return invalid(
          "expected /logic_call/confirm/{id_hex}/{nonce}/{orchestrator}");
    }
    return reply(encoder,
                 surface.logic_call_confirm(*id, *nonce, *orchestrator));
  }
  if (s[1] == "confirms" && s.size() == 4) {
    auto id = parse_invalidation_id(s[2]);
    auto nonce = parse_uint64(s[3]);
    if (!id || !nonce) {
      return invalid("expected /logic_call/confirms/{id_hex}/{nonce}");
    }
    return reply(encoder, surface.logic_call_confirms(*id, *nonce));
  }
  if (s.size() == 3) {
    auto id = parse_invalidation_id(s[1]);
    auto nonce = parse_uint64(s[2]);
    if (!id || !nonce) {
      return invalid("expected /logic_call/{id_hex}/{nonce}");
    }
    return reply(encoder, surface.logic_call(*id, *nonce));
  }
  return unsupported();
}

// Denoms such as ibc/{hash} contain '/', so everything after the route name
// is the denom.
route_outcome route_denom_to_erc20(surface_t& surface,
                                   encoder_t& encoder,
                                   std::string_view path) {
  if (path.starts_with('/')) {
    path.remove_prefix(1);
  }
  path.remove_prefix(std::min(path.size(), kDenomToErc20Route.size() + 1));
  if (path.empty()) {
    return invalid("denom must not be empty");
  }
  return reply(encoder, surface.denom_to_erc20(path));
}

route_outcome route_single(surface_t& surface,
                           encoder_t& encoder,
                           const segments_t& s) {
  const auto& root = s[0];
  if (root == "pending_send_to_eth") {
    auto sender = parse_native_address(s[1]);
    if (!sender) {
      return invalid("invalid sender address");
    }
    return reply(encoder, surface.pending_send_to_eth(*sender));
  }
  if (root == "erc20_to_denom") {
    auto contract = try_make_eth_address(s[1]);
    if (!contract) {
      return invalid("invalid token contract");
    }
    return reply(encoder, surface.erc20_to_denom(*contract));
  }
  if (root == "eth_address") {
    auto validator = parse_native_address(s[1]);
    if (!validator) {
      return invalid("invalid validator address");
    }
    return reply(encoder, surface.eth_address(*validator));
  }
  return unsupported();
}

}  // namespace

namespace peggy::execution {

query_result_t engine::query(std::string_view path,
                             const peggy::schema::bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto segments = split_path(path);
  auto outcome = route_outcome{.status = route_status::unsupported_path};
  if (segments.size() == 2 && segments[0] == "engine" &&
      segments[1] == "info") {
    outcome = reply(encoder_, std::tuple{last_committed_height_,
                                         last_committed_state_root_});
  } else if (segments.size() >= 2) {
    auto surface = surface_t{encoder_, storage_, options_.voucher_denom_prefix,
                             options_.last_requests_limit};
    if (segments[0] == kDenomToErc20Route) {
      outcome = route_denom_to_erc20(surface, encoder_, path);
    } else if (segments[0] == "valset") {
      outcome = route_valset(surface, encoder_, segments);
    } else if (segments[0] == "batch") {
      outcome = route_batch(surface, encoder_, segments);
    } else if (segments[0] == "logic_call") {
      outcome = route_logic_call(surface, encoder_, segments);
    } else if (segments.size() == 2) {
      outcome = route_single(surface, encoder_, segments);
    }
  }

  switch (outcome.status) {
    case route_status::ok:
      result.value = std::move(outcome.value);
      result.info = std::move(outcome.info);
      break;
    case route_status::invalid_argument:
      result.code = static_cast<uint32_t>(query_error_code::invalid_argument);
      result.log = "invalid query argument";
      result.info = std::move(outcome.info);
      break;
    case route_status::unsupported_path:
      result.code = static_cast<uint32_t>(query_error_code::unsupported_path);
      result.log = "unsupported query path";
      result.info = std::string{path};
      break;
  }
  spdlog::debug("Query {} -> code {} ({} byte(s))", path, result.code,
                result.value.size());
  return result;
}

}  // namespace peggy::execution
