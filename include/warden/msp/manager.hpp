#pragma once

#include <warden/msp/identity.hpp>
#include <warden/msp/trust_store.hpp>
#include <warden/schema/msp_config.hpp>
#include <warden/schema/msp_result.hpp>
#include <warden/schema/primitives.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace warden::msp {

/// Registry of trust stores keyed by provider name.
///
/// Stores are replaced, never modified: setup() and reconfigure() build new
/// stores and publish a new registry in one step. Readers work on a snapshot
/// and are unaffected by concurrent reconfiguration.
class manager final {
 public:
  using registry_t =
      std::map<std::string, std::shared_ptr<const trust_store>, std::less<>>;

  explicit manager(trust_store_options options);

  /// Replace the whole registry. On failure the current registry is kept.
  warden::schema::msp_result_t setup(
      const std::vector<warden::schema::msp_config_t>& configs);

  /// Rebuild (or add) the store named by `config`.
  warden::schema::msp_result_t reconfigure(
      const warden::schema::msp_config_t& config);

  std::shared_ptr<const trust_store> get(std::string_view name) const;
  std::vector<std::string> names() const;

  /// Route an encoded serialized_identity<1> to the store named by its
  /// msp_id. The returned identity keeps that store alive, so it stays
  /// usable across a later reconfiguration.
  std::shared_ptr<const identity> deserialize_identity(
      const warden::schema::bytes_view_t& serialized,
      warden::schema::msp_result_t& result) const;

 private:
  std::shared_ptr<const registry_t> snapshot() const;
  void publish(std::shared_ptr<const registry_t> registry);

  trust_store_options options_;
  mutable std::mutex mutex_;
  std::shared_ptr<const registry_t> registry_;
};

}  // namespace warden::msp
