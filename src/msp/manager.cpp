#include <warden/msp/manager.hpp>
#include <warden/msp/status.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/serialized_identity.hpp>

#include <spdlog/fmt/fmt.h>

#include <utility>

using warden::schema::msp_error_code;

namespace warden::msp {

namespace {

// Shares one control block between an identity and the store it came from.
struct pinned_identity final {
  std::shared_ptr<const trust_store> store;
  std::shared_ptr<const identity> id;
};

}  // namespace

manager::manager(trust_store_options options)
    : options_{std::move(options)},
      registry_{std::make_shared<const registry_t>()} {
  if (!options_.logger) {
    options_.logger = spdlog::default_logger();
  }
}

warden::schema::msp_result_t manager::setup(
    const std::vector<warden::schema::msp_config_t>& configs) {
  auto registry = registry_t{};
  for (const auto& config : configs) {
    auto result = warden::schema::msp_result_t{};
    auto store = trust_store::setup(config, options_, result);
    if (!store) {
      options_.logger->warn("MSP manager setup failed: {}", describe(result));
      return result;
    }
    auto [_, inserted] = registry.emplace(store->name(), store);
    if (!inserted) {
      return make_error(msp_error_code::config_error,
                        "duplicate MSP name", store->name(),
                        kManagerCodespace);
    }
  }
  auto count = registry.size();
  publish(std::make_shared<const registry_t>(std::move(registry)));
  options_.logger->info("MSP manager set up with {} provider(s)", count);
  return make_ok();
}

warden::schema::msp_result_t manager::reconfigure(
    const warden::schema::msp_config_t& config) {
  auto result = warden::schema::msp_result_t{};
  auto store = trust_store::setup(config, options_, result);
  if (!store) {
    options_.logger->warn("MSP reconfiguration rejected: {}",
                          describe(result));
    return result;
  }

  auto lock = std::scoped_lock{mutex_};
  auto registry = std::make_shared<registry_t>(*registry_);
  (*registry)[store->name()] = store;
  registry_ = std::move(registry);
  options_.logger->info("MSP {} reconfigured", store->name());
  return make_ok();
}

std::shared_ptr<const trust_store> manager::get(
    const std::string_view name) const {
  auto registry = snapshot();
  auto it = registry->find(name);
  if (it == std::end(*registry)) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::string> manager::names() const {
  auto registry = snapshot();
  auto out = std::vector<std::string>{};
  out.reserve(registry->size());
  for (const auto& [name, _] : *registry) {
    out.push_back(name);
  }
  return out;
}

std::shared_ptr<const identity> manager::deserialize_identity(
    const warden::schema::bytes_view_t& serialized,
    warden::schema::msp_result_t& result) const {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<warden::schema::serialized_identity_t>(serialized);
  if (!decoded) {
    result = make_error(msp_error_code::decode_error,
                        "could not deserialize a SerializedIdentity", {},
                        kManagerCodespace);
    return nullptr;
  }
  auto store = get(decoded->msp_id);
  if (!store) {
    result = make_error(msp_error_code::unknown_msp,
                        fmt::format("MSP {} is unknown", decoded->msp_id), {},
                        kManagerCodespace);
    return nullptr;
  }
  auto id = store->deserialize_identity(serialized, result);
  if (!id) {
    return nullptr;
  }
  auto pinned = std::make_shared<pinned_identity>(
      pinned_identity{std::move(store), std::move(id)});
  return std::shared_ptr<const identity>{pinned, pinned->id.get()};
}

std::shared_ptr<const manager::registry_t> manager::snapshot() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_;
}

void manager::publish(std::shared_ptr<const registry_t> registry) {
  auto lock = std::scoped_lock{mutex_};
  registry_ = std::move(registry);
}

}  // namespace warden::msp
