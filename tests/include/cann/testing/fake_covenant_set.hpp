#pragma once

#include <cann/covenant/covenant_set.hpp>
#include <cann/protocol/name.hpp>
#include <cann/script/script.hpp>

#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace cann::testing {

// Unlocking bytecode produced by the fake: role byte, request kind byte,
// then the request argument (name bytes, index byte or auth index byte).
inline cann::schema::bytes_t encode_unlock_request(
    const cann::covenant::covenant_role_t role,
    const cann::covenant::unlock_request_t& request) {
  auto out = cann::schema::bytes_t{static_cast<uint8_t>(role),
                                   static_cast<uint8_t>(request.index())};
  if (const auto* with_name =
          std::get_if<cann::covenant::call_with_name_t>(&request)) {
    out.insert(std::end(out), std::begin(with_name->name),
               std::end(with_name->name));
  } else if (const auto* with_index =
                 std::get_if<cann::covenant::call_with_index_t>(&request)) {
    out.push_back(static_cast<uint8_t>(with_index->invalid_character_index));
  } else if (const auto* auth =
                 std::get_if<cann::covenant::use_auth_t>(&request)) {
    out.push_back(auth->auth_index);
  }
  return out;
}

class fake_covenant_set final : public cann::covenant::covenant_set {
 public:
  fake_covenant_set() {
    for (const auto& [label, role] : cann::covenant::kCovenantRoleNames) {
      if (role != cann::covenant::covenant_role_t::domain) {
        covenants_[role] = make_covenant(role, std::string{label});
      }
    }
  }

  const cann::covenant::covenant_t& get(
      const cann::covenant::covenant_role_t role) const override {
    return covenants_.at(role);
  }

  cann::covenant::covenant_t domain(const std::string_view name) const override {
    return make_covenant(cann::covenant::covenant_role_t::domain,
                         "Domain:" + std::string{name});
  }

  const cann::schema::locking_bytecode_t& locking_bytecode(
      const cann::covenant::covenant_role_t role) const {
    return get(role).locking_bytecode;
  }

  void drop_unlock(const cann::covenant::covenant_role_t role) {
    covenants_.at(role).unlock = nullptr;
  }

 private:
  static cann::covenant::covenant_t make_covenant(
      const cann::covenant::covenant_role_t role, const std::string& seed) {
    return cann::covenant::covenant_t{
        .role = role,
        .locking_bytecode = cann::script::make_p2sh32_locking_bytecode(
            cann::protocol::name_to_bytes(seed)),
        .unlock = [role](const cann::covenant::unlock_request_t& request) {
          return encode_unlock_request(role, request);
        }};
  }

  std::map<cann::covenant::covenant_role_t, cann::covenant::covenant_t>
      covenants_;
};

}  // namespace cann::testing
