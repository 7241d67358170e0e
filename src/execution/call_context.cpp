#include <spdlog/fmt/fmt.h>
#include <covenant/execution/call_context.hpp>
#include <utility>

namespace covenant::execution {

covenant::schema::transaction_result_t make_error_result(
    covenant::schema::transaction_error_code code,
    std::string_view codespace,
    std::string info) {
  auto result = covenant::schema::transaction_result_t{};
  result.code = covenant::schema::to_code(code);
  result.log = std::string{covenant::schema::to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

covenant::schema::transaction_result_t make_success_result(std::string info) {
  auto result = covenant::schema::transaction_result_t{};
  result.code =
      covenant::schema::to_code(covenant::schema::transaction_error_code::ok);
  result.info = std::move(info);
  return result;
}

std::string unauthorized_info(const covenant::schema::account_id_t& caller,
                              std::string_view required_role) {
  return fmt::format("caller={} required_role={}",
                     covenant::schema::to_hex(caller), required_role);
}

std::string invalid_state_info(covenant::schema::escrow_status_t current,
                               covenant::schema::escrow_status_t expected) {
  return fmt::format("current={} expected={}",
                     covenant::schema::to_string(current),
                     covenant::schema::to_string(expected));
}

covenant::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    bool index) {
  return covenant::schema::transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

covenant::schema::transaction_event_t make_event(
    std::string type,
    std::initializer_list<covenant::schema::transaction_event_attribute_t>
        attributes) {
  return covenant::schema::transaction_event_t{
      .type = std::move(type), .attributes = attributes};
}

}  // namespace covenant::execution
