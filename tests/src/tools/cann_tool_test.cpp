#include <cann/protocol/records.hpp>
#include <cann/protocol/name.hpp>
#include <cann/schema/encoding/bch/encoder.hpp>
#include <cann/schema/transaction.hpp>
#include <cann/script/script.hpp>
#include <cann/testing/common.hpp>
#include <gtest/gtest.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include <sys/wait.h>

#ifndef CANN_TOOL_PATH
#define CANN_TOOL_PATH ""
#endif

namespace {

using encoder_t =
    cann::schema::encoding::encoder<cann::schema::encoding::bch_encoder_tag>;

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::pair<int, std::string> run_tool(const std::string_view args) {
  auto [exit_code, output] = run_capture(
      shell_quote(CANN_TOOL_PATH) + " " + std::string{args} + " 2>/dev/null");
  return {exit_code, trim_ascii_whitespace(output)};
}

bool tool_available() {
  auto tool = std::string{CANN_TOOL_PATH};
  return !tool.empty() && std::filesystem::exists(tool);
}

}  // namespace

TEST(cann_tool, price_prints_the_auction_schedule) {
  if (!tool_available()) {
    GTEST_SKIP() << "cann_tool binary not available: " << CANN_TOOL_PATH;
  }
  auto [exit_code, output] = run_tool("price --id 1 --min-starting-bid 10000");
  EXPECT_EQ(exit_code, 0) << output;
  EXPECT_EQ(output,
            "auction_price 9999\nminimum_bid 10498\ncreator_incentive 3498");

  // The default starting bid is the protocol floor.
  std::tie(exit_code, output) = run_tool("price --id 1");
  EXPECT_EQ(exit_code, 0) << output;
  EXPECT_EQ(output, "auction_price 6000\nminimum_bid 6300\ncreator_incentive 0");

  std::tie(exit_code, output) = run_tool("price");
  EXPECT_EQ(exit_code, 1) << output;
}

TEST(cann_tool, validate_name_reports_the_first_invalid_character) {
  if (!tool_available()) {
    GTEST_SKIP() << "cann_tool binary not available: " << CANN_TOOL_PATH;
  }
  auto [exit_code, output] = run_tool("validate-name --name my-name42");
  EXPECT_EQ(exit_code, 0);
  EXPECT_EQ(output, "valid");

  std::tie(exit_code, output) = run_tool("validate-name --name te.st");
  EXPECT_EQ(exit_code, 1);
  EXPECT_EQ(output, "invalid 3");
}

TEST(cann_tool, revoke_record_prints_the_marker) {
  if (!tool_available()) {
    GTEST_SKIP() << "cann_tool binary not available: " << CANN_TOOL_PATH;
  }
  auto [exit_code, output] = run_tool("revoke-record --record a=1");
  EXPECT_EQ(exit_code, 0);
  EXPECT_EQ(output, cann::protocol::make_revocation_record("a=1"));
}

TEST(cann_tool, decode_tx_lists_outputs_tokens_and_records) {
  if (!tool_available()) {
    GTEST_SKIP() << "cann_tool binary not available: " << CANN_TOOL_PATH;
  }
  auto tx = cann::schema::transaction_t{
      .inputs = {cann::schema::input_t{
          .outpoint = {.txid = cann::testing::make_hash(1), .index = 0}}},
      .outputs = {
          cann::schema::output_t{
              .locking_bytecode = cann::testing::make_p2pkh(2),
              .satoshis = 1000,
              .token = cann::testing::make_token(
                  7, cann::schema::token_capability_t::none, {0x01, 0x02})},
          cann::schema::output_t{
              .locking_bytecode =
                  cann::script::make_op_return_locking_bytecode(
                      cann::protocol::name_to_bytes("hello=world"))}}};
  auto hex = cann::schema::to_hex(encoder_t{}.encode(tx));

  auto [exit_code, output] = run_tool("decode-tx --hex " + hex);
  EXPECT_EQ(exit_code, 0) << output;
  EXPECT_EQ(output.rfind("version 2 inputs 1 outputs 2 locktime 0\n", 0), 0u)
      << output;
  EXPECT_NE(output.find("output 0 value 1000 script " +
                        cann::schema::to_hex(cann::testing::make_p2pkh(2))),
            std::string::npos);
  EXPECT_NE(output.find("  token " +
                        cann::schema::to_hex(cann::testing::make_category()) +
                        " amount 7 none commitment 0102"),
            std::string::npos)
      << output;
  EXPECT_NE(output.find("  record hello=world"), std::string::npos) << output;
}

TEST(cann_tool, bad_input_sets_the_exit_code) {
  if (!tool_available()) {
    GTEST_SKIP() << "cann_tool binary not available: " << CANN_TOOL_PATH;
  }
  EXPECT_EQ(run_tool("decode-tx --hex zz").first, 1);
  EXPECT_EQ(run_tool("decode-tx --hex 0200").first, 1);
  EXPECT_EQ(run_tool("unknown-command").first, 2);
  EXPECT_EQ(run_tool("price --id not-a-number").first, 2);
}
