#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "wiredrive/common/fs.hpp"
#include "wiredrive/common/json_util.hpp"
#include "wiredrive/common/result.hpp"
#include "wiredrive/common/toml.hpp"

#include <filesystem>

void register_common_tests(std::vector<wiredrive::tests::TestCase> &tests) {
  using wiredrive::tests::require;
  namespace common = wiredrive::common;

  tests.push_back({"json_escape_round_trips_control_characters", [] {
                     const std::string raw = "line\n\ttab \"quoted\" back\\slash \x01";
                     const auto quoted = common::json_quote(raw);
                     require(quoted.find("\\u0001") != std::string::npos,
                             "control byte should be escaped as \\u0001");
                     const auto decoded = common::json_decode_string(quoted);
                     require(decoded.has_value(), "quoted string should decode");
                     require(*decoded == raw, "decoded string mismatch");
                   }});

  tests.push_back({"json_unescape_handles_surrogate_pairs", [] {
                     const auto decoded = common::json_decode_string(R"("caf\u00e9 \ud83d\ude00")");
                     require(decoded.has_value(), "string should decode");
                     require(*decoded == "caf\xC3\xA9 \xF0\x9F\x98\x80", "utf-8 mismatch");
                   }});

  tests.push_back({"json_validate_accepts_values_and_rejects_garbage", [] {
                     require(common::json_validate(R"({"a":[1,2.5e3,true,null,"x"],"b":{}})"),
                             "nested object should validate");
                     require(common::json_validate("  42  "), "bare number should validate");
                     require(!common::json_validate("{\"a\":}"), "missing value should fail");
                     require(!common::json_validate("[1,2"), "unterminated array should fail");
                     require(!common::json_validate("{} {}"), "trailing data should fail");
                     require(!common::json_validate("tru"), "truncated literal should fail");
                   }});

  tests.push_back({"json_top_level_fields_keeps_raw_values", [] {
                     const auto fields = common::json_top_level_fields(
                         R"({"sessionId":"abc","status":0,"value":{"nested":[1,{"x":"}"}]}})");
                     require(fields.has_value(), "object should parse");
                     require(fields->at("sessionId") == "\"abc\"", "string should stay quoted");
                     require(fields->at("status") == "0", "number mismatch");
                     require(fields->at("value") == R"({"nested":[1,{"x":"}"}]})",
                             "nested value should be kept verbatim");
                     require(!common::json_top_level_fields("[1,2]").has_value(),
                             "array is not an object");
                     require(!common::json_top_level_fields("{\"a\":1").has_value(),
                             "truncated object should fail");
                   }});

  tests.push_back({"json_member_is_case_insensitive_and_skips_null", [] {
                     const auto fields = common::json_top_level_fields(
                         R"({"Message":"boom","screen":null})");
                     require(fields.has_value(), "object should parse");
                     const auto message = common::json_member(*fields, "message");
                     require(message.has_value() && *message == "\"boom\"", "message lookup failed");
                     require(!common::json_member(*fields, "screen").has_value(),
                             "null member should count as missing");
                     require(!common::json_member(*fields, "class").has_value(),
                             "absent member should be missing");
                   }});

  tests.push_back({"json_split_and_decode_arrays", [] {
                     const auto items = common::json_split_top_level_values(R"([ "a", {"b":[1,2]}, 3 ])");
                     require(items.has_value(), "array should split");
                     require(items->size() == 3, "three elements expected");
                     require((*items)[1] == R"({"b":[1,2]})", "object element mismatch");

                     const auto strings = common::json_decode_string_array(R"(["x","y"])");
                     require(strings.has_value() && strings->size() == 2 && (*strings)[1] == "y",
                             "string array decode failed");
                     require(!common::json_decode_string_array(R"(["x",1])").has_value(),
                             "mixed array should not decode as strings");
                   }});

  tests.push_back({"json_decode_scalars", [] {
                     require(common::json_decode_int("-12").value_or(0) == -12, "int decode failed");
                     require(!common::json_decode_int("1.5").has_value(), "fraction is not an int");
                     require(common::json_decode_double("1.5e2").value_or(0.0) == 150.0,
                             "double decode failed");
                     require(common::json_decode_bool("true").value_or(false), "bool decode failed");
                     require(!common::json_decode_bool("\"true\"").has_value(),
                             "quoted bool should not decode");
                   }});

  tests.push_back({"json_builders_emit_members_in_order", [] {
                     const auto body = common::json_object(
                         {{"using", common::json_quote("css selector")}, {"value", common::json_quote("#id")}});
                     require(body == R"({"using":"css selector","value":"#id"})", "object mismatch: " + body);
                     require(common::json_string_array({"a", "b"}) == R"(["a","b"])", "array mismatch");
                     require(common::json_array({}) == "[]", "empty array mismatch");
                     require(common::json_validate(body), "builder output should validate");
                   }});

  tests.push_back({"toml_parses_sections_and_quoted_keys", [] {
                     const auto doc = common::parse_toml(R"(
[driver]
binary = "/usr/bin/chromedriver" # trailing comment
port = 9600

[preferences]
"browser.startup.page" = 0
"app.update.enabled" = false
)");
                     require(doc.ok(), doc.ok() ? "" : doc.error().message);
                     require(doc.value().get_string("driver.binary") == "/usr/bin/chromedriver",
                             "binary mismatch");
                     require(doc.value().get_int("driver.port", 0) == 9600, "port mismatch");
                     const auto keys = doc.value().keys_in_section("preferences");
                     require(keys.size() == 2, "two preference keys expected");
                     require(keys[0] == "app.update.enabled", "keys should be sorted");
                     require(doc.value().get_raw("preferences.browser.startup.page") == "0",
                             "quoted key should be unquoted");
                   }});

  tests.push_back({"toml_rejects_lines_without_assignment", [] {
                     const auto doc = common::parse_toml("[driver]\njust some words\n");
                     require(!doc.ok(), "invalid line should fail");
                     require(doc.error().kind == common::ErrorKind::Config, "config error expected");
                   }});

  tests.push_back({"error_prefix_and_kind_names", [] {
                     const auto error = common::timeout_error("start failed: timeout expired")
                                            .with_prefix("driver start failed: ");
                     require(error.kind == common::ErrorKind::Timeout, "kind should be kept");
                     require(error.message == "driver start failed: start failed: timeout expired",
                             "prefix mismatch");
                     require(error.to_string() == "[timeout] " + error.message, "rendering mismatch");
                     require(common::error_kind_to_string(common::ErrorKind::Io) == "io", "io name");
                   }});

  tests.push_back({"status_and_result_values", [] {
                     const auto ok = common::Status::success();
                     require(ok.ok(), "success should be ok");
                     const auto failed = common::Result<int>::failure(common::ErrorKind::State, "nope");
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.error().kind == common::ErrorKind::State, "kind mismatch");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on a failure should throw");
                   }});

  tests.push_back({"make_temp_dir_and_remove_tree", [] {
                     const wiredrive::testing::TempWorkspace workspace;
                     const auto dir = common::make_temp_dir("wiredrive-unit", workspace.path());
                     require(dir.ok(), dir.ok() ? "" : dir.error().message);
                     require(common::starts_with(dir.value().filename().string(), "wiredrive-unit-"),
                             "prefix mismatch");
                     require(common::is_subpath(dir.value(), workspace.path()),
                             "temp dir should be under the parent");
                     std::filesystem::create_directories(dir.value() / "a" / "b");
                     require(common::remove_tree(dir.value()).ok(), "remove should succeed");
                     require(!std::filesystem::exists(dir.value()), "directory should be gone");
                   }});

  tests.push_back({"read_file_missing_is_io_error", [] {
                     const wiredrive::testing::TempWorkspace workspace;
                     const auto missing = common::read_file(workspace.path() / "nope.txt");
                     require(!missing.ok(), "missing file should fail");
                     require(missing.error().kind == common::ErrorKind::Io, "io error expected");
                   }});
}
