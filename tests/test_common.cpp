#include "test_framework.hpp"

#include "beeptunnel/common/cancellation.hpp"
#include "beeptunnel/common/crypto.hpp"
#include "beeptunnel/common/fs.hpp"
#include "beeptunnel/common/json_util.hpp"
#include "beeptunnel/common/result.hpp"
#include "beeptunnel/common/toml.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <thread>

void register_common_tests(std::vector<beeptunnel::tests::TestCase> &tests) {
  using beeptunnel::tests::require;
  namespace common = beeptunnel::common;

  tests.push_back({"result_failure_carries_code", [] {
                     auto failed = common::Result<int>::failure("bad port",
                                                                common::ErrorCode::ConfigValidation);
                     require(!failed.ok(), "failure should not be ok");
                     require(failed.code() == common::ErrorCode::ConfigValidation, "code kept");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");

                     auto carried = common::Result<std::string>::failure_from(failed);
                     require(carried.error() == "bad port", "message should carry over");
                     require(carried.code() == common::ErrorCode::ConfigValidation,
                             "code should carry over");
                   }});

  tests.push_back({"error_code_names_are_stable", [] {
                     require(common::error_code_name(common::ErrorCode::ChecksumMismatch) ==
                                 "checksum_mismatch",
                             "checksum name");
                     require(common::error_code_name(common::ErrorCode::TerminationTimeout) ==
                                 "termination_timeout",
                             "termination name");
                     require(common::is_client_error(common::ErrorCode::ConfigValidation),
                             "validation is a client error");
                     require(!common::is_client_error(common::ErrorCode::Network),
                             "network is not a client error");
                   }});

  tests.push_back({"json_escape_round_trips_control_characters", [] {
                     const std::string raw = "line\n\"quoted\"\t\\ \x01";
                     const std::string escaped = common::json_escape(raw);
                     require(escaped.find('\n') == std::string::npos, "newline escaped");
                     require(escaped.find("\\u0001") != std::string::npos, "control escaped");
                     require(common::json_unescape(escaped) == raw, "unescape restores input");
                   }});

  tests.push_back({"json_helpers_read_nested_release_fields", [] {
                     const std::string json =
                         R"({"tag_name": "v0.61.0", "draft": false, "assets": [)"
                         R"({"name": "a", "size": 10}, {"name": "b", "size": 20}]})";
                     require(common::json_get_string(json, "tag_name") == "v0.61.0", "tag");
                     require(common::json_get_bool(json, "draft") == false, "bool");
                     require(!common::json_get_bool(json, "missing").has_value(), "missing bool");
                     const auto objects =
                         common::json_split_top_level_objects(common::json_get_array(json, "assets"));
                     require(objects.size() == 2, "two assets expected");
                     require(common::json_get_number(objects[1], "size") == "20", "size");
                   }});

  tests.push_back({"toml_parses_sections_and_reports_bad_lines", [] {
                     const auto doc = common::parse_toml("# comment\n[relay]\nserver_port = 7001\n"
                                                         "token = \"a \\\"b\\\"\"\nenable_tls = false\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_int("relay.server_port", 0) == 7001, "int");
                     require(doc.value().get_string("relay.token") == "a \"b\"", "escaped string");
                     require(!doc.value().get_bool("relay.enable_tls", true), "bool");
                     require(doc.value().get_int("relay.missing", 5) == 5, "fallback");

                     const auto broken = common::parse_toml("[relay]\nnot a pair\n");
                     require(!broken.ok(), "line without '=' should fail");
                     require(broken.code() == common::ErrorCode::ConfigValidation, "code");
                   }});

  tests.push_back({"rfc3339_formats_and_parses_utc", [] {
                     const auto epoch = std::chrono::system_clock::from_time_t(1700000000);
                     const std::string text = common::format_rfc3339(epoch);
                     require(text == "2023-11-14T22:13:20Z", "unexpected format: " + text);
                     const auto parsed = common::parse_rfc3339(text);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value() == epoch, "parse should invert format");
                     require(!common::parse_rfc3339("yesterday").ok(), "garbage rejected");
                   }});

  tests.push_back({"write_file_atomic_replaces_content", [] {
                     beeptunnel::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "nested" / "state.json";
                     require(common::write_file_atomic(path, "first").ok(), "first write");
                     require(common::write_file_atomic(path, "second").ok(), "second write");
                     const auto content = common::read_file(path);
                     require(content.ok(), content.error());
                     require(content.value() == "second", "content should be replaced");
                     require(!std::filesystem::exists(path.string() + ".tmp"), "no temp left");
                     require(!common::read_file(workspace.path() / "absent").ok(),
                             "missing file should fail");
                   }});

  tests.push_back({"random_hex_has_requested_length", [] {
                     const auto a = common::random_hex(4);
                     const auto b = common::random_hex(4);
                     require(a.ok() && b.ok(), "RAND_bytes should succeed");
                     require(a.value().size() == 8, "4 bytes are 8 hex chars");
                     require(a.value().find_first_not_of("0123456789abcdef") == std::string::npos,
                             "lowercase hex only");
                     require(a.value() != b.value(), "two draws should differ");
                   }});

  tests.push_back({"cancellation_token_wakes_waiters", [] {
                     common::CancellationToken token;
                     require(!common::canceled(&token), "fresh token is not canceled");
                     require(!common::canceled(nullptr), "null token is never canceled");
                     require(!token.wait_for(std::chrono::milliseconds(10)), "wait should time out");

                     std::thread canceller([&token] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                       token.cancel();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     const bool woke = token.wait_for(std::chrono::seconds(5));
                     canceller.join();
                     require(woke, "cancel should wake the waiter");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(2),
                             "waiter should not sleep the full timeout");
                   }});
}
