#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "rmount/common/fs.hpp"
#include "rmount/common/json.hpp"
#include "rmount/common/random.hpp"
#include "rmount/common/result.hpp"

#include <cstdlib>
#include <filesystem>
#include <set>
#include <stdexcept>

void register_common_tests(std::vector<rmount::tests::TestCase> &tests) {
  using rmount::tests::require;
  using rmount::tests::require_ok;
  namespace common = rmount::common;

  tests.push_back({"common_result_carries_error_code", [] {
                     auto failed = common::Result<int>::failure(common::ErrorCode::MountLost,
                                                                "gone");
                     require(!failed.ok(), "failure");
                     require(failed.status().code() == common::ErrorCode::MountLost, "status code");
                     require(common::error_code_name(failed.code()) == "mount_lost", "code name");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure throws");
                     require(common::Result<int>::success(7).value() == 7, "success value");
                     require(common::Status::success().ok(), "status success");
                   }});

  tests.push_back({"common_normalize_mountpoint", [] {
                     require(common::normalize_mountpoint("/mnt/a/").string() == "/mnt/a",
                             "trailing slash");
                     require(common::normalize_mountpoint("/mnt/./b/../a").string() == "/mnt/a",
                             "dot segments");
                     require(common::normalize_mountpoint("/").string() == "/", "root kept");
                     require(common::normalize_mountpoint("rel").is_absolute(), "made absolute");
                   }});

  tests.push_back({"common_split_assignment_and_join", [] {
                     const auto pair = common::split_assignment("KEY=a=b");
                     require(pair.has_value() && pair->first == "KEY" && pair->second == "a=b",
                             "split on first equals");
                     require(!common::split_assignment("novalue").has_value(), "no equals");
                     require(common::join_args({"rclone", "mount", "/mnt/a"}) ==
                                 "rclone mount /mnt/a",
                             "space separated");
                   }});

  tests.push_back({"common_json_escape", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "escapes");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control chars");
                     require(common::json_quote("x") == "\"x\"", "quoted");
                   }});

  tests.push_back({"common_random_uuid_format", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 16; ++i) {
                       const auto uuid = common::random_uuid();
                       require(uuid.size() == 36, "length");
                       require(uuid[8] == '-' && uuid[13] == '-' && uuid[18] == '-' &&
                                   uuid[23] == '-',
                               "dashes");
                       require(uuid[14] == '4', "version 4");
                       seen.insert(uuid);
                     }
                     require(seen.size() == 16, "unique");
                     require(common::random_hex(4).size() == 8, "hex length");
                   }});

  tests.push_back({"common_ensure_dir_creates_nested", [] {
                     rmount::testing::TempWorkspace workspace;
                     auto made = common::ensure_dir(workspace.path() / "a" / "b");
                     require_ok(made);
                     require(std::filesystem::is_directory(made.value()), "created");
                   }});

  tests.push_back({"common_ensure_dir_restricts_leaf_mode", [] {
                     rmount::testing::TempWorkspace workspace;
                     const auto dir = workspace.path() / "private";
                     auto made = common::ensure_dir(dir, std::filesystem::perms::owner_all);
                     require_ok(made);
                     const auto perms = std::filesystem::status(dir).permissions();
                     require((perms & std::filesystem::perms::group_all) ==
                                 std::filesystem::perms::none,
                             "group bits cleared");
                     require((perms & std::filesystem::perms::others_all) ==
                                 std::filesystem::perms::none,
                             "other bits cleared");

                     workspace.create_file("plain", "x");
                     require(!common::ensure_dir(workspace.path() / "plain").ok(),
                             "a file is not a directory");
                   }});

  tests.push_back({"common_expand_path_substitutes_variables", [] {
                     setenv("RMOUNT_TEST_EXPAND", "/srv/data", 1);
                     unsetenv("RMOUNT_TEST_UNSET");
                     require(common::expand_path("$RMOUNT_TEST_EXPAND/a") == "/srv/data/a",
                             "bare variable");
                     require(common::expand_path("${RMOUNT_TEST_EXPAND}x") == "/srv/datax",
                             "braced variable");
                     require(common::expand_path("/m/$RMOUNT_TEST_UNSET/b") == "/m//b",
                             "unset expands to nothing");
                     require(common::expand_path("cost$") == "cost$", "trailing dollar kept");
                     require(common::expand_path("${open") == "${open", "unclosed brace kept");
                     require(common::expand_path("~user/x") == "~user/x", "only bare tilde");
                     unsetenv("RMOUNT_TEST_EXPAND");
                   }});
}
