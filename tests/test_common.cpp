#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sweguard/common/cancellation.hpp"
#include "sweguard/common/fs.hpp"
#include "sweguard/common/hash.hpp"
#include "sweguard/common/json_util.hpp"
#include "sweguard/common/toml.hpp"
#include "sweguard/patch/diff.hpp"

#include <filesystem>
#include <thread>

void register_common_tests(std::vector<sweguard::tests::TestCase> &tests) {
  using sweguard::tests::require;
  namespace common = sweguard::common;
  namespace patch = sweguard::patch;

  tests.push_back({"resolve_lexically_collapses_dot_segments", [] {
                     require(common::resolve_lexically("/workspace/repo", "src/../tests/./a.py") ==
                                 "/workspace/repo/tests/a.py",
                             "relative path should normalize under base");
                     require(common::resolve_lexically("/workspace/repo", "../../etc") == "/etc",
                             "parent segments may escape the base");
                     require(common::resolve_lexically("/workspace/repo", "/../..") == "/",
                             "root parent stays root");
                     require(common::resolve_lexically("/workspace/repo", "pkg/") ==
                                 "/workspace/repo/pkg",
                             "trailing separator should be dropped");
                   }});

  tests.push_back({"is_subpath_respects_component_boundaries", [] {
                     require(common::is_subpath("/workspace/repo/a", "/workspace/repo"),
                             "child should be inside parent");
                     require(common::is_subpath("/workspace/repo", "/workspace/repo"),
                             "a path is inside itself");
                     require(!common::is_subpath("/workspace/repository", "/workspace/repo"),
                             "sibling with shared prefix is not inside");
                     require(!common::is_subpath("/workspace", "/workspace/repo"),
                             "parent is not inside child");
                   }});

  tests.push_back({"shell_quote_leaves_safe_words_and_escapes_quotes", [] {
                     require(common::shell_quote("tests/test_a.py::test_b") ==
                                 "tests/test_a.py::test_b",
                             "safe word should stay bare");
                     require(common::shell_quote("a b") == "'a b'", "space needs quoting");
                     require(common::shell_quote("it's") == "'it'\\''s'",
                             "single quote should be spliced");
                     require(common::shell_quote("") == "''", "empty word should be quoted");
                   }});

  tests.push_back({"truncate_output_reports_dropped_bytes", [] {
                     require(common::truncate_output("short", 10) == "short",
                             "short output is kept");
                     const auto cut = common::truncate_output(std::string(25, 'x'), 10);
                     require(common::starts_with(cut, std::string(10, 'x') + "\n"),
                             "first bytes should be kept");
                     require(cut.find("[truncated 15 bytes]") != std::string::npos,
                             "note should name dropped bytes: " + cut);
                   }});

  tests.push_back({"write_file_atomic_round_trips_and_creates_parents", [] {
                     sweguard::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "nested" / "out.json";
                     const auto written = common::write_file_atomic(path, "{\"a\":1}\n");
                     require(written.ok(), written.error());
                     const auto read = common::read_file(path);
                     require(read.ok(), read.error());
                     require(read.value() == "{\"a\":1}\n", "content mismatch");
                   }});

  tests.push_back({"sha256_matches_known_vectors", [] {
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256(abc) mismatch");
                     require(common::sha256_hex("") ==
                                 "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
                             "sha256('') mismatch");
                   }});

  tests.push_back({"fingerprint_tree_tracks_content_permissions_and_names", [] {
                     sweguard::testing::TempWorkspace workspace;
                     workspace.create_file("a.py", "print(1)\n");
                     workspace.create_file("pkg/b.py", "x = 2\n");
                     const auto first = common::fingerprint_tree(workspace.path());
                     require(first.ok(), first.error());
                     const auto again = common::fingerprint_tree(workspace.path());
                     require(again.ok() && again.value() == first.value(),
                             "fingerprint should be stable");

                     workspace.create_file("pkg/b.py", "x = 3\n");
                     const auto edited = common::fingerprint_tree(workspace.path());
                     require(edited.ok() && edited.value() != first.value(),
                             "content change should alter fingerprint");

                     std::filesystem::permissions(workspace.path() / "a.py",
                                                  std::filesystem::perms::owner_exec,
                                                  std::filesystem::perm_options::add);
                     const auto chmodded = common::fingerprint_tree(workspace.path());
                     require(chmodded.ok() && chmodded.value() != edited.value(),
                             "mode change should alter fingerprint");

                     std::filesystem::rename(workspace.path() / "a.py", workspace.path() / "c.py");
                     const auto renamed = common::fingerprint_tree(workspace.path());
                     require(renamed.ok() && renamed.value() != chmodded.value(),
                             "rename should alter fingerprint");
                   }});

  tests.push_back({"json_parse_object_keeps_nested_values_raw", [] {
                     const auto parsed = common::json_parse_object(
                         R"({"action":"bash","content":"ls \"a b\"\n","usage":{"total_tokens":12},"n":null})");
                     require(parsed.ok(), parsed.error());
                     const auto &fields = parsed.value();
                     require(fields.at("action") == "bash", "action mismatch");
                     require(fields.at("content") == "ls \"a b\"\n", "escapes should be decoded");
                     require(fields.at("usage") == "{\"total_tokens\":12}",
                             "nested object should stay raw");
                     require(fields.at("n") == "null", "literal should stay raw");
                   }});

  tests.push_back({"json_parse_object_rejects_malformed_input", [] {
                     require(!common::json_parse_object("{\"a\":").ok(), "truncated object");
                     require(!common::json_parse_object("[1,2]").ok(), "array is not an object");
                     require(common::json_parse_flat("not json").empty(),
                             "lenient parse should return empty map");
                   }});

  tests.push_back({"json_string_arrays_round_trip_escapes", [] {
                     const std::vector<std::string> values = {"test_a (m.C)", "quote\"d",
                                                              "tab\there"};
                     const auto encoded = common::json_string_array(values);
                     const auto decoded = common::json_parse_string_array(encoded);
                     require(decoded.ok(), decoded.error());
                     require(decoded.value() == values, "array should round trip");
                     require(!common::json_parse_string_array("[1, 2]").ok(),
                             "non-string elements should be rejected");
                   }});

  tests.push_back({"json_split_top_level_objects_ignores_braces_in_strings", [] {
                     const auto objects = common::json_split_top_level_objects(
                         R"([{"a":"}{"},{"b":{"c":1}}])");
                     require(objects.size() == 2, "expected two objects");
                     require(objects[0] == R"({"a":"}{"})", "first object mismatch");
                     require(objects[1] == R"({"b":{"c":1}})", "second object mismatch");
                   }});

  tests.push_back({"json_unescape_handles_surrogate_pairs", [] {
                     require(common::json_unescape("\\u00e9") == "\xc3\xa9", "latin-1 escape");
                     require(common::json_unescape("\\ud83d\\ude00") == "\xf0\x9f\x98\x80",
                             "surrogate pair should become one code point");
                   }});

  tests.push_back({"toml_parses_sections_arrays_and_literals", [] {
                     const auto parsed = common::parse_toml(R"(
# comment
[run]
max_turns = 7
resume = true
dataset_path = 'C:\raw\path' # trailing comment

[sandbox]
cpu_limit = 1.5
setup_commands = [
  "pip install -e .",
  "pip install -r requirements.txt",
]
)");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_u64("run.max_turns", 0) == 7, "integer mismatch");
                     require(doc.get_bool("run.resume", false), "bool mismatch");
                     require(doc.get_string("run.dataset_path") == "C:\\raw\\path",
                             "literal string should keep backslashes");
                     require(doc.get_double("sandbox.cpu_limit", 0.0) == 1.5, "float mismatch");
                     const auto commands = doc.get_string_array("sandbox.setup_commands");
                     require(commands.size() == 2 && commands[1] == "pip install -r requirements.txt",
                             "multi-line array mismatch");
                     require(doc.get_u64("run.missing", 42) == 42, "fallback should apply");
                   }});

  tests.push_back({"toml_rejects_unterminated_section", [] {
                     require(!common::parse_toml("[run\nmax_turns = 1\n").ok(),
                             "broken header should fail");
                   }});

  tests.push_back({"deadline_clamps_budgets_and_expires", [] {
                     const auto never = common::Deadline::never();
                     require(!never.expired(), "never should not expire");
                     require(never.clamp(std::chrono::milliseconds(250)) ==
                                 std::chrono::milliseconds(250),
                             "never should not shrink budgets");

                     const auto soon = common::Deadline::after(std::chrono::milliseconds(20));
                     require(soon.clamp(std::chrono::seconds(30)) <= std::chrono::milliseconds(20),
                             "budget should shrink to time left");
                     std::this_thread::sleep_for(std::chrono::milliseconds(40));
                     require(soon.expired(), "deadline should expire");
                     require(soon.remaining() == std::chrono::milliseconds(0),
                             "expired deadline has nothing left");
                   }});

  tests.push_back({"cancellation_token_copies_share_state", [] {
                     common::CancellationToken token;
                     const auto copy = token;
                     require(!copy.is_cancelled(), "fresh token is not cancelled");
                     token.cancel();
                     require(copy.is_cancelled(), "copy should observe cancel");
                   }});

  tests.push_back({"diff_parser_reads_git_headers", [] {
                     const std::string diff = R"(diff --git a/src/calc.py b/src/calc.py
index 1111111..2222222 100644
--- a/src/calc.py
+++ b/src/calc.py
@@ -1,3 +1,3 @@
 def add(a, b):
---- not a header
+    return a + b
diff --git a/docs/new.md b/docs/new.md
new file mode 100644
--- /dev/null
+++ b/docs/new.md
@@ -0,0 +1 @@
+hello
diff --git a/old_name.py b/new_name.py
similarity index 100%
rename from old_name.py
rename to new_name.py
)";
                     const auto parsed = patch::parse_diff(diff);
                     require(parsed.ok(), parsed.error());
                     const auto &files = parsed.value();
                     require(files.size() == 3, "expected three files");
                     require(files[0].new_path == "src/calc.py" && files[0].hunks == 1,
                             "first file mismatch");
                     require(files[1].created && files[1].new_path == "docs/new.md",
                             "created file mismatch");
                     require(files[2].old_path == "old_name.py" && files[2].new_path == "new_name.py",
                             "rename mismatch");

                     const auto touched = patch::touched_paths(diff);
                     const std::vector<std::string> expected = {"docs/new.md", "new_name.py",
                                                                "old_name.py", "src/calc.py"};
                     require(touched == expected, "touched paths should be sorted and unique");
                   }});

  tests.push_back({"diff_parser_accepts_plain_unified_diffs", [] {
                     const std::string diff = "--- a/x.py\t2024-01-01 00:00:00\n"
                                              "+++ b/x.py\t2024-01-02 00:00:00\n"
                                              "@@ -1 +1 @@\n-a\n+b\n";
                     const auto touched = patch::touched_paths(diff);
                     require(touched.size() == 1 && touched[0] == "x.py",
                             "timestamped header should reduce to x.py");
                     require(!patch::parse_diff("just some text\n").ok(),
                             "text without headers is not a diff");
                   }});
}
