#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/common/hash.hpp"
#include "sweguard/sandbox/docker_runtime.hpp"
#include "sweguard/sandbox/factory.hpp"
#include "sweguard/sandbox/local_runtime.hpp"
#include "sweguard/sandbox/manager.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <sys/resource.h>
#include <unistd.h>

namespace {

namespace fs = std::filesystem;
namespace sb = sweguard::sandbox;
using sweguard::testing::exec_result;
using sweguard::testing::FakeExecCall;
using sweguard::testing::FakeProcessRunner;
using sweguard::testing::FakeRuntime;

constexpr auto TIMEOUT = std::chrono::milliseconds(5'000);

struct ManagerFixture {
  std::shared_ptr<FakeRuntime> runtime = std::make_shared<FakeRuntime>();
  sb::SandboxManager manager{sweguard::testing::test_config().sandbox, runtime};
};

sb::RuntimeHandle local_handle(const sb::LocalRuntime &runtime, const std::string &id) {
  return sb::RuntimeHandle{
      .id = id, .root = runtime.sandbox_dir(id), .container = "", .image = ""};
}

bool owner_can_write(const fs::path &path) {
  return (fs::status(path).permissions() & fs::perms::owner_write) != fs::perms::none;
}

bool anyone_can_write(const fs::path &path) {
  constexpr auto write_bits =
      fs::perms::owner_write | fs::perms::group_write | fs::perms::others_write;
  return (fs::status(path).permissions() & write_bits) != fs::perms::none;
}

long cpu_millis(const rusage &usage) {
  return (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000L +
         (usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1000L;
}

sb::ProcessResult process_result(const int exit_code, std::string stderr_text = "") {
  sb::ProcessResult result;
  result.exit_code = exit_code;
  result.stderr_text = std::move(stderr_text);
  return result;
}

} // namespace

void register_sandbox_tests(std::vector<sweguard::tests::TestCase> &tests) {
  using sweguard::tests::require;

  tests.push_back({"manager_provisions_read_only_main_and_writable_validation", [] {
                     ManagerFixture fixture;
                     const auto task = sweguard::testing::sample_task();

                     auto main = fixture.manager.provision_main(task);
                     require(main.ok(), main.error());
                     require(main.value().kind == sb::SandboxKind::Main, "main kind");
                     require(!main.value().writable, "main sandbox must be read-only");
                     require(fixture.runtime->is_read_only(main.value().id),
                             "runtime should have been asked to lock the tree");
                     require(main.value().ancestry_ceiling == task.base_commit, "ceiling");
                     require(main.value().working_dir == main.value().root, "starts at root");
                     require(main.value().id.find("demo__calc-1-main-") == 0,
                             "id should name the instance: " + main.value().id);

                     auto validation = fixture.manager.provision_validation(task);
                     require(validation.ok(), validation.error());
                     require(validation.value().writable, "validation sandbox is writable");
                     require(!fixture.runtime->is_read_only(validation.value().id),
                             "validation tree stays writable");
                     require(validation.value().id != main.value().id, "distinct ids");
                     require(fixture.manager.live_count() == 2, "two live sandboxes");
                   }});

  tests.push_back({"manager_snapshot_is_writable_and_keeps_relative_directory", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     main.value().working_dir = main.value().root / "tests";

                     auto snapshot = fixture.manager.snapshot(main.value());
                     require(snapshot.ok(), snapshot.error());
                     require(snapshot.value().kind == sb::SandboxKind::Ephemeral, "kind");
                     require(snapshot.value().writable, "snapshot is writable");
                     require(snapshot.value().working_dir == snapshot.value().root / "tests",
                             "snapshot starts in the same relative directory");
                     require(snapshot.value().id.find("demo__calc-1-ephemeral-") == 0,
                             "snapshot id: " + snapshot.value().id);
                     require(fixture.runtime->snapshot_count() == 1, "one runtime snapshot");
                     require(fixture.manager.live_count() == 2, "main and snapshot live");
                   }});

  tests.push_back({"manager_snapshot_failure_leaves_nothing_live", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     fixture.runtime->fail_snapshot("disk full");
                     const auto snapshot = fixture.manager.snapshot(main.value());
                     require(!snapshot.ok(), "snapshot should fail");
                     require(snapshot.error().find("disk full") != std::string::npos,
                             snapshot.error());
                     require(fixture.manager.live_count() == 1, "only main is live");
                   }});

  tests.push_back({"manager_destroy_is_idempotent", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     require(fixture.manager.destroy(main.value()).ok(), "first destroy");
                     require(fixture.manager.destroy(main.value()).ok(), "second destroy");
                     require(fixture.runtime->destroyed().size() == 1,
                             "runtime destroy must run exactly once");
                     require(fixture.manager.live_count() == 0, "nothing live");
                     require(!fixture.manager.snapshot(main.value()).ok(),
                             "a destroyed sandbox cannot be snapshotted");
                   }});

  tests.push_back({"scoped_sandbox_destroys_on_scope_exit", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     const std::string id = main.value().id;
                     {
                       sb::ScopedSandbox scoped(fixture.manager, std::move(main.value()));
                       require(fixture.manager.is_live(id), "live inside scope");
                     }
                     require(!fixture.manager.is_live(id), "destroyed after scope");
                     require(fixture.runtime->live_handles().empty(), "runtime released it");
                   }});

  tests.push_back({"manager_provision_failure_reports_clone_error", [] {
                     ManagerFixture fixture;
                     fixture.runtime->fail_clone("repository not found");
                     const auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(!main.ok(), "provision should fail");
                     require(main.error().find("provisioning failed: repository not found") == 0,
                             main.error());
                     require(fixture.manager.live_count() == 0, "nothing live");
                   }});

  tests.push_back({"manager_execute_tracks_working_directory_from_trailer", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     auto &sandbox = main.value();

                     fixture.runtime->on_command(
                         "cd tests", exec_result(0, "ok\n",
                                                 std::string("warn\n") + sb::PWD_MARKER +
                                                     "/workspace/repo/tests\n"));
                     const auto moved = fixture.manager.execute(sandbox, "cd tests && echo ok",
                                                                TIMEOUT, {});
                     require(moved.ok(), moved.error());
                     require(moved.value().stderr_text == "warn", "trailer must be stripped: '" +
                                                                     moved.value().stderr_text + "'");
                     require(sandbox.working_dir == "/workspace/repo/tests", "cwd should follow cd");
                     require(moved.value().working_dir == sandbox.working_dir, "reported cwd");

                     fixture.runtime->on_command(
                         "pwd", exec_result(0, "/workspace/repo/tests\n",
                                            std::string("\n") + sb::PWD_MARKER + "/etc\n"));
                     const auto escaped = fixture.manager.execute(sandbox, "pwd", TIMEOUT, {});
                     require(escaped.ok(), escaped.error());
                     require(sandbox.working_dir == "/workspace/repo/tests",
                             "a directory outside the root is ignored");

                     const auto calls = fixture.runtime->calls();
                     require(calls.back().workdir == "/workspace/repo/tests",
                             "commands run from the tracked directory");
                   }});

  tests.push_back({"manager_execute_truncates_unless_full_output", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     fixture.runtime->on_command("big",
                                                 exec_result(0, std::string(20'000, 'x'),
                                                             std::string(5'000, 'e')));

                     const auto capped = fixture.manager.execute(main.value(), "big", TIMEOUT, {});
                     require(capped.ok(), capped.error());
                     require(capped.value().stdout_text.find("[truncated 10000 bytes]") !=
                                 std::string::npos,
                             "stdout should carry the truncation marker");
                     require(capped.value().stdout_text.size() < 10'100, "stdout capped");
                     require(capped.value().stderr_text.find("[truncated 3000 bytes]") !=
                                 std::string::npos,
                             "stderr capped at its own limit");

                     const auto full =
                         fixture.manager.execute(main.value(), "big", TIMEOUT, {}, "", true);
                     require(full.ok(), full.error());
                     require(full.value().stdout_text.size() == 20'000, "full stdout");
                     require(full.value().stderr_text.size() == 5'000, "full stderr");
                   }});

  tests.push_back({"manager_execute_appends_timeout_note", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     fixture.runtime->on_command("sleep", [](const FakeExecCall &) {
                       auto result = exec_result(124, "", "partial");
                       result.timed_out = true;
                       return result;
                     });
                     const auto ran = fixture.manager.execute(
                         main.value(), "sleep 100", std::chrono::milliseconds(1'500), {});
                     require(ran.ok(), ran.error());
                     require(ran.value().timed_out, "timed out flag");
                     require(ran.value().stderr_text == "partial\nCommand timed out after 2s",
                             "timeout note: " + ran.value().stderr_text);
                   }});

  tests.push_back({"manager_execute_passes_stdin_and_rejects_dead_sandboxes", [] {
                     ManagerFixture fixture;
                     auto main = fixture.manager.provision_main(sweguard::testing::sample_task());
                     require(main.ok(), main.error());
                     const auto ran =
                         fixture.manager.execute(main.value(), "git apply -", TIMEOUT, {}, "diff");
                     require(ran.ok(), ran.error());
                     require(fixture.runtime->calls().back().stdin_data == "diff", "stdin forwarded");
                     require(fixture.runtime->calls().back().command == "git apply -",
                             "command reaches the runtime unchanged");

                     require(fixture.manager.destroy(main.value()).ok(), "destroy");
                     const auto dead = fixture.manager.execute(main.value(), "ls", TIMEOUT, {});
                     require(!dead.ok(), "execute on a destroyed sandbox must fail");
                   }});

  tests.push_back({"strip_pwd_trailer_handles_missing_marker", [] {
                     std::string with_marker =
                         std::string("boom\n\n") + sb::PWD_MARKER + "/workspace/repo/src\n";
                     const auto directory = sb::strip_pwd_trailer(with_marker);
                     require(directory.has_value() && *directory == "/workspace/repo/src",
                             "directory parsed");
                     require(with_marker == "boom\n", "stderr restored: '" + with_marker + "'");

                     std::string plain = "no trailer here";
                     require(!sb::strip_pwd_trailer(plain).has_value(), "no marker");
                     require(plain == "no trailer here", "untouched");
                   }});

  tests.push_back({"runtime_scripts_render_expected_commands", [] {
                     require(sb::render_repo_url("https://github.com/{repo}.git", "psf/requests") ==
                                 "https://github.com/psf/requests.git",
                             "repo url");
                     const auto prune = sb::prune_history_script("abc123");
                     require(prune.find("git checkout --quiet --force --detach abc123") !=
                                 std::string::npos,
                             "detach at base commit");
                     require(prune.find("reflog expire --expire=now --all") != std::string::npos,
                             "reflog expired");
                     require(prune.find("git remote remove") != std::string::npos, "remotes dropped");

                     sb::CloneRequest request;
                     request.repo_url = "/srv/repos/calc";
                     request.base_commit = "abc123";
                     const auto clone = sb::clone_script(request);
                     require(clone.find("git clone --quiet /srv/repos/calc .") != std::string::npos,
                             "clone into cwd");
                     require(clone.find("git checkout --quiet abc123") != std::string::npos,
                             "setup commit defaults to base commit");
                     request.repo_url = "/srv/repos/my calc";
                     require(sb::clone_script(request).find("git clone --quiet '/srv/repos/my calc' .") !=
                                 std::string::npos,
                             "unsafe words are quoted");

                     require(sb::read_only_script("/workspace/repo", true) ==
                                 "chmod -R a-w /workspace/repo && chmod -R a+rX /workspace/repo",
                             "lock without owner");
                     require(sb::read_only_script("/workspace/repo", true, "sweguard") ==
                                 "chown -R root:root /workspace/repo && chmod -R a-w /workspace/repo "
                                 "&& chmod -R a+rX /workspace/repo",
                             "locked tree goes back to root");
                     require(sb::read_only_script("/workspace/repo", false, "sweguard") ==
                                 "chown -R sweguard /workspace/repo && chmod -R u+w /workspace/repo",
                             "writable tree goes to the sandbox user");
                     require(sb::is_timeout_exit(124) && sb::is_timeout_exit(137) &&
                                 !sb::is_timeout_exit(1),
                             "timeout exit codes");
                   }});

  tests.push_back({"set_tree_read_only_toggles_write_bits", [] {
                     sweguard::testing::TempWorkspace workspace;
                     workspace.create_file("tree/a.py", "print('a')\n");
                     workspace.create_file("tree/pkg/b.py", "print('b')\n");
                     const auto tree = workspace.path() / "tree";

                     require(sb::set_tree_read_only(tree, true).ok(), "lock");
                     require(!anyone_can_write(tree / "a.py"), "file locked");
                     require(!anyone_can_write(tree / "pkg"), "directory locked");
                     require(!anyone_can_write(tree), "root locked");
                     require((fs::status(tree / "pkg").permissions() & fs::perms::others_exec) !=
                                 fs::perms::none,
                             "directories stay traversable");

                     require(sb::set_tree_read_only(tree, false).ok(), "unlock");
                     require(owner_can_write(tree / "pkg" / "b.py"), "file writable again");
                     require(owner_can_write(tree), "root writable again");
                   }});

  tests.push_back({"copy_tree_writable_copies_locked_tree", [] {
                     sweguard::testing::TempWorkspace workspace;
                     workspace.create_file("src/calc.py", "def add(a, b):\n    return a - b\n");
                     workspace.create_file("src/tests/test_calc.py", "from calc import add\n");
                     const auto source = workspace.path() / "src";
                     const auto before = sweguard::common::fingerprint_tree(source);
                     require(before.ok(), before.error());
                     require(sb::set_tree_read_only(source, true).ok(), "lock source");

                     const auto copy = workspace.path() / "copy";
                     require(sb::copy_tree_writable(source, copy).ok(), "copy");
                     require(owner_can_write(copy / "calc.py"), "copy is writable");
                     const auto copied = sweguard::common::read_file(copy / "tests" / "test_calc.py");
                     require(copied.ok() && copied.value() == "from calc import add\n",
                             "content copied");
                     require(!sb::copy_tree_writable(source, copy).ok(),
                             "existing destination is rejected");
                   }});

  tests.push_back({"local_runtime_executes_in_workdir_and_reports_exit", [] {
                     sweguard::testing::TempWorkspace workspace;
                     auto config = sweguard::testing::test_config().sandbox;
                     config.local_root = (workspace.path() / "sandboxes").string();
                     sb::LocalRuntime runtime(config);
                     const auto handle = local_handle(runtime, "Demo__Calc-1-main-abc");
                     require(handle.root == workspace.path() / "sandboxes" / "demo__calc-1-main-abc",
                             "sandbox dir is docker-safe: " + handle.root.string());
                     fs::create_directories(handle.root / "sub");

                     const auto ran = runtime.execute(
                         handle, sb::ExecRequest{.command = "pwd; echo oops >&2; cat; exit 3",
                                                 .workdir = handle.root / "sub",
                                                 .timeout = TIMEOUT,
                                                 .stdin_data = "piped",
                                                 .env = {{"HOME", handle.root.string()}},
                                                 .cancel = {}});
                     require(ran.ok(), ran.error());
                     require(ran.value().exit_code == 3, "exit code");
                     require(ran.value().stdout_text.find("/sub\npiped") != std::string::npos,
                             "stdout: " + ran.value().stdout_text);
                     require(sweguard::common::trim(ran.value().stderr_text) == "oops", "stderr");

                     const auto slow = runtime.execute(
                         handle, sb::ExecRequest{.command = "sleep 5",
                                                 .workdir = {},
                                                 .timeout = std::chrono::milliseconds(200),
                                                 .stdin_data = "",
                                                 .env = {},
                                                 .cancel = {}});
                     require(slow.ok(), slow.error());
                     require(slow.value().timed_out, "sleep should time out");

                     require(runtime.destroy(handle).ok(), "destroy");
                     require(!fs::exists(handle.root), "sandbox dir removed");
                     require(!runtime.execute(handle, sb::ExecRequest{.command = "true"}).ok(),
                             "execute after destroy fails");
                   }});

  tests.push_back({"local_runtime_snapshot_and_destroy_stay_inside_root", [] {
                     sweguard::testing::TempWorkspace workspace;
                     auto config = sweguard::testing::test_config().sandbox;
                     config.local_root = (workspace.path() / "sandboxes").string();
                     sb::LocalRuntime runtime(config);
                     const auto main = local_handle(runtime, "calc-main");
                     workspace.create_file("sandboxes/calc-main/calc.py", "x = 1\n");
                     require(runtime.set_read_only(main, true).ok(), "lock main");
                     const auto fingerprint = sweguard::common::fingerprint_tree(main.root);
                     require(fingerprint.ok(), fingerprint.error());

                     auto snapshot = runtime.snapshot(main, "calc-ephemeral");
                     require(snapshot.ok(), snapshot.error());
                     const auto wrote = runtime.execute(
                         snapshot.value(), sb::ExecRequest{.command = "echo 'x = 2' > calc.py",
                                                           .workdir = snapshot.value().root});
                     require(wrote.ok() && wrote.value().exit_code == 0, "write in snapshot");
                     require(runtime.destroy(snapshot.value()).ok(), "destroy snapshot");
                     require(!fs::exists(snapshot.value().root), "snapshot removed");

                     const auto after = sweguard::common::fingerprint_tree(main.root);
                     require(after.ok() && after.value() == fingerprint.value(),
                             "main tree unchanged by snapshot writes");

                     const sb::RuntimeHandle outside{
                         .id = "x", .root = workspace.path(), .container = "", .image = ""};
                     require(!runtime.destroy(outside).ok(), "refuses to remove outside root");
                     require(fs::exists(workspace.path()), "outside dir intact");
                     const sb::RuntimeHandle root_itself{
                         .id = "x", .root = runtime.root_dir(), .container = "", .image = ""};
                     require(!runtime.destroy(root_itself).ok(), "refuses to remove the root");

                     require(runtime.destroy(main).ok(), "destroy read-only main");
                     require(!fs::exists(main.root), "main removed");
                   }});

  tests.push_back({"docker_runtime_builds_container_arguments", [] {
                     auto config = sweguard::testing::test_config().sandbox;
                     config.runtime = "docker";
                     sb::DockerRuntime runtime(config, std::make_shared<FakeProcessRunner>());

                     require(runtime.image_for("3.9") == "sweguard-bash:3.9", "image tag");
                     require(runtime.image_for("") == "sweguard-bash:latest", "default tag");
                     require(runtime.container_name("Demo__Calc-1/main") == "sweguard-demo__calc-1-main",
                             "container name: " + runtime.container_name("Demo__Calc-1/main"));

                     const std::vector<std::string> run = {
                         "run",       "-d",     "--name",     "c1",    "--memory",
                         "4g",        "--cpus", "2",          "--network", "bridge",
                         "-w",        "/workspace", "img:3.9", "tail", "-f",
                         "/dev/null"};
                     require(runtime.build_run_args("c1", "img:3.9", true) == run, "run args");
                     const auto isolated = runtime.build_run_args("c1", "img:3.9", false);
                     require(isolated[9] == "none", "snapshot containers start without network");

                     const sb::RuntimeHandle handle{
                         .id = "s1", .root = "/workspace/repo", .container = "c1", .image = ""};
                     const std::vector<std::string> exec = {
                         "exec",     "-i", "--user", "65534", "-w", "/workspace/repo/tests",
                         "-e",       "HOME=/root", "c1", "timeout", "-k", "1",
                         "3",        "bash", "-c", "ls"};
                     require(runtime.build_exec_args(
                                 handle, sb::ExecRequest{.command = "ls",
                                                         .workdir = "/workspace/repo/tests",
                                                         .timeout = std::chrono::milliseconds(2'500),
                                                         .stdin_data = "x",
                                                         .env = {{"HOME", "/root"}},
                                                         .cancel = {}}) == exec,
                             "exec args");
                     const auto privileged = runtime.build_exec_args(
                         handle, sb::ExecRequest{.command = "chmod -R a-w /workspace/repo"}, true);
                     require(std::find(privileged.begin(), privileged.end(), "--user") ==
                                 privileged.end(),
                             "provisioning commands keep the container's root account");
                   }});

  tests.push_back({"docker_runtime_clone_runs_in_order_and_isolates_network", [] {
                     auto runner = std::make_shared<FakeProcessRunner>();
                     auto config = sweguard::testing::test_config().sandbox;
                     config.setup_commands = {"pip install -e .", "pip install -r requirements.txt"};
                     sb::DockerRuntime runtime(config, runner);
                     runner->on_command("pip install -e .", process_result(1, "no setup.py"));

                     sb::CloneRequest request;
                     request.sandbox_id = "demo-main-1";
                     request.repo_url = "https://github.com/demo/calc.git";
                     request.base_commit = "abc123";
                     request.runtime_version = "3.9";
                     request.setup_commands = config.setup_commands;
                     const auto cloned = runtime.clone_repository(request);
                     require(cloned.ok(), cloned.error());
                     require(cloned.value().handle.container == "sweguard-demo-main-1", "container");
                     require(cloned.value().handle.root == "/workspace/repo", "root");
                     require(cloned.value().setup_warnings.size() == 1, "one setup warning");

                     const auto calls = runner->calls();
                     std::vector<std::string> lines;
                     for (const auto &call : calls) {
                       lines.push_back(sb::join_args(call.argv));
                     }
                     require(lines.size() == 9, "docker calls: " + std::to_string(lines.size()));
                     require(lines[0] == "docker image inspect sweguard-bash:3.9", lines[0]);
                     require(lines[1].find("docker run -d --name sweguard-demo-main-1") == 0, lines[1]);
                     require(lines[2].find("mkdir -p") != std::string::npos, lines[2]);
                     require(lines[3].find("git clone --quiet") != std::string::npos, lines[3]);
                     require(lines[4].find("pip install -e .") != std::string::npos, lines[4]);
                     require(lines[5].find("pip install -r requirements.txt") != std::string::npos,
                             lines[5]);
                     require(lines[6].find("--detach abc123") != std::string::npos, lines[6]);
                     require(lines[7].find("chown -R 65534 /workspace/repo") != std::string::npos,
                             "tree handed to the sandbox user: " + lines[7]);
                     require(lines[7].find("--user") == std::string::npos,
                             "ownership change runs as root: " + lines[7]);
                     require(lines[8] == "docker network disconnect -f bridge sweguard-demo-main-1",
                             lines[8]);
                   }});

  tests.push_back({"docker_runtime_requires_image_or_dockerfile", [] {
                     auto runner = std::make_shared<FakeProcessRunner>();
                     runner->on_command("image inspect", process_result(1, "No such image"));
                     sb::DockerRuntime runtime(sweguard::testing::test_config().sandbox, runner);
                     sb::CloneRequest request;
                     request.sandbox_id = "demo";
                     request.runtime_version = "3.9";
                     const auto cloned = runtime.clone_repository(request);
                     require(!cloned.ok(), "missing image must fail");
                     require(cloned.error().find("sandbox.dockerfile") != std::string::npos,
                             cloned.error());
                     require(runner->count_calls("docker run") == 0, "no container started");
                   }});

  tests.push_back({"docker_runtime_snapshot_and_destroy", [] {
                     auto runner = std::make_shared<FakeProcessRunner>();
                     sb::DockerRuntime runtime(sweguard::testing::test_config().sandbox, runner);
                     const sb::RuntimeHandle main{.id = "m",
                                                  .root = "/workspace/repo",
                                                  .container = "sweguard-m",
                                                  .image = ""};
                     auto snapshot = runtime.snapshot(main, "Snap-1");
                     require(snapshot.ok(), snapshot.error());
                     require(snapshot.value().image == "sweguard-snapshot-snap-1", "snapshot image");
                     require(runner->count_calls("docker commit sweguard-m sweguard-snapshot-snap-1") ==
                                 1,
                             "commit issued");
                     require(runner->count_calls("--network none") == 1,
                             "snapshot container has no network");
                     require(runner->count_calls("chown -R 65534 /workspace/repo") == 1,
                             "snapshot tree is writable by the sandbox user");

                     runner->on_command("docker rm -f",
                                        process_result(1, "Error: No such container: sweguard-snap-1"));
                     require(runtime.destroy(snapshot.value()).ok(), "missing container tolerated");
                     require(runner->count_calls("docker rmi -f sweguard-snapshot-snap-1") == 1,
                             "snapshot image removed");

                     runner->on_command("docker rm -f", process_result(1, "permission denied"));
                     require(!runtime.destroy(main).ok(), "other rm failures surface");
                   }});

  tests.push_back({"docker_runtime_execute_maps_timeouts_and_daemon_errors", [] {
                     auto runner = std::make_shared<FakeProcessRunner>();
                     sb::DockerRuntime runtime(sweguard::testing::test_config().sandbox, runner);
                     const sb::RuntimeHandle handle{
                         .id = "s", .root = "/workspace/repo", .container = "c", .image = ""};

                     runner->on_command("sleep", process_result(124));
                     const auto slow = runtime.execute(handle, sb::ExecRequest{.command = "sleep 9"});
                     require(slow.ok(), slow.error());
                     require(slow.value().timed_out, "exit 124 is a timeout");

                     runner->on_command("ls", process_result(2, "ls: cannot access 'x'"));
                     const auto failed = runtime.execute(handle, sb::ExecRequest{.command = "ls x"});
                     require(failed.ok() && failed.value().exit_code == 2 && !failed.value().timed_out,
                             "ordinary failures are results");

                     runner->on_command("cat",
                                        process_result(1, "Error response from daemon: container c is not running"));
                     require(!runtime.execute(handle, sb::ExecRequest{.command = "cat a"}).ok(),
                             "daemon errors are failures");
                   }});

  tests.push_back({"create_runtime_selects_substrate", [] {
                     auto config = sweguard::testing::test_config().sandbox;
                     config.runtime = "docker";
                     const auto docker = sb::create_runtime(config);
                     require(docker.ok() && docker.value()->name() == "docker", "docker runtime");
                     config.runtime = " LOCAL ";
                     const auto local = sb::create_runtime(config);
                     require(local.ok() && local.value()->name() == "local", "local runtime");
                     config.runtime = "podman";
                     const auto unknown = sb::create_runtime(config);
                     require(!unknown.ok(), "unknown runtime rejected");
                     require(unknown.error().find("podman") != std::string::npos, unknown.error());
                   }});

  tests.push_back({"process_runner_idles_after_child_closes_stdout", [] {
                     sb::PosixProcessRunner runner;
                     rusage before{};
                     (void)getrusage(RUSAGE_SELF, &before);
                     const auto ran = runner.run(
                         {"bash", "-c", "echo early; exec >&-; sleep 1; echo late >&2"},
                         sb::ProcessOptions{.allow_failure = true, .timeout = TIMEOUT});
                     rusage after{};
                     (void)getrusage(RUSAGE_SELF, &after);

                     require(ran.ok(), ran.error());
                     require(ran.value().exit_code == 0, "exit code");
                     require(ran.value().stdout_text == "early\n", "stdout: " + ran.value().stdout_text);
                     require(ran.value().stderr_text == "late\n", "stderr: " + ran.value().stderr_text);
                     require(ran.value().duration >= std::chrono::milliseconds(900),
                             "waited for the child");
                     const long spent = cpu_millis(after) - cpu_millis(before);
                     require(spent < 400, "parent burned " + std::to_string(spent) +
                                              "ms of CPU while the child slept");
                   }});

  tests.push_back({"resolve_credentials_accepts_names_and_numeric_ids", [] {
                     const auto numeric = sb::resolve_credentials("65534");
                     require(numeric.ok() && numeric.value().uid == 65534 &&
                                 numeric.value().gid == 65534,
                             "numeric uid");
                     const auto root = sb::resolve_credentials("root");
                     require(root.ok() && root.value().uid == 0, "root by name");
                     require(!sb::resolve_credentials("no-such-sweguard-user").ok(), "unknown user");
                     require(!sb::resolve_credentials("").ok(), "empty user");
                   }});

  tests.push_back({"local_runtime_runs_agent_commands_unprivileged", [] {
                     sweguard::testing::TempWorkspace workspace;
                     auto config = sweguard::testing::test_config().sandbox;
                     config.local_root = (workspace.path() / "sandboxes").string();
                     sb::LocalRuntime runtime(config);
                     const auto main = local_handle(runtime, "calc-main");
                     workspace.create_file("sandboxes/calc-main/tests/test_calc.py", "x = 1\n");

                     const auto who =
                         runtime.execute(main, sb::ExecRequest{.command = "id -u", .workdir = main.root});
                     require(who.ok(), who.error());
                     const std::string uid = sweguard::common::trim(who.value().stdout_text);
                     if (geteuid() != 0) {
                       require(!runtime.run_as().has_value(), "no identity switch without root");
                       require(uid == std::to_string(geteuid()), "caller identity kept: " + uid);
                       return;
                     }

                     require(uid == "65534", "agent commands drop root: " + uid);
                     require(runtime.set_read_only(main, true).ok(), "lock main");
                     const auto removed = runtime.execute(
                         main, sb::ExecRequest{.command = "rm -f tests/test_calc.py",
                                               .workdir = main.root});
                     require(removed.ok() && removed.value().exit_code != 0,
                             "removal inside read-only main fails");
                     require(fs::exists(main.root / "tests" / "test_calc.py"),
                             "test file survives");

                     auto snapshot = runtime.snapshot(main, "calc-ephemeral");
                     require(snapshot.ok(), snapshot.error());
                     const auto wrote = runtime.execute(
                         snapshot.value(),
                         sb::ExecRequest{.command = "echo 'x = 2' > tests/test_calc.py",
                                         .workdir = snapshot.value().root});
                     require(wrote.ok() && wrote.value().exit_code == 0,
                             "snapshot belongs to the sandbox user");

                     config.user = "no-such-sweguard-user";
                     sb::LocalRuntime refusing(config);
                     const auto refused =
                         refusing.execute(main, sb::ExecRequest{.command = "true", .workdir = main.root});
                     require(!refused.ok() && refused.error().find("refusing") != std::string::npos,
                             "unknown sandbox user is not replaced by root");
                   }});
}
