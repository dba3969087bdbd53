#include "test_framework.hpp"

#include "sandcastle/providers/e2b.hpp"
#include "sandcastle/providers/factory.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

void register_e2b_tests(std::vector<sandcastle::tests::TestCase> &tests) {
  using sandcastle::tests::require;
  namespace providers = sandcastle::providers;
  namespace common = sandcastle::common;

  tests.push_back({"e2b_factory_creates_base_path", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     require(!std::filesystem::exists(config.e2b.base_path), "not yet created");
                     const auto created = providers::create_e2b_provider(config.e2b);
                     require(created.ok(), created.error());
                     require(std::filesystem::is_directory(config.e2b.base_path), "directory made");
                     require(created.value()->name() == "e2b", "provider name");
                   }});

  tests.push_back({"e2b_factory_warns_about_local_stub", [] {
                     sandcastle::testing::ScopedRecordingObserver scoped;
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     require(providers::create_e2b_provider(config.e2b).ok(), "created");
                     bool warned = false;
                     for (const auto &event : scoped.observer().events()) {
                       if (const auto *ready =
                               std::get_if<sandcastle::observability::ProviderReadyEvent>(&event)) {
                         warned = ready->runtime == "e2b" && ready->warning;
                       }
                     }
                     require(warned, "degraded provider reported");
                   }});

  tests.push_back({"e2b_create_returns_base_path_handle", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     providers::E2bProvider provider(config.e2b);
                     const auto created = provider.create("ignored", std::string("proj"));
                     require(created.ok(), created.error());
                     require(created.value().id == config.e2b.base_path, "id is base path");
                     require(created.value().runtime == "e2b", "runtime tag");
                     require(created.value().state == providers::SandboxState::Running, "running");
                     require(created.value().project_id == "proj", "project kept");

                     const auto started = provider.start(created.value());
                     require(started.ok() && started.value().id == created.value().id,
                             "start is a no-op");
                     const auto ensured = provider.ensure_running("any-id");
                     require(ensured.ok() && ensured.value().id == "any-id", "ensure echoes id");
                     require(provider.remove("any-id").ok(), "remove succeeds");
                   }});

  tests.push_back({"e2b_exec_runs_in_base_path", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     auto provider = providers::create_e2b_provider(config.e2b);
                     require(provider.ok(), provider.error());
                     const auto handle = provider.value()->create("", std::nullopt).value();

                     const auto result = provider.value()->exec(
                         handle, {.command = "echo hello > out.txt && cat out.txt"});
                     require(result.ok(), result.error());
                     require(result.value().stdout_text == "hello\n", "stdout");
                     require(result.value().succeeded(), "succeeded");
                     require(std::filesystem::exists(
                                 std::filesystem::path(config.e2b.base_path) / "out.txt"),
                             "file written in base path");
                   }});

  tests.push_back({"e2b_exec_reports_failures_in_result", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     auto provider = providers::create_e2b_provider(config.e2b);
                     require(provider.ok(), provider.error());
                     const auto handle = provider.value()->create("", std::nullopt).value();

                     const auto result = provider.value()->exec(
                         handle, {.command = "echo nope 1>&2; exit 2",
                                  .session = std::string("ignored"),
                                  .async_exec = true});
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 2, "exit code");
                     require(result.value().stderr_text == "nope\n", "stderr");
                     require(result.value().completed, "async flag ignored");
                   }});

  tests.push_back({"e2b_exec_timeout_is_reported", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     auto config = sandcastle::testing::temp_config(workspace);
                     config.e2b.command_timeout_ms = 200;
                     auto provider = providers::create_e2b_provider(config.e2b);
                     require(provider.ok(), provider.error());
                     const auto handle = provider.value()->create("", std::nullopt).value();
                     const auto result = provider.value()->exec(handle, {.command = "sleep 5"});
                     require(result.ok(), result.error());
                     require(result.value().exit_code == -1, "killed");
                     require(result.value().stderr_text.find("timed out") != std::string::npos,
                             "timeout noted");
                   }});

  tests.push_back({"e2b_exec_rejects_empty_command", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     providers::E2bProvider provider(config.e2b);
                     const auto handle = provider.create("", std::nullopt).value();
                     const auto result = provider.exec(handle, {.command = ""});
                     require(!result.ok(), "empty command");
                     require(result.code() == common::ErrorCode::InvalidArgument, "code");
                   }});

  tests.push_back({"e2b_files_stay_in_base_path", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     auto provider = providers::create_e2b_provider(config.e2b);
                     require(provider.ok(), provider.error());
                     auto &sandbox = *provider.value();
                     const auto handle = sandbox.create("", std::nullopt).value();
                     const std::filesystem::path base(config.e2b.base_path);

                     require(sandbox.upload_file(handle, "notes/todo.txt", "ship it\n").ok(),
                             "relative upload");
                     require(std::filesystem::exists(base / "notes" / "todo.txt"),
                             "written under base path");
                     const auto absolute = (base / "data.bin").string();
                     require(sandbox.upload_file(handle, absolute, std::string("\x00\xff", 2)).ok(),
                             "absolute path inside base");

                     const auto listed = sandbox.list_files(handle, ".");
                     require(listed.ok(), listed.error());
                     require(listed.value().size() == 2, "two entries");
                     require(listed.value()[0].name == "data.bin" && listed.value()[0].size == 2,
                             "file entry");
                     require(listed.value()[1].name == "notes" && listed.value()[1].is_dir,
                             "directory entry");
                     require(!listed.value()[0].mod_time.empty(), "modification time");

                     const auto read = sandbox.download_file(handle, "notes/todo.txt");
                     require(read.ok() && read.value() == "ship it\n", "download");
                     const auto ran = sandbox.exec(handle, {.command = "cat notes/todo.txt"});
                     require(ran.ok() && ran.value().stdout_text == "ship it\n",
                             "visible to commands");

                     require(sandbox.delete_file(handle, "notes").ok(), "delete directory");
                     require(sandbox.download_file(handle, "notes/todo.txt").code() ==
                                 common::ErrorCode::NotFound,
                             "deleted");
                     require(sandbox.delete_file(handle, "notes").code() ==
                                 common::ErrorCode::NotFound,
                             "missing file");
                   }});

  tests.push_back({"e2b_files_reject_paths_outside_base", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     workspace.create_file("secret.txt", "top secret");
                     const auto config = sandcastle::testing::temp_config(workspace);
                     auto provider = providers::create_e2b_provider(config.e2b);
                     require(provider.ok(), provider.error());
                     auto &sandbox = *provider.value();
                     const auto handle = sandbox.create("", std::nullopt).value();

                     require(sandbox.download_file(handle, "../secret.txt").code() ==
                                 common::ErrorCode::InvalidArgument,
                             "parent traversal");
                     require(sandbox.download_file(handle, (workspace.path() / "secret.txt").string())
                                     .code() == common::ErrorCode::InvalidArgument,
                             "absolute path outside base");
                     require(sandbox.upload_file(handle, "../escape.txt", "x").code() ==
                                 common::ErrorCode::InvalidArgument,
                             "upload escape");
                     require(!std::filesystem::exists(workspace.path() / "escape.txt"),
                             "nothing written outside");
                     require(sandbox.delete_file(handle, ".").code() ==
                                 common::ErrorCode::InvalidArgument,
                             "base path itself is protected");
                     require(sandbox.list_files(handle, "").code() ==
                                 common::ErrorCode::InvalidArgument,
                             "empty path");
                   }});

  tests.push_back({"e2b_preview_link_points_at_localhost", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     providers::E2bProvider provider(config.e2b);
                     const auto handle = provider.create("", std::nullopt).value();
                     const auto link = provider.get_preview_link(handle, 8080);
                     require(link.ok() && link.value() == "http://localhost:8080", "link");
                     require(provider.get_preview_link(handle, 0).code() ==
                                 common::ErrorCode::InvalidArgument,
                             "port zero");
                   }});

  tests.push_back({"create_provider_dispatches_by_name", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const auto config = sandcastle::testing::temp_config(workspace);
                     auto backend = std::make_shared<sandcastle::testing::FakeDaytonaBackend>();
                     const auto e2b = providers::create_provider("E2B", config, backend);
                     require(e2b.ok() && e2b.value()->name() == "e2b", "e2b");
                     const auto daytona = providers::create_provider("daytona", config, backend);
                     require(daytona.ok() && daytona.value()->name() == "daytona", "daytona");
                     const auto unknown = providers::create_provider("docker", config, backend);
                     require(unknown.code() == common::ErrorCode::UnknownRuntime, "unknown");
                     require(unknown.error() == "Invalid runtime 'docker'. Must be 'daytona' or 'e2b'",
                             "message");
                   }});
}
