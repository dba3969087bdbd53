#include "test_framework.hpp"

#include "sandcastle/cli/commands.hpp"
#include "sandcastle/config/config.hpp"
#include "sandcastle/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <sstream>

namespace {

struct CliRun {
  int exit_code = 0;
  std::string out;
};

/// Runs the CLI with stdout captured; stderr is left alone.
CliRun invoke(std::vector<std::string> args) {
  args.insert(args.begin(), "sandcastle");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }

  std::ostringstream captured;
  auto *previous = std::cout.rdbuf(captured.rdbuf());
  CliRun run;
  run.exit_code = sandcastle::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(previous);
  run.out = captured.str();

  sandcastle::config::clear_config_path_override();
  sandcastle::observability::set_global_observer(nullptr);
  return run;
}

std::string write_e2b_config(const sandcastle::testing::TempWorkspace &workspace) {
  const auto base = (workspace.path() / "sandbox").string();
  workspace.create_file("config.toml", "[sandbox]\n"
                                       "runtime = \"e2b\"\n"
                                       "[e2b]\n"
                                       "base_path = \"" +
                                           base +
                                           "\"\n"
                                           "[observability]\n"
                                           "backend = \"noop\"\n");
  return (workspace.path() / "config.toml").string();
}

} // namespace

void register_cli_tests(std::vector<sandcastle::tests::TestCase> &tests) {
  using sandcastle::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     const auto version = invoke({"version"});
                     require(version.exit_code == 0, "version exit code");
                     require(version.out.rfind("sandcastle ", 0) == 0, version.out);

                     const auto help = invoke({"help"});
                     require(help.exit_code == 0, "help exit code");
                     require(help.out.find("USAGE") != std::string::npos, "usage printed");
                   }});

  tests.push_back({"cli_unknown_command_fails", [] {
                     require(invoke({"teleport"}).exit_code == 1, "unknown command");
                     require(invoke({"--runtime"}).exit_code == 1, "missing option value");
                   }});

  tests.push_back({"cli_validate_uses_config_file", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const std::string path = write_e2b_config(workspace);
                     const auto run = invoke({"--config", path, "validate", "e2b"});
                     require(run.exit_code == 0, run.out);
                     require(run.out.find("\"is_configured\":true") != std::string::npos, run.out);
                   }});

  tests.push_back({"cli_exec_runs_in_e2b_base_path", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const std::string path = write_e2b_config(workspace);
                     const std::string base = (workspace.path() / "sandbox").string();

                     const auto run =
                         invoke({"--config=" + path, "exec", base, "--", "echo", "from-cli"});
                     require(run.exit_code == 0, run.out);
                     require(run.out == "from-cli\n", run.out);

                     const auto failed = invoke({"--config", path, "exec", base, "--", "exit", "3"});
                     require(failed.exit_code == 3, "exit code propagated");
                   }});

  tests.push_back({"cli_rejects_unknown_runtime_flag", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const std::string path = write_e2b_config(workspace);
                     const auto run = invoke({"--config", path, "--runtime", "docker", "status"});
                     require(run.exit_code == 1, "unknown runtime rejected");
                   }});

  tests.push_back({"cli_create_on_e2b_prints_handle", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const std::string path = write_e2b_config(workspace);
                     const auto run = invoke({"--config", path, "create", "--project", "p-9",
                                              "--password", "secret"});
                     require(run.exit_code == 0, run.out);
                     require(run.out.find("\"runtime\":\"e2b\"") != std::string::npos, run.out);
                     require(run.out.find("\"project_id\":\"p-9\"") != std::string::npos, run.out);
                   }});

  tests.push_back({"cli_file_commands_on_e2b", [] {
                     sandcastle::testing::TempWorkspace workspace;
                     const std::string path = write_e2b_config(workspace);
                     const std::string base = (workspace.path() / "sandbox").string();
                     workspace.create_file("local.txt", "from host\n");
                     const std::string local = (workspace.path() / "local.txt").string();

                     const auto uploaded =
                         invoke({"--config", path, "upload", base, local, "inbox/local.txt"});
                     require(uploaded.exit_code == 0, uploaded.out);

                     const auto listed = invoke({"--config", path, "ls", base, "inbox"});
                     require(listed.exit_code == 0, listed.out);
                     require(listed.out.find("\"name\":\"local.txt\"") != std::string::npos,
                             listed.out);

                     const auto downloaded =
                         invoke({"--config", path, "download", base, "inbox/local.txt"});
                     require(downloaded.exit_code == 0 && downloaded.out == "from host\n",
                             downloaded.out);

                     const auto preview = invoke({"--config", path, "preview", base, "6080"});
                     require(preview.out == "http://localhost:6080\n", preview.out);
                     require(invoke({"--config", path, "preview", base, "0"}).exit_code == 1,
                             "invalid port");

                     require(invoke({"--config", path, "rm", base, "inbox/local.txt"}).exit_code ==
                                 0,
                             "rm");
                     require(invoke({"--config", path, "download", base, "inbox/local.txt"})
                                     .exit_code == 1,
                             "removed");
                   }});
}
