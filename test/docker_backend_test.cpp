#include <unistd.h>
#include <thread>
#include <vector>
#include <fstream>
#include <sstream>
#include <algorithm>

#include <safeexec/workspace.h>
#include <safeexec/supervisor.h>
#include <safeexec/docker_backend.h>
#include "safeexec/utils.h"
#include "utils.h"

namespace {

using namespace std::chrono_literals;

bool Contains(const std::vector<std::string>& cmd, const std::vector<std::string>& seq) {
  return std::search(cmd.begin(), cmd.end(), seq.begin(), seq.end()) != cmd.end();
}

// Containers of any state created by this test process.
std::vector<std::string> OwnContainers() {
  std::string output;
  EXPECT_EQ(RunCommand({"docker", "ps", "-a", "--format", "{{.Names}}"}, 10'000, &output), 0) << output;
  std::string suffix = "-" + std::to_string(getpid());
  std::vector<std::string> ret;
  std::istringstream lines(output);
  for (std::string name; std::getline(lines, name);) {
    if (name.rfind("safeexec-", 0) == 0 && name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
      ret.push_back(name);
    }
  }
  return ret;
}

} // namespace

TEST(DockerCommandTest, Default) {
  DockerBackend backend{DockerOptions()};
  ResourceLimitPolicy policy;
  auto ws = Workspace::Acquire(TestDir("docker_command"), "print(1)");
  ASSERT_TRUE(ws);
  auto cmd = backend.BuildRunCommand(*ws, policy, "safeexec-test");
  ASSERT_GE(cmd.size(), 4u);
  EXPECT_EQ(cmd[0], "docker");
  EXPECT_EQ(cmd[1], "run");
  EXPECT_TRUE(Contains(cmd, {"--rm"}));
  EXPECT_TRUE(Contains(cmd, {"--name", "safeexec-test"}));
  EXPECT_TRUE(Contains(cmd, {"--network", "none"}));
  EXPECT_TRUE(Contains(cmd, {"--memory", "134217728"}));
  EXPECT_TRUE(Contains(cmd, {"--memory-swap", "134217728"}));
  EXPECT_TRUE(Contains(cmd, {"--cpus", "1"}));
  EXPECT_TRUE(Contains(cmd, {"--pids-limit", "64"}));
  EXPECT_TRUE(Contains(cmd, {"--read-only"}));
  EXPECT_TRUE(Contains(cmd, {"--security-opt", "no-new-privileges:true"}));
  EXPECT_TRUE(Contains(cmd, {"--cap-drop", "ALL"}));
  EXPECT_TRUE(Contains(cmd, {"--user", "65534:65534"}));
  EXPECT_TRUE(Contains(cmd, {"--volume", ws->Path().string() + ":/app:ro"}));
  // the image and the command come last
  ASSERT_GE(cmd.size(), 3u);
  EXPECT_EQ(std::vector<std::string>(cmd.end() - 3, cmd.end()),
            (std::vector<std::string>{"safe-python-runner:latest", "python", "/app/script.py"}));
}

TEST(DockerCommandTest, RelaxedPolicy) {
  DockerOptions opt;
  opt.binary = "/usr/local/bin/docker";
  DockerBackend backend(opt);
  ResourceLimitPolicy policy;
  policy.network_enabled = true;
  policy.filesystem_writable = true;
  policy.cpu_share = 0.5;
  auto ws = Workspace::Acquire(TestDir("docker_command_relaxed"), "print(1)");
  ASSERT_TRUE(ws);
  auto cmd = backend.BuildRunCommand(*ws, policy, "c");
  EXPECT_EQ(cmd[0], "/usr/local/bin/docker");
  EXPECT_FALSE(Contains(cmd, {"--network", "none"}));
  EXPECT_FALSE(Contains(cmd, {"--read-only"}));
  EXPECT_TRUE(Contains(cmd, {"--cpus", "0.5"}));
}

TEST(DockerDaemonErrorTest, Detect) {
  EXPECT_TRUE(IsDockerDaemonError(125, "docker: Error response from daemon: No such image: x.\n"));
  EXPECT_TRUE(IsDockerDaemonError(125, "Unable to find image 'x:latest' locally\n"));
  EXPECT_TRUE(IsDockerDaemonError(1, "Cannot connect to the Docker daemon at unix:///var/run/docker.sock.\n"));
  EXPECT_FALSE(IsDockerDaemonError(0, ""));
  EXPECT_FALSE(IsDockerDaemonError(125, "Traceback (most recent call last):\n"));
  EXPECT_FALSE(IsDockerDaemonError(1, "docker: this is user output\n"));
  EXPECT_FALSE(IsDockerDaemonError(137, ""));
}

TEST(DockerDaemonErrorTest, InterpreterNotRunnable) {
  // a misconfigured image or interpreter
  EXPECT_TRUE(IsDockerDaemonError(127,
      "docker: Error response from daemon: failed to create task for container: failed to create shim task: "
      "OCI runtime create failed: runc create failed: unable to start container process: exec: \"python\": "
      "executable file not found in $PATH: unknown.\n"));
  EXPECT_TRUE(IsDockerDaemonError(126,
      "docker: Error response from daemon: failed to create task for container: "
      "exec: \"/app/script.py\": permission denied: unknown.\n"));
  // the same exit codes from the user's program stay runtime errors
  EXPECT_FALSE(IsDockerDaemonError(127, "sh: 1: foo: not found\n"));
  EXPECT_FALSE(IsDockerDaemonError(126, ""));
  EXPECT_FALSE(IsDockerDaemonError(127, "Unable to find image 'x:latest' locally\n"));
}

// A stand-in CLI whose run never finishes and whose first removal finds no container yet.
TEST(DockerBackendTest, TimeoutRemovesContainer) {
  fs::path dir = TestDir("docker_fake");
  fs::path log = dir / "rm.log";
  fs::path cli = dir / "docker";
  ASSERT_TRUE(WriteFile(cli,
      "#!/bin/sh\n"
      "case \"$1\" in\n"
      "  run) exec sleep 30 ;;\n"
      "  rm)\n"
      "    echo \"$3\" >> '" + log.string() + "'\n"
      "    if [ \"$(wc -l < '" + log.string() + "')\" -eq 1 ]; then\n"
      "      echo \"Error response from daemon: No such container: $3\"; exit 1\n"
      "    fi ;;\n"
      "  *) exit 1 ;;\n"
      "esac\n",
      fs::perms::owner_all));
  DockerOptions opt;
  opt.binary = cli.string();
  DockerBackend backend(opt);
  ResourceLimitPolicy policy;
  policy.timeout = 300ms;
  fs::path root = TestDir("docker_fake_root");
  auto res = Supervisor(policy, backend, root).Run("print(1)");
  EXPECT_EQ(res.Kind(), OutcomeKind::TIMEOUT);
  EXPECT_EQ(CountEntries(root), 0u);

  std::ifstream fin(log);
  std::vector<std::string> removed;
  for (std::string name; std::getline(fin, name);) removed.push_back(name);
  ASSERT_EQ(removed.size(), 2u);
  EXPECT_EQ(removed[0], removed[1]);
  EXPECT_EQ(removed[0].rfind("safeexec-", 0), 0u) << removed[0];
  std::string suffix = "-" + std::to_string(getpid());
  ASSERT_GT(removed[0].size(), suffix.size());
  EXPECT_EQ(removed[0].substr(removed[0].size() - suffix.size()), suffix);
}

TEST(DockerBackendTest, MissingBinary) {
  DockerOptions opt;
  opt.binary = "/nonexistent/docker";
  DockerBackend backend(opt);
  std::string err;
  EXPECT_FALSE(backend.Probe(err));
  ResourceLimitPolicy policy;
  fs::path root = TestDir("docker_missing");
  auto res = Supervisor(policy, backend, root).Run("print(1)");
  EXPECT_EQ(res.Kind(), OutcomeKind::BACKEND_UNAVAILABLE);
  EXPECT_EQ(CountEntries(root), 0u);
}

// End-to-end; needs a docker daemon and the runner image.
class DockerRunTest : public ::testing::Test {
 protected:
  DockerBackend backend{DockerOptions()};
  ResourceLimitPolicy policy;
  fs::path root;

  void SetUp() override {
    std::string err;
    if (!backend.Probe(err)) GTEST_SKIP() << "docker unavailable: " << err;
    root = TestDir(::testing::UnitTest::GetInstance()->current_test_info()->name());
    policy.timeout = 10s;
  }
  void TearDown() override {
    if (!root.empty()) EXPECT_EQ(CountEntries(root), 0u);
  }
  ExecutionOutcome Run(const std::string& code) {
    return Supervisor(policy, backend, root).Run(code);
  }
};

TEST_F(DockerRunTest, Print) {
  auto res = Run("print(2 + 2)");
  ASSERT_TRUE(res.IsSuccess()) << res.Message();
  EXPECT_EQ(res.Stdout(), "4\n");
}

TEST_F(DockerRunTest, Exception) {
  auto res = Run("raise ValueError('nope')");
  EXPECT_EQ(res.Kind(), OutcomeKind::RUNTIME_ERROR);
  EXPECT_NE(res.Message().find("ValueError: nope"), std::string::npos) << res.Message();
}

TEST_F(DockerRunTest, Timeout) {
  policy.timeout = 2s;
  auto start = std::chrono::steady_clock::now();
  auto res = Run("while True:\n    pass\n");
  EXPECT_EQ(res.Kind(), OutcomeKind::TIMEOUT);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);
  // the container does not die with the CLI; it must have been removed explicitly
  EXPECT_TRUE(OwnContainers().empty());
}

TEST_F(DockerRunTest, Memory) {
  auto res = Run("x = bytearray(512 * 1024 * 1024)\nprint(len(x))\n");
  EXPECT_EQ(res.Kind(), OutcomeKind::MEMORY_EXCEEDED) << res.Message();
}

TEST_F(DockerRunTest, NoNetwork) {
  auto res = Run("import socket\nsocket.create_connection(('1.1.1.1', 80), timeout=3)\n");
  EXPECT_EQ(res.Kind(), OutcomeKind::NETWORK_DENIED) << res.Message();
}

TEST_F(DockerRunTest, ReadOnlyFilesystem) {
  auto res = Run("open('/app/x', 'w')\n");
  EXPECT_EQ(res.Kind(), OutcomeKind::RUNTIME_ERROR);
}

TEST_F(DockerRunTest, Idempotent) {
  auto first = Run("print('same')");
  auto second = Run("print('same')");
  EXPECT_EQ(first.Kind(), second.Kind());
  EXPECT_EQ(first.Stdout(), second.Stdout());
}

TEST_F(DockerRunTest, Concurrent) {
  constexpr int kRuns = 4;
  std::vector<std::string> outputs(kRuns);
  Supervisor supervisor(policy, backend, root);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; i++) {
    threads.emplace_back([&, i]() {
      outputs[i] = supervisor.Run("print(" + std::to_string(i) + ")").Stdout();
    });
  }
  for (auto& i : threads) i.join();
  for (int i = 0; i < kRuns; i++) EXPECT_EQ(outputs[i], std::to_string(i) + "\n");
}
