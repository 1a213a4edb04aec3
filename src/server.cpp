#include "server.h"

#include <signal.h>
#include <pthread.h>
#include <chrono>
#include <thread>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <safeexec/http_api.h>

namespace {

// Sent by ServeForever itself to release the signal thread.
constexpr int kWakeSignal = SIGUSR1;

// Block the stop signals in every thread and wait for them in a dedicated one,
// so that stopping the server never happens inside a signal handler.
std::thread StartSignalThread(httplib::Server& server) {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  sigaddset(&set, kWakeSignal);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  return std::thread([&server, set]() {
    int sig = 0;
    if (sigwait(&set, &sig) != 0 || sig == kWakeSignal) return;
    spdlog::info("Received signal {}; shutting down", sig);
    server.stop();
  });
}

} // namespace

bool ServeForever(const Supervisor& supervisor, const ServerOptions& opt) {
  httplib::Server server;
  int threads = opt.threads;
  server.new_task_queue = [threads]() { return new httplib::ThreadPool(threads); };
  server.set_payload_max_length(opt.max_body_bytes);

  server.Post("/run", [&supervisor](const httplib::Request& req, httplib::Response& res) {
    auto start = std::chrono::steady_clock::now();
    RunResponse resp = HandleRunRequest(supervisor, req.body);
    res.status = resp.status;
    res.set_content(DumpBody(resp.body), "application/json");
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("POST /run from {}: status={} kind={} elapsed={}ms", req.remote_addr, resp.status,
                 resp.body.value("kind", resp.status == 200 ? "success" : "invalid_request"), elapsed);
  });

  if (!server.bind_to_port(opt.host, opt.port)) {
    spdlog::error("Failed to listen on {}:{}", opt.host, opt.port);
    return false;
  }
  std::thread signal_thread = StartSignalThread(server);
  spdlog::info("Listening on {}:{} with {} worker threads", opt.host, opt.port, threads);
  bool ret = server.listen_after_bind();
  // the thread refers to server; it must be gone before server is destroyed
  pthread_kill(signal_thread.native_handle(), kWakeSignal);
  signal_thread.join();
  return ret;
}
