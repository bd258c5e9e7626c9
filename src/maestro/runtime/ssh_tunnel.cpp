#include "maestro/runtime/ssh_tunnel.hpp"

#include "maestro/util/log.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <thread>

#include <signal.h>
#include <unistd.h>

namespace maestro::runtime {

namespace {

auto spawn(const std::vector<std::string>& args) -> pid_t {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = vfork();
  if (pid < 0) {
    return -1;
  }
  if (pid == 0) {
    setpgid(0, 0);
    execvp(argv[0], argv.data());
    _exit(127);
  }
  setpgid(pid, pid);
  return pid;
}

auto reap(pid_t pid) -> void {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

}  // namespace

auto SshTunnel::local_socket_for(const ServerInfo& server)
    -> std::filesystem::path {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (ec) {
    dir = "/tmp";
  }
  return dir / std::format("maestro-{}-{}.sock", server.name, ::getpid());
}

auto SshTunnel::command_line(const ServerInfo& server,
                             const std::filesystem::path& local)
    -> std::vector<std::string> {
  std::vector<std::string> args{
      "ssh",
      "-nNT",
      "-o",
      "BatchMode=yes",
      "-o",
      "ExitOnForwardFailure=yes",
      "-o",
      "StreamLocalBindUnlink=yes",
      "-L",
      std::format("{}:{}", local.string(), server.podman_socket),
  };
  if (!server.identity_file.empty()) {
    args.emplace_back("-i");
    args.push_back(server.identity_file);
  }
  args.push_back(server.username.empty()
                     ? server.host
                     : std::format("{}@{}", server.username, server.host));
  return args;
}

auto SshTunnel::open(const ServerInfo& server,
                     std::chrono::milliseconds ready_timeout)
    -> Result<std::unique_ptr<SshTunnel>> {
  if (server.is_local()) {
    return fail(Error::InvalidArgument);
  }

  auto local = local_socket_for(server);
  std::error_code ec;
  std::filesystem::remove(local, ec);

  auto args = command_line(server, local);
  pid_t pid = spawn(args);
  if (pid < 0) {
    log::error("Failed to spawn ssh for server {}: {}", server.name,
               std::strerror(errno));
    return fail(Error::ConnectionFailed);
  }
  log::debug("Started ssh tunnel for {} (pid {}) at {}", server.name, pid,
             local.string());

  auto tunnel = std::make_unique<SshTunnel>(pid, local);

  auto deadline = std::chrono::steady_clock::now() + ready_timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!tunnel->is_alive()) {
      log::error("ssh tunnel to {}@{} exited before the socket was ready",
                 server.username, server.host);
      return fail(Error::ConnectionFailed);
    }
    if (std::filesystem::exists(local, ec)) {
      return ok(std::move(tunnel));
    }
    std::this_thread::sleep_for(timing::kTunnelPollInterval);
  }

  log::error("Timed out waiting for ssh tunnel to {}", server.host);
  return fail(Error::ConnectionFailed);
}

SshTunnel::SshTunnel(pid_t pid, std::filesystem::path local_socket)
    : pid_(pid), local_socket_(std::move(local_socket)) {}

SshTunnel::~SshTunnel() {
  close();
}

auto SshTunnel::close() -> void {
  if (pid_ > 0) {
    kill(-pid_, SIGTERM);
    reap(pid_);
    pid_ = -1;
  }
  std::error_code ec;
  std::filesystem::remove(local_socket_, ec);
}

auto SshTunnel::is_alive() -> bool {
  if (pid_ <= 0) {
    return false;
  }
  int status = 0;
  pid_t r = waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    pid_ = -1;
    return false;
  }
  return r == 0;
}

}  // namespace maestro::runtime
