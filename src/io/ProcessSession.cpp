/* @file ProcessSession.cpp
 * @brief child-process device session - spawn, line I/O to the prompt, teardown - POSIX compliant
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstring>
#include <thread>

// Linux headers
#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

// devbroker headers
#include "core/ConnectAttempt.hpp"
#include "core/DeviceInventory.hpp"
#include "core/Errors.hpp"
#include "core/SessionFactory.hpp"
#include "io/ProcessSession.hpp"

extern char** environ;

using namespace devbroker::io;
using devbroker::core::ConnectionError;
using devbroker::core::ExecutionError;

namespace {

  constexpr std::chrono::milliseconds kReapGrace{ 1000 };

  std::string normalizeOutput(std::string raw, const std::string& command) {
    raw.erase(std::remove(raw.begin(), raw.end(), '\r'), raw.end());

    // drop the echoed command line
    const auto firstBreak = raw.find('\n');
    const std::string firstLine = raw.substr(0, firstBreak);
    if (!command.empty() && firstLine == command)
      raw.erase(0, firstBreak == std::string::npos ? raw.size() : firstBreak + 1);

    const auto begin = raw.find_first_not_of('\n');
    if (begin == std::string::npos)
      return {};
    const auto end = raw.find_last_not_of('\n');
    return raw.substr(begin, end - begin + 1);
  }

  struct SpawnAttrs {
    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    SpawnAttrs() {
      posix_spawn_file_actions_init(&actions);
      posix_spawnattr_init(&attr);
    }
    ~SpawnAttrs() {
      posix_spawn_file_actions_destroy(&actions);
      posix_spawnattr_destroy(&attr);
    }
  };

} // namespace

std::shared_ptr<ProcessSession> ProcessSession::spawn(const core::DeviceDescriptor& device,
                                                      std::chrono::milliseconds commandTimeout,
                                                      core::ConnectAttempt* attempt) {
  if (device.command.empty())
    throw ConnectionError("[ProcessSession] device " + device.hostname + " has no command",
                          ConnectionError::Reason::Refused);

  int sv[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == -1)
    throw ConnectionError(std::string("[ProcessSession] socketpair: ") + std::strerror(errno));

  SpawnAttrs spawnAttrs;
  posix_spawn_file_actions_adddup2(&spawnAttrs.actions, sv[1], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&spawnAttrs.actions, sv[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&spawnAttrs.actions, sv[1], STDERR_FILENO);

  // the broker may run with signals blocked; the device process must not inherit that
  sigset_t none;
  sigemptyset(&none);
  posix_spawnattr_setsigmask(&spawnAttrs.attr, &none);
  posix_spawnattr_setpgroup(&spawnAttrs.attr, 0);
  posix_spawnattr_setflags(&spawnAttrs.attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETPGROUP);

  char* argv[] = { const_cast<char*>("/bin/sh"), const_cast<char*>("-c"),
                   const_cast<char*>(device.command.c_str()), nullptr };
  pid_t pid = -1;
  const int rc =
      ::posix_spawn(&pid, "/bin/sh", &spawnAttrs.actions, &spawnAttrs.attr, argv, environ);
  ::close(sv[1]);
  if (rc != 0) {
    ::close(sv[0]);
    throw ConnectionError("[ProcessSession] cannot spawn '" + device.command +
                              "': " + std::strerror(rc),
                          ConnectionError::Reason::Refused);
  }

  std::shared_ptr<ProcessSession> session(new ProcessSession(
      pid, sv[0], device.hostname, device.effectivePrompt(), commandTimeout));

  if (attempt)
    attempt->track(session);

  const auto started = std::chrono::steady_clock::now();
  try {
    session->readUntilPrompt(device.connectTimeout);
  } catch (const ExecutionError& e) {
    const bool timedOut = std::chrono::steady_clock::now() - started >= device.connectTimeout;
    session->close();
    if (attempt && attempt->cancelled())
      throw ConnectionError("[ProcessSession] connect to " + device.hostname + " cancelled",
                            ConnectionError::Reason::Unexpected);
    throw ConnectionError(e.what(), timedOut ? ConnectionError::Reason::Timeout
                                             : ConnectionError::Reason::Refused);
  }
  // a concurrent cancel() leaves the session Closed
  auto connecting = State::Connecting;
  if (!session->state_.compare_exchange_strong(connecting, State::Connected))
    throw ConnectionError("[ProcessSession] connect to " + device.hostname + " cancelled",
                          ConnectionError::Reason::Unexpected);
  return session;
}

ProcessSession::ProcessSession(pid_t pid, int fd, std::string hostname, std::string prompt,
                               std::chrono::milliseconds commandTimeout)
    : pid_(pid), fd_(fd), hostname_(std::move(hostname)), prompt_(std::move(prompt)),
      commandTimeout_(commandTimeout) {}

ProcessSession::~ProcessSession() {
  close();
  reap();
  if (fd_ >= 0)
    ::close(fd_);
}

std::string ProcessSession::run(const std::string& command) {
  std::lock_guard<std::mutex> lock(runMtx_);
  if (state_ != State::Connected)
    throw ExecutionError("[ProcessSession] session to " + hostname_ + " is " + toString(state_.load()));

  if (!sendLine(command)) {
    state_ = State::Unhealthy;
    throw ExecutionError("[ProcessSession] write to " + hostname_ + " failed: " + std::strerror(errno));
  }
  return normalizeOutput(readUntilPrompt(commandTimeout_), command);
}

bool ProcessSession::isHealthy() { return state_ == State::Connected && childAlive(); }

void ProcessSession::close() {
  if (state_.exchange(State::Closed) == State::Closed)
    return;
  // wakes a run() blocked in poll(); the fd itself is released by the destructor
  ::shutdown(fd_, SHUT_RDWR);
  std::lock_guard<std::mutex> lock(procMtx_);
  if (!reaped_)
    ::kill(-pid_, SIGTERM);
}

bool ProcessSession::sendLine(const std::string& line) {
  const std::string out = line + "\n";
  std::size_t total = 0;
  while (total < out.size()) {
    ssize_t written = ::send(fd_, out.data() + total, out.size() - total, MSG_NOSIGNAL);
    if (written > 0)
      total += static_cast<std::size_t>(written);
    else if (written == -1 && errno == EINTR)
      continue;
    else
      return false;
  }
  return true;
}

// -------------------------------------------------------------------
// ProcessSession::readUntilPrompt
// Accumulates child output until a line consisting of the prompt ends the
// buffer; returns everything before it. Throws ExecutionError on timeout,
// EOF or a read error and marks the session unhealthy.
// -------------------------------------------------------------------
std::string ProcessSession::readUntilPrompt(std::chrono::milliseconds timeout) {
  char temp[4096];
  pollfd pfd{ fd_, POLLIN, 0 };
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  auto fail = [this](const std::string& why) -> ExecutionError {
    if (state_ != State::Closed)
      state_ = State::Unhealthy;
    return ExecutionError("[ProcessSession] " + hostname_ + ": " + why);
  };

  while (true) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (ms_left.count() <= 0)
      throw fail("timed out waiting for prompt '" + prompt_ + "'");

    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      throw fail(std::string("poll: ") + std::strerror(errno));
    }
    if (rc == 0)
      continue; // deadline check above reports the timeout

    ssize_t n = ::recv(fd_, temp, sizeof(temp), 0);
    if (n == 0)
      throw fail("device process closed the session");
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
        continue;
      throw fail(std::string("read: ") + std::strerror(errno));
    }
    rx_buffer_.append(temp, static_cast<std::size_t>(n));

    const auto last = rx_buffer_.find_last_not_of(" \r\n");
    if (last == std::string::npos)
      continue;
    const std::size_t end = last + 1;
    if (end < prompt_.size())
      continue;
    const std::size_t start = end - prompt_.size();
    if (rx_buffer_.compare(start, prompt_.size(), prompt_) != 0)
      continue;
    if (start > 0 && rx_buffer_[start - 1] != '\n' && rx_buffer_[start - 1] != '\r')
      continue; // prompt text inside a line of output

    std::string output = rx_buffer_.substr(0, start);
    rx_buffer_.clear();
    return output;
  }
}

bool ProcessSession::childAlive() {
  std::lock_guard<std::mutex> lock(procMtx_);
  if (reaped_)
    return false;
  int status = 0;
  pid_t rc = ::waitpid(pid_, &status, WNOHANG);
  if (rc == 0)
    return true;
  reaped_ = true; // exited (rc == pid) or not our child any more
  return false;
}

void ProcessSession::reap() {
  std::lock_guard<std::mutex> lock(procMtx_);
  if (reaped_)
    return;

  const auto deadline = std::chrono::steady_clock::now() + kReapGrace;
  int status = 0;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc != 0) {
      reaped_ = true;
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  ::kill(-pid_, SIGKILL);
  ::waitpid(pid_, &status, 0);
  reaped_ = true;
}

void devbroker::io::registerProcessSessions(core::SessionFactory& factory,
                                            std::chrono::milliseconds commandTimeout) {
  factory.registerPlatform(
      core::kProcessPlatform,
      [commandTimeout](const core::DeviceDescriptor& device, core::ConnectAttempt& attempt) {
        return ProcessSession::spawn(device, commandTimeout, &attempt);
      });
}
