/* @file main.cpp
 * @brief devbroker daemon: parse options, run the broker, optionally supervise one child command
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

// Linux headers
#include <errno.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

// third-party
#include <boost/program_options.hpp>

// devbroker headers
#include "core/BrokerConfig.hpp"
#include "core/BrokerService.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"

extern char** environ;

namespace po = boost::program_options;
using namespace devbroker::core;

namespace {

  constexpr const char* kComponent = "main";

  struct Options {
    std::string configPath;
    std::string inventoryPath;
    std::string socketPath;
    std::string logLevel;
    std::size_t maxConnections{ 0 };
    std::vector<std::string> childCommand;
  };

  int exitStatusOf(int status) {
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);
    return 1;
  }

  /// posix_spawnp with an empty signal mask; the broker keeps its signals blocked.
  pid_t spawnChild(const std::vector<std::string>& args, Logger& logger) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args)
      argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t none;
    sigemptyset(&none);
    posix_spawnattr_setsigmask(&attr, &none);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK);

    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, argv[0], nullptr, &attr, argv.data(), environ);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
      logger.error(kComponent, "cannot run '" + args.front() + "': " + std::strerror(rc));
      return -1;
    }
    logger.info(kComponent, "started '" + args.front() + "' as pid " + std::to_string(pid));
    return pid;
  }

  /// Returns the process exit code once SIGINT/SIGTERM arrives or the child exits.
  int waitForStop(const sigset_t& signals, pid_t child, Logger& logger) {
    bool forwarded = false;
    while (true) {
      int sig = 0;
      if (const int rc = ::sigwait(&signals, &sig); rc != 0) {
        logger.error(kComponent, std::string("sigwait: ") + std::strerror(rc));
        return 1;
      }

      if (sig == SIGCHLD) {
        if (child <= 0)
          continue; // a device process; its session reaps it
        int status = 0;
        const pid_t r = ::waitpid(child, &status, WNOHANG);
        if (r == child) {
          const int code = exitStatusOf(status);
          logger.info(kComponent, "child exited with status " + std::to_string(code));
          return code;
        }
        continue;
      }

      logger.info(kComponent, std::string("received ") + ::strsignal(sig));
      if (child <= 0)
        return 0;
      if (forwarded) {
        // second signal: stop waiting for the child
        int status = 0;
        if (::kill(child, SIGKILL) == -1 || ::waitpid(child, &status, 0) == -1)
          logger.warning(kComponent, std::string("reaping child: ") + std::strerror(errno));
        return 128 + sig;
      }
      if (::kill(child, sig) == -1) {
        logger.warning(kComponent, std::string("forwarding signal: ") + std::strerror(errno));
        return 128 + sig;
      }
      forwarded = true;
    }
  }

  int parseOptions(int argc, char** argv, Options& opts) {
    // everything after "--" is the child command
    int brokerArgc = argc;
    for (int i = 1; i < argc; ++i) {
      if (std::string_view(argv[i]) == "--") {
        brokerArgc = i;
        opts.childCommand.assign(argv + i + 1, argv + argc);
        break;
      }
    }

    po::options_description desc("devbroker options");
    desc.add_options()
        ("help,h", "Show this help")
        ("config,c", po::value(&opts.configPath)->value_name("FILE"), "JSON broker configuration")
        ("inventory,i", po::value(&opts.inventoryPath)->value_name("FILE"),
         "JSON device inventory (overrides inventory_path)")
        ("socket,s", po::value(&opts.socketPath)->value_name("PATH"),
         "Listening socket path (overrides socket_path and $DEVBROKER_SOCKET)")
        ("max-connections,m", po::value(&opts.maxConnections)->value_name("N"),
         "Concurrent device session limit (0 = derive from inventory)")
        ("log-level,l", po::value(&opts.logLevel)->value_name("LEVEL"),
         "debug | info | warning | error");

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(brokerArgc, argv, desc), vm);
      po::notify(vm);
    } catch (const po::error& e) {
      std::cerr << "devbroker: " << e.what() << "\n\n" << desc << '\n';
      return 2;
    }
    if (vm.count("help")) {
      std::cout << "usage: devbroker [options] [-- command [args...]]\n\n" << desc << '\n';
      return 0;
    }
    return -1;
  }

} // namespace

int main(int argc, char** argv) {
  Options opts;
  if (const int rc = parseOptions(argc, argv, opts); rc >= 0)
    return rc;

  BrokerConfig config;
  try {
    if (!opts.configPath.empty())
      config = BrokerConfig::fromJson(ConfigLoader(opts.configPath).load());
  } catch (const std::exception& e) {
    std::cerr << "devbroker: " << e.what() << '\n';
    return 1;
  }
  if (!opts.inventoryPath.empty())
    config.inventoryPath = opts.inventoryPath;
  if (!opts.socketPath.empty())
    config.socketPath = opts.socketPath;
  if (opts.maxConnections > 0)
    config.maxConnections = opts.maxConnections;
  if (!opts.logLevel.empty()) {
    const auto level = parseLogLevel(opts.logLevel);
    if (!level) {
      std::cerr << "devbroker: unknown log level '" << opts.logLevel << "'\n";
      return 2;
    }
    config.logLevel = *level;
  }
  if (config.inventoryPath.empty()) {
    std::cerr << "devbroker: no inventory given (--inventory or inventory_path)\n";
    return 2;
  }
  if (config.socketPath.empty())
    config.socketPath = defaultSocketPath();

  // Block before any thread exists so every thread inherits the mask.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGCHLD);
  if (const int rc = ::pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
    std::cerr << "devbroker: pthread_sigmask: " << std::strerror(rc) << '\n';
    return 1;
  }

  Logger logger(config.logLevel);
  try {
    logger.start(config.logPath);
  } catch (const std::exception& e) {
    std::cerr << "devbroker: " << e.what() << '\n';
    return 1;
  }

  int exitCode = 0;
  {
    BrokerService broker(config, logger);
    try {
      broker.start();
    } catch (const std::exception& e) {
      std::cerr << "devbroker: " << e.what() << '\n';
      logger.finish();
      return 1;
    }

    pid_t child = -1;
    bool childFailed = false;
    if (!opts.childCommand.empty()) {
      if (::setenv(kSocketEnvVar, broker.socketPath().c_str(), 1) != 0) {
        logger.error(kComponent, std::string("setenv: ") + std::strerror(errno));
        childFailed = true;
      } else {
        child = spawnChild(opts.childCommand, logger);
        childFailed = child < 0;
      }
    }

    if (childFailed)
      exitCode = 127;
    else
      exitCode = waitForStop(signals, child, logger);

    broker.shutdown();
  }

  logger.finish();
  return exitCode;
}
