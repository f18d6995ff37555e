/* @file cli_main.cpp
 * @brief devbroker-cli: one broker request from the shell
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <string>
#include <vector>

// third-party
#include <boost/program_options.hpp>

// devbroker headers
#include "client/BrokerClient.hpp"
#include "core/Errors.hpp"

namespace po = boost::program_options;
using devbroker::client::BrokerClient;

namespace {

  constexpr const char* kUsage =
      "usage: devbroker-cli [options] <request> [args]\n"
      "\n"
      "requests:\n"
      "  ping\n"
      "  connect <hostname>\n"
      "  execute <hostname> <command...>\n"
      "  disconnect <hostname>\n"
      "  status\n";

  std::string joined(const std::vector<std::string>& words, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < words.size(); ++i) {
      if (!out.empty())
        out += ' ';
      out += words[i];
    }
    return out;
  }

  int runRequest(BrokerClient& client, const std::vector<std::string>& words) {
    const std::string& verb = words.front();
    const auto need = [&](std::size_t n) {
      if (words.size() < n + 1)
        throw po::error("'" + verb + "' needs " + std::to_string(n) + " argument(s)");
    };

    if (verb == "ping") {
      std::cout << (client.ping() ? "pong" : "unexpected reply") << '\n';
      return 0;
    }
    if (verb == "connect") {
      need(1);
      const bool ok = client.connect(words[1]);
      std::cout << (ok ? "connected " : "failed to connect ") << words[1] << '\n';
      return ok ? 0 : 1;
    }
    if (verb == "execute") {
      need(2);
      std::cout << client.execute(words[1], joined(words, 2)) << '\n';
      return 0;
    }
    if (verb == "disconnect") {
      need(1);
      client.disconnect(words[1]);
      std::cout << "disconnected " << words[1] << '\n';
      return 0;
    }
    if (verb == "status") {
      std::cout << client.status().dump(2) << '\n';
      return 0;
    }
    throw po::error("unknown request '" + verb + "'");
  }

} // namespace

int main(int argc, char** argv) {
  std::string socketPath;
  long timeoutSeconds = 300;
  std::vector<std::string> words;

  po::options_description desc("devbroker-cli options");
  desc.add_options()
      ("help,h", "Show this help")
      ("socket,s", po::value(&socketPath)->value_name("PATH"), "Broker socket (default $DEVBROKER_SOCKET)")
      ("timeout,t", po::value(&timeoutSeconds)->value_name("SECONDS"), "Reply timeout");
  po::options_description hidden;
  hidden.add_options()("request", po::value(&words));
  po::options_description all;
  all.add(desc).add(hidden);
  po::positional_options_description positional;
  positional.add("request", -1);

  try {
    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    po::notify(vm);
    if (vm.count("help") || words.empty()) {
      std::cout << kUsage << '\n' << desc << '\n';
      return words.empty() && !vm.count("help") ? 2 : 0;
    }

    BrokerClient client(socketPath, std::chrono::seconds(timeoutSeconds));
    return runRequest(client, words);
  } catch (const po::error& e) {
    std::cerr << "devbroker-cli: " << e.what() << "\n\n" << kUsage;
    return 2;
  } catch (const devbroker::core::BrokerError& e) {
    std::cerr << "devbroker-cli: " << e.kind() << ": " << e.what() << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "devbroker-cli: " << e.what() << '\n';
    return 1;
  }
}
