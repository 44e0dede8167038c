#include "mcp-discovery/argument_parsing.hpp"
#include "mcp-discovery/auto_discovery.hpp"
#include "mcp-discovery/logger.hpp"
#include "mcp-discovery/passive_scan.hpp"
#include "mcp-discovery/server_descriptor.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

std::atomic<bool> shutdown_requested{false};

namespace {

struct CommandLine {
  std::vector<std::string> positional;
  mcpd::DiscoveryOptions options;
  bool json_output = false;
};

CommandLine parseCommandLine(int argc, char *argv[]) {
  CommandLine command_line;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return argv[++i];
    };

    if (arg == "--group") {
      command_line.options.group = next();
    } else if (arg == "--port") {
      command_line.options.port = mcpd::parsePort(next());
    } else if (arg == "--interval") {
      command_line.options.announce_interval =
          mcpd::parseSeconds(next(), false);
    } else if (arg == "--timeout") {
      command_line.options.eviction_timeout = mcpd::parseSeconds(next());
    } else if (arg == "--json") {
      command_line.json_output = true;
    } else {
      command_line.positional.push_back(arg);
    }
  }
  return command_line;
}

void printServer(const mcpd::ServerDescriptor &server, bool json_output) {
  if (json_output) {
    std::cout << server.toJson().dump() << "\n";
    return;
  }
  std::cout << "- " << server.name << " " << server.version << " at "
            << server.key() << " (" << server.protocol << ")";
  if (!server.capabilities.empty()) {
    std::cout << ", capabilities:";
    for (const auto &[name, value] : server.capabilities) {
      std::cout << " " << name;
    }
  }
  std::cout << "\n";
}

} // namespace

class Application {
public:
  Application(mcpd::ServerDescriptor descriptor,
              const mcpd::DiscoveryOptions &options)
      : discovery_(std::move(descriptor), true, options) {
    this->discovery_.start();
  }

  ~Application() { stop(); }

  void stop() { this->discovery_.stop(); }

  void run() {
    while (!shutdown_requested) {
      this->displayMenu_();
      std::string input;
      if (!std::getline(std::cin, input)) {
        shutdown_requested = true;
        break;
      }
      this->handleUserInput_(input);
    }
  }

private:
  void displayMenu_() {
    std::cout << "\nMCP Server Discovery\n"
              << "1. Show local server\n"
              << "2. List discovered servers\n"
              << "3. Add capability\n"
              << "4. Remove capability\n"
              << "5. Exit\n"
              << "Enter command: ";
  }

  void handleUserInput_(const std::string &input) {
    int choice = 0;
    try {
      choice = std::stoi(input);
    } catch (const std::exception &) {
      std::cout << "Invalid command\n";
      return;
    }
    switch (choice) {
    case 1:
      this->showLocalServer_();
      break;
    case 2:
      this->listDiscoveredServers_();
      break;
    case 3:
      this->addCapability_();
      break;
    case 4:
      this->removeCapability_();
      break;
    case 5:
      shutdown_requested = true;
      break;
    default:
      std::cout << "Invalid command\n";
    }
  }

  void showLocalServer_() {
    std::cout << "\nLocal server:\n"
              << this->discovery_.serverDescriptor().toJson().dump(2) << "\n";
  }

  void listDiscoveredServers_() {
    auto servers = this->discovery_.getLiveDescriptors();
    std::cout << "\nDiscovered servers:\n";
    if (servers.empty()) {
      std::cout << "(none)\n";
    }
    for (const auto &server : servers) {
      printServer(server, false);
    }
  }

  void addCapability_() {
    std::cout << "Enter capability name: ";
    std::string name;
    std::getline(std::cin, name);

    std::cout << "Enter capability value (JSON): ";
    std::string value;
    std::getline(std::cin, value);

    auto parsed = nlohmann::json::parse(value, nullptr, false);
    if (parsed.is_discarded()) {
      parsed = value;
    }

    auto capabilities = this->discovery_.serverDescriptor().capabilities;
    capabilities[name] = parsed;
    this->discovery_.updateCapabilities(std::move(capabilities));
    std::cout << "Capability added successfully\n";
  }

  void removeCapability_() {
    std::cout << "Enter capability name: ";
    std::string name;
    std::getline(std::cin, name);

    auto capabilities = this->discovery_.serverDescriptor().capabilities;
    if (capabilities.erase(name) == 0) {
      std::cout << "Capability not found: " << name << std::endl;
      return;
    }
    this->discovery_.updateCapabilities(std::move(capabilities));
    std::cout << "Capability removed successfully" << std::endl;
  }

  mcpd::AutoDiscovery discovery_;
};

void signalHandler(int) { shutdown_requested = true; }

int runScan(const CommandLine &command_line) {
  auto duration = command_line.positional.empty()
                      ? constants::passive_scan::DEFAULT_DURATION
                      : mcpd::parseSeconds(command_line.positional[0]);
  auto servers = mcpd::discoverServers(duration, command_line.options);
  if (servers.empty() && !command_line.json_output) {
    std::cout << "No servers found\n";
  }
  for (const auto &server : servers) {
    printServer(server, command_line.json_output);
  }
  return 0;
}

int runAnnounce(const CommandLine &command_line) {
  const auto &args = command_line.positional;
  if (args.size() != 4 && args.size() != 5) {
    throw std::invalid_argument("announce expects <name> <version> <host> "
                                "<port> [protocol]");
  }
  mcpd::ServerDescriptor descriptor;
  descriptor.name = args[0];
  descriptor.version = args[1];
  descriptor.host = args[2];
  descriptor.port = mcpd::parsePort(args[3]);
  if (args.size() == 5) {
    descriptor.protocol = args[4];
  }

  mcpd::Logger::setTag(descriptor.name);
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  Application app(std::move(descriptor), command_line.options);
  app.run();
  std::cout << "\nShutting down...\n";
  app.stop();
  return 0;
}

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      std::cerr << "Usage: " << argv[0] << " scan [seconds] [--json]"
                << " [--group <addr>] [--port <n>] [--timeout <seconds>]\n"
                << "       " << argv[0]
                << " announce <name> <version> <host> <port> [protocol]"
                << " [--group <addr>] [--port <n>] [--interval <seconds>]"
                << " [--timeout <seconds>]\n";
      return 1;
    }

    std::string command = argv[1];
    CommandLine command_line = parseCommandLine(argc, argv);
    if (command == "scan") {
      return runScan(command_line);
    }
    if (command == "announce") {
      return runAnnounce(command_line);
    }
    std::cerr << "Unknown command: " << command << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
