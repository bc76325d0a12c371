#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>

#include "cli/commands.hpp"

namespace {

struct Command {
  std::string description;
  std::function<void()> action;
};

int run_command(const std::map<std::string, Command>& commands,
                const std::string& name) {
  const auto it = commands.find(name);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << name
              << "\nAvailable commands:" << std::endl;
    for (const auto& entry : commands) {
      std::cerr << "  " << entry.first << "\t" << entry.second.description
                << std::endl;
    }
    return 1;
  }

  auto start = std::chrono::high_resolution_clock::now();
  try {
    it->second.action();
  } catch (const std::exception& e) {
    std::cerr << name << ": " << e.what() << std::endl;
    return 1;
  }
  auto end = std::chrono::high_resolution_clock::now();

  using time_unit = std::chrono::duration<double, std::milli>;
  auto duration = std::chrono::duration_cast<time_unit>(end - start);
  std::cout << "Finished " << name << " in " << duration.count() << " ms"
            << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const std::map<std::string, Command> commands = {
      {"wer", {"Word error rate (MLEVAL_REF, MLEVAL_HYP)", RunWer}},
      {"cer", {"Character error rate (MLEVAL_REF, MLEVAL_HYP)", RunCer}},
      {"bleu", {"Corpus BLEU (MLEVAL_HYP, MLEVAL_REF=a:b:...)", RunBleu}},
      {"ranking", {"ROC AUC and average precision (MLEVAL_SCORES)",
                   RunRanking}},
      {"perplexity", {"Bigram perplexity (MLEVAL_TRAIN, MLEVAL_TEST)",
                      RunPerplexity}},
  };

  if (argc > 1) {
    const std::string arg = argv[1];
    if (arg == "--list" || arg == "-l") {
      for (const auto& entry : commands) {
        std::cout << entry.first << '\t' << entry.second.description
                  << std::endl;
      }
      return 0;
    }
    if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: mleval [command]\n\nDefaults to 'wer'.\n"
                   "Use --list to see available commands.\n"
                   "Set MLEVAL_REPORT=<file> to write a JSON report."
                << std::endl;
      return 0;
    }
    return run_command(commands, arg);
  }

  return run_command(commands, "wer");
}
