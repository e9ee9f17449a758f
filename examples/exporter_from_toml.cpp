#include <tomexp/tomexp.hpp>

#include <csignal>
#include <iostream>
#include <pthread.h>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config.toml>" << std::endl;
    return 2;
  }
  const std::string cfg_path = argv[1];

  // Block before the listener threads start so they inherit the mask.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  if (!tomexp::InitFromToml(cfg_path)) {
    std::cerr << "InitFromToml failed: " << cfg_path << std::endl;
    return 1;
  }

  int sig = 0;
  sigwait(&sigs, &sig);
  std::cerr << "signal " << sig << ", shutting down" << std::endl;

  tomexp::Shutdown();
  return 0;
}
