#include <iostream>
#include <string_view>

#ifndef TEMPEST_VERSION
#define TEMPEST_VERSION "unknown"
#endif

#ifndef TEMPEST_UI_UNAVAILABLE_REASON
#define TEMPEST_UI_UNAVAILABLE_REASON "SDL2 or Dear ImGui was not found when this build was configured."
#endif

// Stand-in for the `tempest` executable when the UI dependencies are missing,
// so the target name exists in every build.
namespace {

constexpr int kExitOk = 0;
constexpr int kExitUiRequired = 2;

bool has_flag(int argc, char** argv, std::string_view flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] && flag == argv[i]) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Tempest UI launcher v" << TEMPEST_VERSION << "\n\n";
  std::cout << "Usage: " << ((exe && *exe) ? exe : "tempest") << " [--help] [--version] [--require-ui]\n\n";
  std::cout << "This build does not include the interactive UI.\n";
  std::cout << "Reason: " << TEMPEST_UI_UNAVAILABLE_REASON << "\n\n";
  std::cout << "Headless runs are available through the CLI, e.g.\n";
  std::cout << "  tempest_cli --scenario data/scenarios/default.json --duration 200\n\n";
  std::cout << "Install SDL2 and Dear ImGui (with the SDL2 / SDL_Renderer2 backends) and reconfigure\n";
  std::cout << "to build the UI.\n";
}

} // namespace

int main(int argc, char** argv) {
  if (has_flag(argc, argv, "--version")) {
    std::cout << TEMPEST_VERSION << "\n";
    return kExitOk;
  }
  if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
    print_usage(argv[0]);
    return kExitOk;
  }

  std::cerr << "Tempest UI is unavailable in this build.\n";
  std::cerr << "Reason: " << TEMPEST_UI_UNAVAILABLE_REASON << "\n";
  if (has_flag(argc, argv, "--require-ui")) return kExitUiRequired;
  std::cerr << "Run with --help for details.\n";
  return kExitOk;
}
