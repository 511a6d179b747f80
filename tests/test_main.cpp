#include "test.h"

#include "tempest/util/log.h"

int main() {
  // Engine debug output would drown the assertion messages.
  tempest::log::set_level(tempest::log::Level::Warn);

  int fails = 0;
  fails += test_ode();
  fails += test_ecology();
  fails += test_network();
  fails += test_hazards();
  fails += test_simulation();
  fails += test_network_io();
  fails += test_scenario();
  fails += test_history_export();
  fails += test_json_errors();
  fails += test_file_io();
  fails += test_log();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
