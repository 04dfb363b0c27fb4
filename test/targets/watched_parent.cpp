#include <iostream>
#include <libfgproxy/foreground.hpp>

// Runs run_endlessly under a watchdog and reports its pid.
int main() {
  auto& self = fgproxy::current_process::instance();
  auto result = fgproxy::spawn("targets/run_endlessly");
  std::cout << result.child->pid() << std::endl;

  fgproxy::conclude(self.loop(), result.close);
  self.loop().run();
  return 0;
}
