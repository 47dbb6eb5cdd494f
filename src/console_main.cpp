#include "gambit/console.hpp"
#include <iostream>

int main() {
  std::cout << "Gambit. Type \"help\" for commands.\n";
  gambit::console_loop();
  return 0;
}
