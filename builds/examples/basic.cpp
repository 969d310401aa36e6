#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "synctimer/synctimer.hpp"

using namespace std::chrono_literals;

static std::string thread_name() {
  std::ostringstream out;
  out << std::this_thread::get_id();
  return out.str();
}

static void tick_with(const char *label) {
  std::cout << "tick from thread " << thread_name() << ": " << label
            << std::endl;
}

int main() {
  synctimer::timer t;
  std::cout << "starting timer on thread " << thread_name()
            << "; will run for 10 seconds" << std::endl;

  t.schedule_repeating(1s, [] { tick_with("1"); }).detach();
  t.schedule_repeating(500ms, [] { tick_with("0.5"); }).detach();
  auto tick_2 = t.schedule_repeating(2s, [] { tick_with("2"); });

  std::this_thread::sleep_for(5s);
  t.schedule_immediately(
      [] { std::cout << "tick 2 should stop now" << std::endl; });
  tick_2.cancel();

  std::this_thread::sleep_for(5s);
  return 0;
}
