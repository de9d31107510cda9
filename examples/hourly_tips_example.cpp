#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <string>

#include "tipflow/hourly_tips.hpp"

// Reads fares as CSV from the file given as first argument, or stdin, and prints the top-tipped driver of
// every hour as (window_end,driver,tip_sum).
//
//   rideId,taxiId,driverId,startTime,paymentType,tip,tolls,totalFare
//   driverId,startTime,tip
//
// Set TIPFLOW_LOG_LEVEL=debug to see rejected fares and window closures.
int main(int argc, char **argv) {
  using namespace tipflow;

  if (char const *level = std::getenv("TIPFLOW_LOG_LEVEL")) {
    set_log_level(spdlog::level::from_str(level));
  }

  std::ifstream file;
  if (argc > 1) {
    file.open(argv[1]);
    if (!file) {
      logger()->error("cannot open {}", argv[1]);
      return 1;
    }
  }
  std::istream &in = argc > 1 ? file : std::cin;

  hourly_tips<double> p(pipeline_config{}, [](hourly_tip const &r) { std::cout << r << '\n'; });

  try {
    std::string line;
    while (std::getline(in, line)) {
      if (line.empty() || line.front() == '#') {
        continue;
      }
      p.on_line(line);
    }
    p.finish();
  } catch (std::exception const &e) {
    logger()->error("pipeline stopped: {}", e.what());
    return 2;
  }

  return 0;
}
