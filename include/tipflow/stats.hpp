#pragma once

#include <cstdint>

#include "fare.hpp"

namespace tipflow {
/// Counters of one pipeline run
struct pipeline_stats {
  std::uint64_t accepted{};
  std::uint64_t late{};
  std::uint64_t negative_tip{};
  std::uint64_t invalid_tip{};
  std::uint64_t invalid_timestamp{};
  std::uint64_t malformed{};

  std::uint64_t windows_closed{};  ///< windows emitted by the first stage
  std::uint64_t records_emitted{}; ///< per-driver records emitted by the first stage
  std::uint64_t maxima_emitted{};  ///< records delivered to the sink

  std::uint64_t rejected() const noexcept { return negative_tip + invalid_tip + invalid_timestamp + malformed; }

  void count(fare_status s) noexcept {
    switch (s) {
    case fare_status::ok:
      ++accepted;
      break;
    case fare_status::late:
      ++late;
      break;
    case fare_status::negative_tip:
      ++negative_tip;
      break;
    case fare_status::invalid_tip:
      ++invalid_tip;
      break;
    case fare_status::invalid_timestamp:
      ++invalid_timestamp;
      break;
    case fare_status::malformed:
      ++malformed;
      break;
    }
  }
};
} // namespace tipflow
