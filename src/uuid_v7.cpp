#include "util/uuid_v7.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <mutex>

namespace clientid {
namespace uuidutil {

namespace {

constexpr std::uint16_t kMaxRandA = 0x0FFF;

struct V7State {
  std::mutex mutex;
  std::uint64_t last_ms{0};
  std::uint16_t rand_a{0};
};

V7State &v7_state() {
  static V7State state;
  return state;
}

std::uint64_t now_unix_ms() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

} // namespace

boost::uuids::uuid generate_uuid_v7() {
  boost::uuids::random_generator gen;
  boost::uuids::uuid id = gen();

  std::uint64_t ms = now_unix_ms();
  std::uint16_t rand_a = 0;
  {
    auto &state = v7_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (ms > state.last_ms) {
      // Seed from the random bytes, keeping the top bit clear so the counter
      // has room before it has to borrow the next millisecond.
      state.last_ms = ms;
      state.rand_a = static_cast<std::uint16_t>(
          ((id.data[6] << 8) | id.data[7]) & 0x07FF);
    } else if (state.rand_a < kMaxRandA) {
      ++state.rand_a;
    } else {
      ++state.last_ms;
      state.rand_a = 0;
    }
    ms = state.last_ms;
    rand_a = state.rand_a;
  }

  for (int i = 0; i < 6; ++i) {
    id.data[i] = static_cast<std::uint8_t>((ms >> (40 - 8 * i)) & 0xFF);
  }
  id.data[6] = static_cast<std::uint8_t>(0x70 | ((rand_a >> 8) & 0x0F));
  id.data[7] = static_cast<std::uint8_t>(rand_a & 0xFF);
  id.data[8] = static_cast<std::uint8_t>((id.data[8] & 0x3F) | 0x80);
  return id;
}

std::string generate_uuid_v7_string() {
  return boost::uuids::to_string(generate_uuid_v7());
}

std::uint64_t uuid_v7_timestamp_ms(const boost::uuids::uuid &id) {
  std::uint64_t ms = 0;
  for (int i = 0; i < 6; ++i) {
    ms = (ms << 8) | id.data[i];
  }
  return ms;
}

} // namespace uuidutil
} // namespace clientid
