/**
 * CircularBuffer Unit Tests
 *
 * Validates:
 * - Overwrite-oldest once full
 * - Oldest-first snapshots and the `limit` tail
 * - Construction rejects non-positive capacity
 */

#include <doctest/doctest.h>
#include <stdexcept>
#include <string>
#include <trellis/circular_buffer.hpp>
#include <vector>

using trellis::CircularBuffer;

TEST_CASE("circular_buffer: keeps the newest items in insertion order") {
  CircularBuffer<std::string> buf(3);
  for (const char* s : {"a", "b", "c", "d", "e"}) buf.add(s);

  CHECK(buf.get_all() == std::vector<std::string>{"c", "d", "e"});
  CHECK(buf.size() == 3);
  CHECK(buf.full());
  CHECK(buf.oldest() == std::string("c"));
  CHECK(buf.newest() == std::string("e"));
}

TEST_CASE("circular_buffer: capacity one holds only the latest item") {
  CircularBuffer<int> buf(1);
  buf.add(1);
  CHECK(buf.get_all() == std::vector<int>{1});
  buf.add(2);
  buf.add(3);
  CHECK(buf.get_all() == std::vector<int>{3});
  CHECK(buf.oldest() == buf.newest());
}

TEST_CASE("circular_buffer: limit returns the most recent items") {
  CircularBuffer<int> buf(5);
  for (int i = 1; i <= 7; ++i) buf.add(i);  // holds 3..7

  CHECK(buf.get_all(2) == std::vector<int>{6, 7});
  CHECK(buf.get_all(0).empty());
  CHECK(buf.get_all(100) == std::vector<int>{3, 4, 5, 6, 7});
}

TEST_CASE("circular_buffer: partially filled buffer reads from the start") {
  CircularBuffer<int> buf(4);
  buf.add(10);
  buf.add(20);
  CHECK(buf.get_all() == std::vector<int>{10, 20});
  CHECK_FALSE(buf.full());
  CHECK(buf.newest() == 20);
}

TEST_CASE("circular_buffer: clear keeps capacity") {
  CircularBuffer<int> buf(2);
  buf.add(1);
  buf.add(2);
  buf.add(3);
  buf.clear();

  CHECK(buf.empty());
  CHECK(buf.capacity() == 2);
  CHECK_FALSE(buf.oldest().has_value());

  buf.add(4);
  CHECK(buf.get_all() == std::vector<int>{4});
}

TEST_CASE("circular_buffer: rejects capacity below one") {
  CHECK_THROWS_AS(CircularBuffer<int>(0), std::invalid_argument);
  CHECK_THROWS_AS(CircularBuffer<int>(-3), std::invalid_argument);
}
