#include <gtest/gtest.h>

#include <redial/lifecycle_state.hpp>

#include <iterator>
#include <set>
#include <sstream>
#include <string>
#include <string_view>

using redial::lifecycle_state;

namespace {

constexpr lifecycle_state all_states[] = {
  lifecycle_state::connecting,   lifecycle_state::reconnecting, lifecycle_state::connected,
  lifecycle_state::disconnected, lifecycle_state::failing,      lifecycle_state::failed,
  lifecycle_state::closed,
};

}  // namespace

TEST(lifecycle_state_test, names_are_non_empty_and_distinct) {
  std::set<std::string> names;
  for (auto s : all_states) {
    std::string name = redial::to_string(s);
    EXPECT_FALSE(name.empty());
    names.insert(name);
  }
  EXPECT_EQ(names.size(), std::size(all_states));
}

TEST(lifecycle_state_test, names_match_states) {
  static_assert(std::string_view{redial::to_string(lifecycle_state::connecting)} == "connecting");
  EXPECT_STREQ(redial::to_string(lifecycle_state::reconnecting), "reconnecting");
  EXPECT_STREQ(redial::to_string(lifecycle_state::connected), "connected");
  EXPECT_STREQ(redial::to_string(lifecycle_state::disconnected), "disconnected");
  EXPECT_STREQ(redial::to_string(lifecycle_state::failing), "failing");
  EXPECT_STREQ(redial::to_string(lifecycle_state::failed), "failed");
  EXPECT_STREQ(redial::to_string(lifecycle_state::closed), "closed");
}

TEST(lifecycle_state_test, stream_insertion_uses_name) {
  std::ostringstream os;
  os << lifecycle_state::failing << "/" << lifecycle_state::closed;
  EXPECT_EQ(os.str(), "failing/closed");
}

TEST(lifecycle_state_test, only_closed_and_failed_are_terminal) {
  for (auto s : all_states) {
    bool const expected = s == lifecycle_state::closed || s == lifecycle_state::failed;
    EXPECT_EQ(redial::is_terminal(s), expected) << s;
  }
}

TEST(lifecycle_state_death_test, out_of_range_value_is_unreachable) {
  auto const bogus = static_cast<lifecycle_state>(42);
  EXPECT_DEATH({ (void)redial::to_string(bogus); }, "UNREACHABLE");
}
