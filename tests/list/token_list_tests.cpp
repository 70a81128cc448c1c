#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <doctest/doctest.h>

#include "splitjoin/list/token_list.hpp"

namespace {

std::vector<std::string> collect(const splitjoin::list::token_list & list) {
  std::vector<std::string> out;
  for (const std::string & token : list) {
    out.push_back(token);
  }
  return out;
}

}  // namespace

TEST_CASE("token_list_starts_empty") {
  splitjoin::list::token_list list{};
  CHECK(list.empty());
  CHECK(list.size() == 0);
  CHECK(list.begin() == list.end());
  CHECK(list.get(0) == nullptr);
}

TEST_CASE("token_list_add_preserves_insertion_order") {
  splitjoin::list::token_list list{};
  list.add("the");
  list.add(std::string("quick"));
  list.add(std::string_view("brown"));
  list.add("fox");

  CHECK(list.size() == 4);
  CHECK(collect(list) == std::vector<std::string>{"the", "quick", "brown", "fox"});
  REQUIRE(list.get(2) != nullptr);
  CHECK(*list.get(2) == "brown");
  CHECK(list.get(4) == nullptr);
}

TEST_CASE("token_list_keeps_duplicates") {
  splitjoin::list::token_list list{};
  list.add("a");
  list.add("a");
  CHECK(list.size() == 2);
  CHECK(collect(list) == std::vector<std::string>{"a", "a"});
}

TEST_CASE("token_list_remove_unlinks_first_match_only") {
  splitjoin::list::token_list list{};
  list.add("x");
  list.add("y");
  list.add("x");

  CHECK(list.remove("x"));
  CHECK(list.size() == 2);
  CHECK(collect(list) == std::vector<std::string>{"y", "x"});
  CHECK_FALSE(list.remove("missing"));
  CHECK(list.size() == 2);
}

TEST_CASE("token_list_remove_tail_keeps_append_working") {
  splitjoin::list::token_list list{};
  list.add("one");
  list.add("two");

  CHECK(list.remove("two"));
  list.add("three");
  CHECK(collect(list) == std::vector<std::string>{"one", "three"});

  CHECK(list.remove("one"));
  CHECK(list.remove("three"));
  CHECK(list.empty());
  list.add("again");
  CHECK(collect(list) == std::vector<std::string>{"again"});
}

TEST_CASE("token_list_clear_resets_state") {
  splitjoin::list::token_list list{};
  list.add("a");
  list.add("b");
  list.clear();
  CHECK(list.empty());
  CHECK(list.begin() == list.end());
  list.add("c");
  CHECK(list.size() == 1);
}

TEST_CASE("token_list_move_transfers_nodes") {
  splitjoin::list::token_list source{};
  source.add("left");
  source.add("right");

  splitjoin::list::token_list moved(std::move(source));
  CHECK(moved.size() == 2);
  CHECK(source.empty());
  source.add("fresh");
  CHECK(collect(source) == std::vector<std::string>{"fresh"});

  splitjoin::list::token_list assigned{};
  assigned.add("stale");
  assigned = std::move(moved);
  CHECK(collect(assigned) == std::vector<std::string>{"left", "right"});
  CHECK(moved.empty());
}

TEST_CASE("token_list_destroys_long_chains") {
  splitjoin::list::token_list list{};
  for (size_t i = 0; i < 200000; ++i) {
    list.add("t");
  }
  CHECK(list.size() == 200000);
  list.clear();
  CHECK(list.empty());
}
