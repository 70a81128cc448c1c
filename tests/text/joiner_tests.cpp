#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include <boost/sml.hpp>
#include <doctest/doctest.h>

#include "splitjoin/callback.hpp"
#include "splitjoin/list/token_list.hpp"
#include "splitjoin/splitjoin.h"
#include "splitjoin/text/joiner/sm.hpp"
#include "splitjoin/text/splitter/sm.hpp"

namespace {

namespace joiner = splitjoin::text::joiner;

struct join_capture {
  std::string text = {};
  size_t token_count = 0;
  int32_t err = SPLITJOIN_OK;
  bool done_called = false;
  bool error_called = false;

  void on_done(const joiner::events::joining_done & ev) noexcept {
    done_called = true;
    text = std::string(ev.text);
    token_count = ev.token_count;
  }

  void on_error(const joiner::events::joining_error & ev) noexcept {
    error_called = true;
    err = ev.err;
  }
};

splitjoin::list::token_list make_tokens(std::initializer_list<std::string_view> values) {
  splitjoin::list::token_list tokens{};
  for (const std::string_view value : values) {
    tokens.add(value);
  }
  return tokens;
}

std::string split_then_join(const std::string_view text) {
  splitjoin::text::splitter::sm splitter{};
  joiner::sm machine{};
  splitjoin::list::token_list tokens{};
  std::string out;
  CHECK(splitter.process_event(splitjoin::text::splitter::event::split{
    .text = text,
    .tokens_out = &tokens,
  }));
  CHECK(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .text_out = &out,
  }));
  return out;
}

}  // namespace

TEST_CASE("text_joiner_starts_initialized") {
  joiner::sm machine{};
  CHECK(machine.is(boost::sml::state<joiner::initialized>));
}

TEST_CASE("text_joiner_joins_with_single_space") {
  joiner::sm machine{};
  const splitjoin::list::token_list tokens = make_tokens({"the", "quick", "brown", "fox"});
  std::string out = "stale";
  join_capture capture{};
  int32_t err = SPLITJOIN_ERR_BACKEND;

  CHECK(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .text_out = &out,
    .error_out = &err,
    .on_done = splitjoin::callback<void(const joiner::events::joining_done &)>::from<
      join_capture, &join_capture::on_done>(&capture),
    .on_error = splitjoin::callback<void(const joiner::events::joining_error &)>::from<
      join_capture, &join_capture::on_error>(&capture),
  }));

  CHECK(err == SPLITJOIN_OK);
  CHECK(out == "the quick brown fox");
  CHECK(capture.done_called);
  CHECK(capture.text == "the quick brown fox");
  CHECK(capture.token_count == 4);
  CHECK(machine.is(boost::sml::state<joiner::done>));
}

TEST_CASE("text_joiner_empty_list_yields_empty_string") {
  joiner::sm machine{};
  const splitjoin::list::token_list tokens{};
  std::string out = "stale";

  CHECK(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .text_out = &out,
  }));
  CHECK(out.empty());
  CHECK(machine.token_count() == 0);
}

TEST_CASE("text_joiner_single_token_has_no_separator") {
  joiner::sm machine{};
  const splitjoin::list::token_list tokens = make_tokens({"alone"});
  std::string out;

  CHECK(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .separator = ", ",
    .text_out = &out,
  }));
  CHECK(out == "alone");
}

TEST_CASE("text_joiner_honors_custom_separator") {
  joiner::sm machine{};
  const splitjoin::list::token_list tokens = make_tokens({"a", "b", "c"});
  std::string out;

  CHECK(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .separator = "-+-",
    .text_out = &out,
  }));
  CHECK(out == "a-+-b-+-c");
}

TEST_CASE("text_joiner_rejects_missing_pointers") {
  joiner::sm machine{};
  const splitjoin::list::token_list tokens = make_tokens({"a"});
  std::string out;
  join_capture capture{};
  int32_t err = SPLITJOIN_OK;

  CHECK_FALSE(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .error_out = &err,
    .on_error = splitjoin::callback<void(const joiner::events::joining_error &)>::from<
      join_capture, &join_capture::on_error>(&capture),
  }));
  CHECK(err == SPLITJOIN_ERR_INVALID_ARGUMENT);
  CHECK(capture.error_called);
  CHECK(capture.err == SPLITJOIN_ERR_INVALID_ARGUMENT);
  CHECK(machine.is(boost::sml::state<joiner::errored>));

  err = SPLITJOIN_OK;
  CHECK_FALSE(machine.process_event(joiner::event::join{
    .text_out = &out,
    .error_out = &err,
  }));
  CHECK(err == SPLITJOIN_ERR_INVALID_ARGUMENT);

  CHECK(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .text_out = &out,
    .error_out = &err,
  }));
  CHECK(err == SPLITJOIN_OK);
  CHECK(out == "a");
}

TEST_CASE("text_joiner_normalizes_whitespace_after_split") {
  CHECK(split_then_join("the quick brown fox") == "the quick brown fox");
  CHECK(split_then_join("a   b") == "a b");
  CHECK(split_then_join("  lead and trail  ") == "lead and trail");
  CHECK(split_then_join("tab\tand\nnewline") == "tab and newline");
  CHECK(split_then_join("") == "");
}

TEST_CASE("text_joiner_on_unexpected_sets_error") {
  joiner::action::context ctx{};
  struct stray_event {
    int32_t * error_out = nullptr;
  };
  int32_t err = SPLITJOIN_OK;

  struct joiner::action::on_unexpected handler {};
  handler(stray_event{.error_out = &err}, ctx);
  CHECK(err == SPLITJOIN_ERR_INVALID_ARGUMENT);
  CHECK(ctx.last_error == SPLITJOIN_ERR_INVALID_ARGUMENT);
}

TEST_CASE("text_joiner_separator_may_view_output_buffer") {
  joiner::sm machine{};
  const splitjoin::list::token_list tokens = make_tokens({"left", "middle", "right"});
  std::string out = "::previous contents long enough to leave the small buffer";
  const std::string_view separator = std::string_view(out).substr(0, 2);

  CHECK(machine.process_event(joiner::event::join{
    .tokens = &tokens,
    .separator = separator,
    .text_out = &out,
  }));
  CHECK(out == "left::middle::right");
}
