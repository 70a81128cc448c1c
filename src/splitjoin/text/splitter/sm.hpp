#pragma once

#include <cstddef>
#include <cstdint>

#include "splitjoin/sm.hpp"
#include "splitjoin/text/splitter/actions.hpp"
#include "splitjoin/text/splitter/events.hpp"
#include "splitjoin/text/splitter/guards.hpp"

namespace splitjoin::text::splitter {

// Splitter contract:
// - `event::split` requires `tokens_out`; `error_out` and callbacks are optional.
// - `tokens_out` is cleared and then receives every non-empty run of non-delimiter
//   characters in input order. Leading, trailing and repeated delimiters yield no tokens.
// - `delimiter_policy::whitespace` treats " \t\n\v\f\r" as delimiters,
//   `delimiter_policy::space` only ' '.
// - An invalid request leaves `tokens_out` untouched and reports
//   SPLITJOIN_ERR_INVALID_ARGUMENT.

// Ready state. Invariant: no split in progress.
struct initialized {};
// Fills the output list.
struct splitting {};
// Terminal success state.
struct done {};
// Terminal error: invalid request.
struct invalid_request {};
// Terminal error: event not valid in the current state.
struct unexpected_event {};

struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
      *sml::state<initialized> + sml::event<event::split>[guard::request_is_valid] /
          action::begin_split = sml::state<splitting>,
      sml::state<initialized> + sml::event<event::split>[guard::request_is_invalid] /
          action::reject_invalid = sml::state<invalid_request>,

      sml::state<splitting> + sml::on_entry<sml::_> / action::run_split,
      sml::state<splitting> = sml::state<done>,

      sml::state<done> + sml::event<event::split>[guard::request_is_valid] /
          action::begin_split = sml::state<splitting>,
      sml::state<done> + sml::event<event::split>[guard::request_is_invalid] /
          action::reject_invalid = sml::state<invalid_request>,

      sml::state<invalid_request> + sml::event<event::split>[guard::request_is_valid] /
          action::begin_split = sml::state<splitting>,
      sml::state<invalid_request> + sml::event<event::split>[guard::request_is_invalid] /
          action::reject_invalid = sml::state<invalid_request>,

      sml::state<unexpected_event> + sml::event<event::split>[guard::request_is_valid] /
          action::begin_split = sml::state<splitting>,
      sml::state<unexpected_event> + sml::event<event::split>[guard::request_is_invalid] /
          action::reject_invalid = sml::state<invalid_request>,

      sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected_event>,
      sml::state<splitting> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected_event>,
      sml::state<done> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected_event>,
      sml::state<invalid_request> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected_event>,
      sml::state<unexpected_event> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected_event>
    );
  }
};

struct sm : public splitjoin::sm<model> {
  using base_type = splitjoin::sm<model>;

  sm() : base_type(context_) {}

  bool process_event(const event::split & ev) {
    namespace sml = boost::sml;
    const bool accepted = base_type::process_event(ev);
    const bool ok = this->is(sml::state<done>);

    if (ok) {
      action::dispatch_done(ev, context_);
    } else {
      action::dispatch_error(ev, context_);
    }

    return accepted && ok;
  }

  template <class Event>
  bool process_event(const Event & ev) {
    return base_type::process_event(ev);
  }

  size_t token_count() const noexcept { return context_.token_count; }
  int32_t last_error() const noexcept { return context_.last_error; }

 private:
  action::context context_{};
};

}  // namespace splitjoin::text::splitter
