#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "splitjoin/sm.hpp"
#include "splitjoin/text/joiner/actions.hpp"
#include "splitjoin/text/joiner/events.hpp"
#include "splitjoin/text/joiner/guards.hpp"

namespace splitjoin::text::joiner {

struct initialized {};
struct joining {};
struct done {};
struct errored {};
struct unexpected {};

/**
 * joiner orchestration model.
 *
 * state purposes:
 * - `initialized`: wait for a join request.
 * - `joining`: concatenate tokens into `text_out`.
 * - `done`/`errored`: terminal outcomes for a request.
 * - `unexpected`: sequencing contract violation.
 *
 * guard semantics:
 * - `valid_request`/`invalid_request`: `tokens` and `text_out` must be set.
 *
 * action side effects:
 * - `begin_join`: capture inputs and reset `error_out`.
 * - `run_join`: overwrite `text_out`; an empty list yields "".
 * - `reject_invalid`/`on_unexpected`: report SPLITJOIN_ERR_INVALID_ARGUMENT.
 */
struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
        *sml::state<initialized> + sml::event<event::join>[guard::valid_request{}] /
                action::begin_join = sml::state<joining>,
        sml::state<initialized> + sml::event<event::join>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<joining> + sml::on_entry<sml::_> / action::run_join,
        sml::state<joining> = sml::state<done>,

        sml::state<done> + sml::event<event::join>[guard::valid_request{}] /
                action::begin_join = sml::state<joining>,
        sml::state<done> + sml::event<event::join>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<errored> + sml::event<event::join>[guard::valid_request{}] /
                action::begin_join = sml::state<joining>,
        sml::state<errored> + sml::event<event::join>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<unexpected> + sml::event<event::join>[guard::valid_request{}] /
                action::begin_join = sml::state<joining>,
        sml::state<unexpected> + sml::event<event::join>[guard::invalid_request{}] /
                action::reject_invalid = sml::state<errored>,

        sml::state<initialized> + sml::unexpected_event<sml::_> /
                action::on_unexpected = sml::state<unexpected>,
        sml::state<joining> + sml::unexpected_event<sml::_> /
                action::on_unexpected = sml::state<unexpected>,
        sml::state<done> + sml::unexpected_event<sml::_> /
                action::on_unexpected = sml::state<unexpected>,
        sml::state<errored> + sml::unexpected_event<sml::_> /
                action::on_unexpected = sml::state<unexpected>,
        sml::state<unexpected> + sml::unexpected_event<sml::_> /
                action::on_unexpected = sml::state<unexpected>);
  }
};

struct sm : public splitjoin::sm<model> {
  using base_type = splitjoin::sm<model>;

  sm() : base_type(context_) {}

  bool process_event(const event::join & ev) {
    namespace sml = boost::sml;

    const bool accepted = base_type::process_event(ev);
    const bool ok = this->is(sml::state<done>);
    const int32_t err =
        ok ? SPLITJOIN_OK
           : (context_.last_error != SPLITJOIN_OK ? context_.last_error
                                                  : SPLITJOIN_ERR_BACKEND);

    if (ev.error_out != nullptr) {
      *ev.error_out = err;
    }
    if (ok) {
      if (ev.on_done) {
        ev.on_done(events::joining_done{
            .request = &ev,
            .text = std::string_view(*ev.text_out),
            .token_count = context_.token_count,
        });
      }
    } else if (ev.on_error) {
      ev.on_error(events::joining_error{.err = err, .request = &ev});
    }

    return accepted && ok;
  }

  using base_type::process_event;

  size_t token_count() const noexcept { return context_.token_count; }
  int32_t last_error() const noexcept { return context_.last_error; }

 private:
  action::context context_{};
};

}  // namespace splitjoin::text::joiner
