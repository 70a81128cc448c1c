#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "splitjoin/pipeline/actions.hpp"
#include "splitjoin/pipeline/events.hpp"
#include "splitjoin/pipeline/guards.hpp"
#include "splitjoin/sm.hpp"

namespace splitjoin::pipeline {

/*
Pipeline architecture notes

Scope
- Component boundary: pipeline
- Goal: fetch a message, split it into tokens, rejoin them, capitalize the result.

State purpose
- initialized: idle, accepts run requests.
- fetching_message: pulls the message through the request's source callback.
- splitting: dispatches the message to the owned splitter machine.
- joining: dispatches the token list to the owned joiner machine.
- capitalizing: uppercases the first character of the joined text.
- done: last request completed; result written to `result_out`.
- errored: last request failed; `failed_phase` and `last_error` describe why.
- unexpected: sequencing contract violation (event not valid in current state).

Key invariants
- Token order produced by the splitter reaches the joiner unchanged.
- `result_out` is written only on success.
- Context owns the child machines and the per-request token list; both are reset by begin_run.
*/

struct initialized {};
struct fetching_message {};
struct splitting {};
struct joining {};
struct capitalizing {};
struct done {};
struct errored {};
struct unexpected {};

struct model {
  auto operator()() const {
    namespace sml = boost::sml;

    return sml::make_transition_table(
      *sml::state<initialized> + sml::event<event::run>[guard::valid_request{}] /
          action::begin_run = sml::state<fetching_message>,
      sml::state<initialized> + sml::event<event::run>[guard::invalid_request{}] /
          action::reject_invalid = sml::state<errored>,

      sml::state<fetching_message> + sml::on_entry<sml::_> / action::fetch_message,
      sml::state<fetching_message>[guard::phase_ok{}] = sml::state<splitting>,
      sml::state<fetching_message>[guard::phase_failed{}] / action::ensure_last_error =
          sml::state<errored>,

      sml::state<splitting> + sml::on_entry<sml::_> / action::run_split,
      sml::state<splitting>[guard::phase_ok{}] = sml::state<joining>,
      sml::state<splitting>[guard::phase_failed{}] / action::ensure_last_error =
          sml::state<errored>,

      sml::state<joining> + sml::on_entry<sml::_> / action::run_join,
      sml::state<joining>[guard::phase_ok{}] = sml::state<capitalizing>,
      sml::state<joining>[guard::phase_failed{}] / action::ensure_last_error =
          sml::state<errored>,

      sml::state<capitalizing> + sml::on_entry<sml::_> / action::run_capitalize,
      sml::state<capitalizing>[guard::phase_ok{}] / action::publish = sml::state<done>,
      sml::state<capitalizing>[guard::phase_failed{}] / action::ensure_last_error =
          sml::state<errored>,

      sml::state<done> + sml::event<event::run>[guard::valid_request{}] /
          action::begin_run = sml::state<fetching_message>,
      sml::state<done> + sml::event<event::run>[guard::invalid_request{}] /
          action::reject_invalid = sml::state<errored>,

      sml::state<errored> + sml::event<event::run>[guard::valid_request{}] /
          action::begin_run = sml::state<fetching_message>,
      sml::state<errored> + sml::event<event::run>[guard::invalid_request{}] /
          action::reject_invalid = sml::state<errored>,

      sml::state<unexpected> + sml::event<event::run>[guard::valid_request{}] /
          action::begin_run = sml::state<fetching_message>,
      sml::state<unexpected> + sml::event<event::run>[guard::invalid_request{}] /
          action::reject_invalid = sml::state<errored>,

      sml::state<initialized> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>,
      sml::state<fetching_message> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>,
      sml::state<splitting> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>,
      sml::state<joining> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>,
      sml::state<capitalizing> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>,
      sml::state<done> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>,
      sml::state<errored> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>,
      sml::state<unexpected> + sml::unexpected_event<sml::_> / action::on_unexpected =
          sml::state<unexpected>
    );
  }
};

struct sm : public splitjoin::sm<model> {
  using base_type = splitjoin::sm<model>;

  sm() : base_type(context_) {}

  bool process_event(const event::run & ev) {
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
        ev.on_done(events::run_done{
          .request = &ev,
          .text = std::string_view(*ev.result_out),
          .token_count = context_.token_count,
        });
      }
    } else if (ev.on_error) {
      ev.on_error(events::run_error{
        .err = err,
        .phase = context_.failed_phase,
        .request = &ev,
      });
    }

    action::clear_request(context_);
    return accepted && ok;
  }

  using base_type::process_event;

  int32_t last_error() const noexcept { return context_.last_error; }
  event::phase failed_phase() const noexcept { return context_.failed_phase; }
  size_t token_count() const noexcept { return context_.token_count; }

 private:
  action::context context_{};
};

}  // namespace splitjoin::pipeline
