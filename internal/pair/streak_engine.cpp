#include "streak_engine.hpp"

#include <algorithm>

#include "internal/model/pair_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace streak::pair {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

StreakEngine::StreakEngine(std::shared_ptr<PairStreakStore> store, std::shared_ptr<const util::Clock> clock,
                           EngineOptions options)
    : store_(std::move(store)), clock_(std::move(clock)), options_(options) {
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

util::Deadline StreakEngine::DefaultDeadline() const {
  if (options_.default_deadline) {
    return util::Deadline::After(*options_.default_deadline);
  }
  return util::Deadline::Never();
}

Transition StreakEngine::Apply(const model::PairStreak& current, bool sender_is_low, util::TimePoint now,
                               std::chrono::milliseconds window) {
  Transition t;
  t.next = current;
  auto& next = t.next;

  if (model::IsExpired(current, now)) {
    next.current_streak    = 0;
    next.streak_started_at = std::nullopt;
    next.last_action_a     = std::nullopt;
    next.last_action_b     = std::nullopt;
    next.LastAction(sender_is_low) = now;
    next.streak_expires_at = now + window;
    t.state                = model::PairState::kExpired;
    return t;
  }

  next.LastAction(sender_is_low) = now;

  if (model::OtherSideCounts(current.LastAction(!sender_is_low), now, window)) {
    next.current_streak += 1;
    next.longest_streak = std::max(next.longest_streak, next.current_streak);
    next.last_action_a  = std::nullopt;
    next.last_action_b  = std::nullopt;
    if (!next.streak_started_at) {
      next.streak_started_at = now;
    }
    next.streak_expires_at = now + window;
    t.state                = model::PairState::kBothActed;
    t.increased            = true;
    return t;
  }

  next.streak_expires_at = now + window;
  next.longest_streak    = std::max(next.longest_streak, next.current_streak);
  t.state                = model::PairState::kOneSided;
  return t;
}

ActionResult StreakEngine::RecordAction(const std::string& sender_id, const std::string& receiver_id) {
  return RecordAction(sender_id, receiver_id, clock_->Now(), DefaultDeadline());
}

ActionResult StreakEngine::RecordAction(const std::string& sender_id, const std::string& receiver_id,
                                        util::TimePoint now) {
  return RecordAction(sender_id, receiver_id, now, DefaultDeadline());
}

ActionResult StreakEngine::RecordAction(const std::string& sender_id, const std::string& receiver_id,
                                        util::TimePoint now, const util::Deadline& deadline) {
  return observability::ObserveCall("StreakEngine.RecordAction", sender_id + "->" + receiver_id, [&] {
    const auto key = model::Canonicalize(sender_id, receiver_id);

    for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
      if (deadline.Expired()) {
        throw util::Timeout("record action " + sender_id + "->" + receiver_id + ": deadline exceeded after " +
                            std::to_string(attempt - 1) + " attempt(s)");
      }

      const auto current    = store_->GetOrCreate(key.low, key.high);
      const auto transition = Apply(current, key.is_low_side, now, options_.pair_window);

      if (store_->CompareAndSwap(current, transition.next)) {
        observability::Metrics::Instance().RecordPairTransition(model::PairStateName(transition.state));
        if (transition.state != model::PairState::kOneSided) {
          STREAK_LOG_INFO("pair streak transition",
                          {StringField("pair", key.low + "/" + key.high),
                           StringField("state", model::PairStateName(transition.state)),
                           IntField("current_streak", transition.next.current_streak),
                           IntField("longest_streak", transition.next.longest_streak)});
        }
        return ActionResult{transition.next.current_streak, transition.next.longest_streak, transition.increased};
      }

      observability::Metrics::Instance().RecordCasConflict("pair_streak");
      STREAK_LOG_WARN("pair streak version conflict, retrying",
                      {StringField("pair", key.low + "/" + key.high), IntField("attempt", attempt)});
    }

    throw util::ConcurrentUpdateConflict("record action " + sender_id + "->" + receiver_id + ": gave up after " +
                                         std::to_string(options_.max_attempts) + " attempts");
  });
}

std::optional<model::PairStreak> StreakEngine::GetPairStreak(const std::string& user_a, const std::string& user_b) {
  const auto key = model::Canonicalize(user_a, user_b);
  return store_->Get(key.low, key.high);
}

std::vector<model::PairStreakView> StreakEngine::ListPairStreaks(const std::string& user_id) {
  return ListPairStreaks(user_id, clock_->Now());
}

std::vector<model::PairStreakView> StreakEngine::ListPairStreaks(const std::string& user_id, util::TimePoint now) {
  if (user_id.empty()) {
    throw util::InvalidArgument("user id must not be empty");
  }

  std::vector<model::PairStreakView> views;
  for (const auto& streak : store_->ListForUser(user_id)) {
    const bool low_side = streak.id_a == user_id;

    model::PairStreakView view;
    view.friend_id          = low_side ? streak.id_b : streak.id_a;
    view.current_streak     = streak.current_streak;
    view.longest_streak     = streak.longest_streak;
    view.my_last_action     = streak.LastAction(low_side);
    view.friend_last_action = streak.LastAction(!low_side);
    view.streak_started_at  = streak.streak_started_at;
    view.streak_expires_at  = streak.streak_expires_at;

    view.expired             = model::IsExpired(streak, now);
    view.is_active           = streak.current_streak > 0;
    view.needs_my_action     = !view.expired && view.friend_last_action && !view.my_last_action;
    view.needs_friend_action = !view.expired && view.my_last_action && !view.friend_last_action;
    views.push_back(std::move(view));
  }

  std::sort(views.begin(), views.end(), [](const auto& a, const auto& b) {
    if (a.current_streak != b.current_streak) {
      return a.current_streak > b.current_streak;
    }
    return a.friend_id < b.friend_id;
  });
  return views;
}

} // namespace streak::pair
