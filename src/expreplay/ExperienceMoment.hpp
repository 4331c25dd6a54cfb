#pragma once

#include "../math/Math.hpp"

#include <utility>

namespace expreplay {

// A single (state, action, reward, nextState, done) transition. State and action shapes are
// fixed per memory instance by the producer and are not re-checked on insertion.
struct ExperienceMoment {
  EVector state;
  EVector action;
  float reward;
  EVector nextState;
  bool done;

  ExperienceMoment() : reward(0.0f), done(false) {}
  ExperienceMoment(EVector state, EVector action, float reward, EVector nextState, bool done)
      : state(std::move(state)), action(std::move(action)), reward(reward),
        nextState(std::move(nextState)), done(done) {}

  // Discrete actions are stored as a length-1 vector holding the action index.
  ExperienceMoment(EVector state, unsigned actionIndex, float reward, EVector nextState,
                   bool done)
      : state(std::move(state)), action(EVector::Constant(1, static_cast<float>(actionIndex))),
        reward(reward), nextState(std::move(nextState)), done(done) {}
};
}
