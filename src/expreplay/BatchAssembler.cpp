#include "BatchAssembler.hpp"
#include "Errors.hpp"

#include <cassert>
#include <string>

using namespace expreplay;

Batch BatchAssembler::Assemble(const vector<ExperienceMoment> &moments) {
  if (moments.empty()) {
    throw EmptyBatch("cannot assemble a batch from zero moments");
  }

  const unsigned k = moments.size();

  Batch batch;
  batch.states.resize(k);
  batch.actions.resize(k);
  batch.rewards.resize(k);
  batch.nextStates.resize(k);
  batch.dones.resize(k);

  for (unsigned i = 0; i < k; i++) {
    const ExperienceMoment &moment = moments[i];
    assert(moment.state.rows() == moments[0].state.rows());
    assert(moment.nextState.rows() == moment.state.rows());
    assert(moment.action.rows() == moments[0].action.rows());

    batch.states[i] = moment.state;
    batch.actions[i] = moment.action;
    batch.rewards(i) = moment.reward;
    batch.nextStates[i] = moment.nextState;
    batch.dones[i] = moment.done;
  }

  return batch;
}

EMatrix BatchAssembler::StackRows(const vector<EVector> &vectors) {
  if (vectors.empty()) {
    throw EmptyBatch("cannot stack zero vectors");
  }

  EMatrix result(vectors.size(), vectors[0].rows());
  for (unsigned i = 0; i < vectors.size(); i++) {
    if (vectors[i].rows() != result.cols()) {
      throw ReplayError("row " + std::to_string(i) + " has length " +
                        std::to_string(vectors[i].rows()) + ", expected " +
                        std::to_string(result.cols()));
    }
    result.row(i) = vectors[i].transpose();
  }
  return result;
}
