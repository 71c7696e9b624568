#ifndef COUNTERFIT_SUCCESS_EVALUATOR_HPP
#define COUNTERFIT_SUCCESS_EVALUATOR_HPP

#include "attack_session.hpp"

namespace counterfit {

// Per-sample success of a completed attack, read from its initial and final queries only.
// targeted:   final label == vocabulary[target class of the sample]
// untargeted: final label != initial label
std::vector<bool> is_success(const AttackSession &session, const std::vector<Label> &vocabulary);

}

#endif //COUNTERFIT_SUCCESS_EVALUATOR_HPP
