#ifndef COUNTERFIT_NOISE_ATTACK_HPP
#define COUNTERFIT_NOISE_ATTACK_HPP

#include "attack_runner.hpp"
#include "random.hpp"

// A baseline runner for numeric samples: each round adds gaussian noise of scale "epsilon" to the
// original samples that have not flipped yet, clipped to the target's value range, and queries
// them as one batch. A sample keeps the first candidate that reaches the goal, otherwise it is
// returned unchanged after "max_iter" rounds.
struct RandomNoiseRunner : public counterfit::AttackRunner {
  std::vector<counterfit::Sample> run(const counterfit::AttackRequest &request) override {
    using namespace counterfit;
    const float epsilon = request.parameters_.value("epsilon", 0.05f);
    const size_t max_iter = request.parameters_.value("max_iter", (size_t) 100);
    const auto &info = request.target_;
    const auto &samples = request.samples_;
    const bool targeted = !request.target_classes_.empty();

    std::vector<Sample> best = samples;
    std::vector<bool> done(samples.size(), false);
    for (size_t iter = 0; iter < max_iter; iter++) {
      std::vector<size_t> idxes{};
      std::vector<Sample> candidates{};
      for (size_t i = 0; i < samples.size(); i++) {
        if (done[i]) continue;
        if (samples[i].kind_ != SampleKind::NumericArray) {
          throw std::invalid_argument("random noise needs numeric samples");
        }
        Sample candidate = samples[i];
        Eigen::Array<float, Eigen::Dynamic, 1> noise(candidate.values_.size());
        counterfit_fill_randn(noise);
        candidate.values_ = counterfit_clip(candidate.values_ + epsilon * noise,
                                            info.clip_min_, info.clip_max_);
        idxes.push_back(i);
        candidates.push_back(std::move(candidate));
      }
      if (candidates.empty()) break;

      auto outputs = request.query_(candidates);
      auto labels = request.label_deriver_.derive_labels(outputs);
      for (size_t j = 0; j < idxes.size(); j++) {
        size_t i = idxes[j];
        bool reached;
        if (targeted) {
          reached = labels[j] == info.output_classes_.at(request.target_classes_[i]);
        } else {
          reached = labels[j] != request.initial_labels_[i];
        }
        if (reached) {
          best[i] = std::move(candidates[j]);
          done[i] = true;
        }
      }
    }
    return best;
  }
};

#endif //COUNTERFIT_NOISE_ATTACK_HPP
