#include "config.hpp"
#include "sample_pool.hpp"
#include "tensorflow_model.hpp"
#include "attack_controller.hpp"
#include "report_writer.hpp"
#include "noise_attack.hpp"

using namespace counterfit;

int main(int argc, char *argv[]) {
  const auto config = AttackConfig::from_args(argc, argv);
  if (chdir(config.dir_.c_str()) < 0) {
    perror("chdir()");
    std::exit(-1);
  }

  TargetInfo info{};
  info.model_name_ = config.model_;
  info.data_kind_ = SampleKind::NumericArray;
  info.input_shape_ = config.input_shape_;
  info.output_classes_ = config.labels_;
  info.clip_min_ = config.clip_min_;
  info.clip_max_ = config.clip_max_;

  auto X = load_hdf5_samples(config.dataset_, config.dataset_name_, config.input_shape_);
  logi("loaded %lu samples from %s:%s", X.size(), config.dataset_.c_str(),
       config.dataset_name_.c_str());
  auto model = std::make_unique<TensorflowModel>(
      config.model_, config.input_op_, config.output_op_, config.input_shape_);
  TargetContext target(std::move(info), std::move(model), std::move(X));

  nlohmann::json parameters = {
      {"epsilon", config.epsilon_},
      {"max_iter", config.max_iter_},
      {"targeted", config.targeted_},
  };
  if (config.targeted_) { parameters["target_class"] = config.target_class_; }
  auto &session = target.add_attack("random_noise", config.attack_id_, parameters,
                                    std::make_shared<RandomNoiseRunner>());

  AttackLifecycleController controller(target);
  controller.set_attack_samples(config.indexes_);
  controller.run_attack(config.logging_);

  auto success = controller.check_attack_success();
  for (size_t i = 0; i < success.size(); i++) {
    logi("sample=%lu  initial=%s  final=%s  success=%d",
         session.sample_index_[i],
         session.results_.initial_->label_[i].c_str(),
         session.results_.final_->label_[i].c_str(),
         (int) success[i]);
  }

  /* write results */ {
    ReportWriter output(config.output_);
    output.append(target.attack_record(session));
    output.flush();
  }
  if (config.logging_) {
    ReportWriter log(config.log_output_);
    log.append_log(session);
    log.flush();
    logi("wrote %lu log records to %s", session.log_.size(), config.log_output_.c_str());
  }

  return 0;
}
