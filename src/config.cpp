#include "config.hpp"

#include <boost/program_options.hpp>

namespace counterfit {

std::vector<std::string> split_list(const std::string &s) {
  std::vector<std::string> items{};
  std::string item{};
  std::istringstream is(s);
  while (std::getline(is, item, ',')) {
    if (!item.empty()) { items.push_back(item); }
  }
  return items;
}

std::optional<std::vector<int64_t>> parse_shape(const std::string &s) {
  std::vector<int64_t> shape{};
  for (const auto &item : split_list(s)) {
    size_t pos = 0;
    long long dim;
    try {
      dim = std::stoll(item, &pos);
    } catch (const std::logic_error &) {
      return std::nullopt;
    }
    if (pos != item.size() || dim <= 0) { return std::nullopt; }
    shape.push_back(dim);
  }
  if (shape.empty()) { return std::nullopt; }
  return shape;
}

AttackConfig AttackConfig::from_args(int argc, char **argv) {
  boost::program_options::options_description desc{"Allowed options"};
  desc.add_options()
      ("help", "produce help message")
      ("dir", boost::program_options::value<std::string>(),
       "work directory")
      ("model", boost::program_options::value<std::string>(),
       "export directory of the TensorFlow SavedModel")
      ("input-op", boost::program_options::value<std::string>(),
       "name of the input operation")
      ("output-op", boost::program_options::value<std::string>(),
       "name of the output operation")
      ("dataset", boost::program_options::value<std::string>(),
       "HDF5 file holding the held-out samples")
      ("dataset-name", boost::program_options::value<std::string>(),
       "dataset inside the HDF5 file")
      ("input-shape", boost::program_options::value<std::string>(),
       "shape of one sample, e.g. 3,32,32")
      ("labels", boost::program_options::value<std::string>(),
       "label vocabulary in output order, e.g. cat,dog")
      ("index", boost::program_options::value<std::vector<size_t>>(),
       "sample index to attack, may be repeated")
      ("targeted", "run a targeted attack")
      ("target-class", boost::program_options::value<size_t>(),
       "target class index for a targeted attack")
      ("epsilon", boost::program_options::value<float>()->default_value(0.05f),
       "standard deviation of the random noise")
      ("max-iter", boost::program_options::value<size_t>()->default_value(100),
       "maximum number of noise rounds")
      ("clip-min", boost::program_options::value<float>()->default_value(0.0f),
       "lower bound of input values")
      ("clip-max", boost::program_options::value<float>()->default_value(1.0f),
       "upper bound of input values")
      ("logging", "record every sample sent to the model")
      ("attack-id", boost::program_options::value<std::string>()->default_value("attack-0"),
       "identifier of the attack")
      ("output", boost::program_options::value<std::string>(),
       "output file for the result record")
      ("log-output", boost::program_options::value<std::string>(),
       "output file for the query log");

  boost::program_options::variables_map vm{};
  boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc), vm);
  boost::program_options::notify(vm);

  AttackConfig config{};

  auto help = [&desc]() {
    std::cout << desc << "\n";
    std::exit(-1);
  };

  if (vm.count("help")) help();
  if (!vm.count("dir")) help();
  if (!vm.count("model")) help();
  if (!vm.count("input-op")) help();
  if (!vm.count("output-op")) help();
  if (!vm.count("dataset")) help();
  if (!vm.count("dataset-name")) help();
  if (!vm.count("input-shape")) help();
  if (!vm.count("labels")) help();
  if (!vm.count("index")) help();
  if (!vm.count("output")) help();
  if (vm.count("targeted") && !vm.count("target-class")) help();
  if (vm.count("logging") && !vm.count("log-output")) help();
  auto input_shape = parse_shape(vm["input-shape"].as<std::string>());
  if (!input_shape.has_value()) help();
  auto labels = split_list(vm["labels"].as<std::string>());
  if (labels.empty()) help();
  auto clip_min = vm["clip-min"].as<float>();
  auto clip_max = vm["clip-max"].as<float>();
  if (!(clip_min < clip_max)) help();

  config.dir_ = vm["dir"].as<std::string>();
  config.model_ = vm["model"].as<std::string>();
  config.input_op_ = vm["input-op"].as<std::string>();
  config.output_op_ = vm["output-op"].as<std::string>();
  config.dataset_ = vm["dataset"].as<std::string>();
  config.dataset_name_ = vm["dataset-name"].as<std::string>();
  config.input_shape_ = input_shape.value();
  config.labels_ = labels;
  config.indexes_ = vm["index"].as<std::vector<size_t>>();
  config.targeted_ = vm.count("targeted") > 0;
  if (config.targeted_) {
    config.target_class_ = vm["target-class"].as<size_t>();
    if (config.target_class_ >= labels.size()) help();
  }
  config.epsilon_ = vm["epsilon"].as<float>();
  config.max_iter_ = vm["max-iter"].as<size_t>();
  config.clip_min_ = clip_min;
  config.clip_max_ = clip_max;
  config.logging_ = vm.count("logging") > 0;
  config.attack_id_ = vm["attack-id"].as<std::string>();
  config.output_ = vm["output"].as<std::string>();
  if (config.logging_) { config.log_output_ = vm["log-output"].as<std::string>(); }

  return config;
}

}
