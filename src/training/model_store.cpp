#include "training/model_store.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace res_agent::training {

bool save_model(const std::string& path, const model::ReadoutModel& model) {
  nlohmann::json document;
  document["outputs"] = model.outputs;
  document["inputs"] = model.inputs;
  document["weights"] = model.weights;
  document["trained_at_ms"] = model.trained_at_ms;
  document["updates_performed"] = model.updates_performed;
  document["metrics"] = {
      {"accuracy", model.metrics.accuracy},     {"precision", model.metrics.precision},
      {"recall", model.metrics.recall},         {"f1", model.metrics.f1},
      {"train_size", model.metrics.train_size}, {"test_size", model.metrics.test_size},
  };

  const std::string staging = path + ".tmp";
  {
    std::ofstream out(staging, std::ios::trunc);
    if (!out.is_open()) {
      std::cerr << "[trainer] unable to write model file " << staging << '\n';
      return false;
    }
    out << document.dump(2) << '\n';
    if (!out.good()) {
      std::cerr << "[trainer] short write to model file " << staging << '\n';
      return false;
    }
  }

  std::error_code error;
  std::filesystem::rename(staging, path, error);
  if (error) {
    std::cerr << "[trainer] unable to replace model file " << path << ": " << error.message() << '\n';
    return false;
  }
  return true;
}

model::ReadoutModel load_model(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open model file: " + path);
  }

  model::ReadoutModel loaded{};
  try {
    const auto document = nlohmann::json::parse(input);
    loaded.outputs = document.at("outputs").get<std::uint16_t>();
    loaded.inputs = document.at("inputs").get<std::uint16_t>();
    loaded.weights = document.at("weights").get<std::vector<double>>();
    loaded.trained_at_ms = document.value("trained_at_ms", std::uint64_t{0});
    loaded.updates_performed = document.value("updates_performed", std::uint32_t{0});
    if (document.contains("metrics")) {
      const auto& metrics = document.at("metrics");
      loaded.metrics.accuracy = metrics.value("accuracy", 0.0);
      loaded.metrics.precision = metrics.value("precision", 0.0);
      loaded.metrics.recall = metrics.value("recall", 0.0);
      loaded.metrics.f1 = metrics.value("f1", 0.0);
      loaded.metrics.train_size = metrics.value("train_size", std::uint32_t{0});
      loaded.metrics.test_size = metrics.value("test_size", std::uint32_t{0});
    }
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error("malformed model file " + path + ": " + ex.what());
  }

  if (!loaded.valid()) {
    throw std::runtime_error("model file " + path + " has " + std::to_string(loaded.weights.size()) +
                             " weights for a " + std::to_string(loaded.outputs) + "x" +
                             std::to_string(loaded.inputs) + " readout");
  }
  return loaded;
}

}  // namespace res_agent::training
