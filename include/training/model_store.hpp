#pragma once

#include <string>

#include "model/readout_model.hpp"

namespace res_agent::training {

// JSON on disk: {outputs, inputs, weights, trained_at_ms, updates_performed, metrics{...}}.
// The file is replaced atomically. Returns false and logs on I/O failure.
bool save_model(const std::string& path, const model::ReadoutModel& model);

// Throws std::runtime_error when the file cannot be read or does not describe a valid model.
model::ReadoutModel load_model(const std::string& path);

}  // namespace res_agent::training
