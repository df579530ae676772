#pragma once

#include "zk/prover_input.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace zkvm16 {

/**
 * JSON artifact for the external prover. Field elements are decimal
 * strings, the circom input convention:
 *
 *   {
 *     "program": {"public": "...", "private": "..."},
 *     "output":  {"public": "...", "private": "...", "value": 8},
 *     "ticks": 7,
 *     "trace":   {"steps": 7, "capacity": 16, "public": [...], "private": [...]}
 *   }
 *
 * "trace" is present only when the input carries a trace witness.
 */
nlohmann::json to_json(const ProverInput& input);

/**
 * Write to_json(input) to `file_path`; std::runtime_error if the file cannot
 * be written.
 */
void save_to_file(const ProverInput& input, const std::string& file_path);

} // namespace zkvm16
