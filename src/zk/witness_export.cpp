#include "zk/witness_export.hpp"
#include <fstream>
#include <stdexcept>

namespace zkvm16 {
namespace {

nlohmann::json commitment_json(const Commitment& commitment) {
    return {
        {"public", commitment.public_value.to_string()},
        {"private", commitment.private_value.to_string()}
    };
}

nlohmann::json field_array(const std::vector<FrElement>& values) {
    nlohmann::json array = nlohmann::json::array();
    for (const FrElement& value : values) {
        array.push_back(value.to_string());
    }
    return array;
}

} // namespace

nlohmann::json to_json(const ProverInput& input) {
    nlohmann::json json;
    if (input.zk.program()) {
        json["program"] = commitment_json(*input.zk.program());
    }
    if (input.zk.output()) {
        json["output"] = commitment_json(*input.zk.output());
        json["output"]["value"] = input.output_value;
    }
    json["ticks"] = input.ticks;

    if (input.zk.trace()) {
        const TraceWitness& witness = *input.zk.trace();
        json["trace"] = {
            {"steps", witness.steps},
            {"capacity", witness.capacity()},
            {"public", field_array(witness.public_values)},
            {"private", field_array(witness.private_values)}
        };
    }
    return json;
}

void save_to_file(const ProverInput& input, const std::string& file_path) {
    std::ofstream out(file_path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + file_path);
    }
    out << to_json(input).dump(2) << std::endl;
    if (!out) {
        throw std::runtime_error("Failed to write " + file_path);
    }
}

} // namespace zkvm16
