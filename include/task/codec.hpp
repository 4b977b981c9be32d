#pragma once

#include "task/model/BatchResult.hpp"

#include <string>
#include <nlohmann/json.hpp>

namespace ssdw::task::codec {

// Pipeline stages hand results to each other as base64-wrapped JSON objects
std::string encode(const nlohmann::json& payload);
nlohmann::json decode(const std::string& encoded);

std::string encodeResult(const model::BatchResult& result);

std::string b64_encode(const std::string& data);
std::string b64_decode(const std::string& b64);

}
