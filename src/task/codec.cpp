#include "task/codec.hpp"

#include <cstring>
#include <stdexcept>
#include <vector>
#include <sodium.h>

namespace ssdw::task::codec {

std::string b64_encode(const std::string& data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::string b64_decode(const std::string& b64) {
    std::vector<unsigned char> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          " \t\r\n", &out_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 || end != b64.c_str() + b64.size())
    {
        throw std::runtime_error("Invalid base64 in pipeline result");
    }
    return {reinterpret_cast<const char*>(decoded.data()), out_len};
}

std::string encode(const nlohmann::json& payload) {
    return b64_encode(payload.dump());
}

nlohmann::json decode(const std::string& encoded) {
    const auto raw = b64_decode(encoded);

    auto j = nlohmann::json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw std::runtime_error("Pipeline result is not valid JSON");
    if (!j.is_object()) throw std::runtime_error("Pipeline result must be a JSON object");
    return j;
}

std::string encodeResult(const model::BatchResult& result) {
    return encode(nlohmann::json(result));
}

}
