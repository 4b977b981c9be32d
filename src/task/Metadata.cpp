#include "task/Metadata.hpp"

#include <nlohmann/json.hpp>

namespace ssdw::task {

const Metadata& metadata() {
    static const Metadata md{
        TASK_NAME,
        "SSDeep Hash Calculation",
        "Calculates the SSDeep (context-triggered piecewise hash) for each input file. "
        "Output is a text file per input, containing the hash or an error/notice.",
        {}  // plain hashing has nothing to configure
    };
    return md;
}

void to_json(nlohmann::json& j, const ConfigOption& o) {
    j = {
        {"name", o.name},
        {"label", o.label},
        {"description", o.description},
        {"type", o.type},
        {"required", o.required}
    };
}

void to_json(nlohmann::json& j, const Metadata& m) {
    j = {
        {"name", m.name},
        {"display_name", m.display_name},
        {"description", m.description},
        {"task_config", m.task_config}
    };
}

}
