#include "task/model/BatchResult.hpp"

void ssdw::task::model::to_json(nlohmann::json& j, const BatchResult& r) {
    j = {
        {"output_files", r.output_files},
        {"command", r.command},
        {"meta", r.meta}
    };

    if (r.workflow_id) j["workflow_id"] = *r.workflow_id;
    else j["workflow_id"] = nullptr;
}
