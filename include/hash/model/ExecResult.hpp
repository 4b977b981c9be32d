#pragma once

#include <string>

namespace ssdw::hash::model {

struct ExecResult {
    int exit_code = -1;          // 0 on success, -N when killed by signal N
    std::string stdout_text;
    std::string stderr_text;
};

}
