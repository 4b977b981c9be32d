#include "hash/Classifier.hpp"

#include <boost/algorithm/string/trim.hpp>

namespace ssdw::hash {

model::Outcome classify(const model::ExecResult& result) {
    const auto out = boost::algorithm::trim_copy(result.stdout_text);

    if (result.exit_code != 0) {
        const auto err = boost::algorithm::trim_copy(result.stderr_text);
        return model::Error{result.exit_code, err.empty() ? out : err};
    }

    if (const auto pos = out.find(DIGEST_MARKER); pos != std::string::npos)
        return model::Success{out.substr(0, pos)};

    return model::Notice{out};
}

}
