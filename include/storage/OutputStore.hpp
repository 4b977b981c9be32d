#pragma once

#include "task/model/OutputFile.hpp"

#include <optional>
#include <string>

namespace ssdw::storage {

class OutputStore {
public:
    virtual ~OutputStore() = default;

    // Allocates a new artifact. Throws std::runtime_error if the store cannot hold it.
    virtual task::model::OutputFile create(const std::string& displayName,
                                           const std::string& extension,
                                           const std::string& dataType,
                                           const std::optional<std::string>& sourceFileId) = 0;
};

}
