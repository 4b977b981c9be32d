#pragma once

#include "hash/model/ExecResult.hpp"
#include "hash/model/Outcome.hpp"

namespace ssdw::hash {

// Separates the digest from the quoted filename in ssdeep's HASH,"FILENAME" output
constexpr const auto* DIGEST_MARKER = ",\"";

// Pure: the same ExecResult always yields the same Outcome.
// A non-zero exit code wins over anything printed on stdout.
model::Outcome classify(const model::ExecResult& result);

}
