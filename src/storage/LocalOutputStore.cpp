#include "storage/LocalOutputStore.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/algorithm/string/erase.hpp>
#include <fmt/core.h>
#include <stdexcept>

using namespace ssdw::storage;
using namespace ssdw::task::model;

namespace {

std::string newArtifactId() {
    thread_local boost::uuids::random_generator generator;
    return boost::algorithm::erase_all_copy(boost::uuids::to_string(generator()), "-");
}

}

LocalOutputStore::LocalOutputStore(std::filesystem::path root, std::shared_ptr<spdlog::logger> log)
    : root_(std::move(root)), log_(log ? std::move(log) : log::Registry::storage()) {}

void LocalOutputStore::ensureRoot() const {
    namespace fs = std::filesystem;

    if (root_.empty()) throw std::runtime_error("No output path configured for artifacts");

    std::error_code ec;
    if (fs::is_directory(root_, ec)) return;

    fs::create_directories(root_, ec);
    if (ec) {
        log_->error("[LocalOutputStore] Unable to create output directory {}: {}", root_.string(), ec.message());
        throw std::runtime_error(fmt::format("Unable to create output directory {}: {}", root_.string(), ec.message()));
    }
    log_->debug("[LocalOutputStore] Created output directory {}", root_.string());
}

OutputFile LocalOutputStore::create(const std::string& displayName,
                                    const std::string& extension,
                                    const std::string& dataType,
                                    const std::optional<std::string>& sourceFileId) {
    ensureRoot();

    OutputFile f;
    f.uuid = newArtifactId();
    f.extension = extension;
    f.filename = extension.empty() ? f.uuid : f.uuid + "." + extension;
    f.display_name = extension.empty() ? displayName : displayName + "." + extension;
    f.data_type = dataType;
    f.path = root_ / f.filename;
    f.source_file_id = sourceFileId;

    log_->debug("[LocalOutputStore] Allocated {} for '{}'", f.path.string(), f.display_name);
    return f;
}
