#pragma once

#include "esmcache/operation.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace esmcache {

/// One entry of a jobs file, ready for OperationQueue::submit.
struct JobSpec {
    OperationPayload payload;
    std::optional<Priority> priority;
    std::set<std::string> tags;
    std::optional<std::string> owner_id;
};

/// Build a job from its JSON form. The "type" field selects the payload:
/// bulk_copy, bulk_move, bulk_extract, file_transfer, batch_file_transfer,
/// directory_transfer. Throws ValidationError on unknown types or values.
JobSpec parse_job(const nlohmann::json& j);

/// Read {"jobs": [...]} from a file. Throws ValidationError on parse errors.
std::vector<JobSpec> load_jobs(const std::filesystem::path& path);

}  // namespace esmcache
