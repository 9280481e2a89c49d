#include "esmcache/jobs.hpp"
#include "esmcache/errors.hpp"

#include <fstream>

namespace esmcache {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) out = j[key].get<T>();
}

FileTransfer parse_transfer(const nlohmann::json& j) {
    FileTransfer t;
    read_field(j, "source_location", t.source_location);
    read_field(j, "source_path", t.source_path);
    read_field(j, "dest_location", t.dest_location);
    read_field(j, "dest_path", t.dest_path);
    read_field(j, "overwrite", t.overwrite);
    read_field(j, "verify_checksum", t.verify_checksum);
    read_field(j, "chunk_size", t.chunk_size);
    return t;
}

}  // namespace

JobSpec parse_job(const nlohmann::json& j) {
    if (!j.is_object()) throw ValidationError("job must be an object");
    if (!j.contains("type")) throw ValidationError("job has no type");

    JobSpec job;
    try {
        auto type = j["type"].get<std::string>();

        if (auto kind = parse_bulk_kind(type)) {
            BulkArchiveOperation op;
            op.kind = *kind;
            read_field(j, "archive_ids", op.archive_ids);
            read_field(j, "destination_location", op.destination_location);
            read_field(j, "simulation_id", op.simulation_id);
            read_field(j, "stop_on_error", op.stop_on_error);
            read_field(j, "parallel_operations", op.parallel_operations);
            read_field(j, "include_patterns", op.include_patterns);
            job.payload = std::move(op);
        } else if (type == "file_transfer") {
            job.payload = parse_transfer(j);
        } else if (type == "batch_file_transfer") {
            BatchFileTransfer op;
            if (j.contains("transfers")) {
                for (const auto& t : j["transfers"]) op.transfers.push_back(parse_transfer(t));
            }
            read_field(j, "parallel_transfers", op.parallel_transfers);
            read_field(j, "stop_on_error", op.stop_on_error);
            read_field(j, "verify_all_checksums", op.verify_all_checksums);
            job.payload = std::move(op);
        } else if (type == "directory_transfer") {
            DirectoryTransfer op;
            read_field(j, "source_location", op.source_location);
            read_field(j, "source_path", op.source_path);
            read_field(j, "dest_location", op.dest_location);
            read_field(j, "dest_path", op.dest_path);
            read_field(j, "recursive", op.recursive);
            read_field(j, "overwrite", op.overwrite);
            read_field(j, "include_patterns", op.include_patterns);
            read_field(j, "exclude_patterns", op.exclude_patterns);
            job.payload = std::move(op);
        } else {
            throw ValidationError("unknown job type: " + type);
        }

        if (j.contains("priority")) {
            auto name = j["priority"].get<std::string>();
            job.priority = parse_priority(name);
            if (!job.priority) throw ValidationError("unknown priority: " + name);
        }
        read_field(j, "tags", job.tags);
        if (j.contains("owner")) job.owner_id = j["owner"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("malformed job: ") + e.what());
    }
    return job;
}

std::vector<JobSpec> load_jobs(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) throw ValidationError("cannot open jobs file: " + path.string());

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError("cannot parse " + path.string() + ": " + e.what());
    }

    if (!doc.is_array() && !doc.is_object()) {
        throw ValidationError(path.string() + ": expected an array or an object with \"jobs\"");
    }
    const auto& list = doc.is_array() ? doc : doc.value("jobs", nlohmann::json::array());
    if (!list.is_array()) throw ValidationError("\"jobs\" must be an array");

    std::vector<JobSpec> jobs;
    for (size_t i = 0; i < list.size(); ++i) {
        try {
            jobs.push_back(parse_job(list[i]));
        } catch (const ValidationError& e) {
            throw ValidationError("job #" + std::to_string(i) + ": " + e.what());
        }
    }
    return jobs;
}

}  // namespace esmcache
