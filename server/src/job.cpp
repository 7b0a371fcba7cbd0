#include "filedock/server/job.hpp"

namespace filedock::server
{

    protocol::JobUpdate to_update(const Job &job)
    {
        return {
            .job_id = job.id,
            .state = job.state,
            .progress = job.progress,
            .error = job.error,
        };
    }

    void to_json(nlohmann::json &json, const Job &job)
    {
        json = {
            {"id", job.id},
            {"type", protocol::to_string(job.type)},
            {"state", protocol::to_string(job.state)},
            {"progress", job.progress},
            {"sourcePath", job.source_path},
            {"createdAt", format_timestamp(job.created_at)},
        };
        if (job.dest_path)
        {
            json["destPath"] = *job.dest_path;
        }
        if (job.error)
        {
            json["error"] = *job.error;
        }
        if (job.started_at)
        {
            json["startedAt"] = format_timestamp(*job.started_at);
        }
        if (job.completed_at)
        {
            json["completedAt"] = format_timestamp(*job.completed_at);
        }
    }

} // namespace filedock::server
