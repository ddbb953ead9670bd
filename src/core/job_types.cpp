/**
 * @file job_types.cpp
 * @brief Status name reconciliation
 */

#include "jobwire/core/job_types.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace jobwire {

auto parse_job_status(std::string_view name) -> std::optional<job_status> {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    static const std::unordered_map<std::string, job_status> known = {
        {"QUEUED", job_status::queued},
        {"CREATING", job_status::queued},
        {"CREATED", job_status::queued},
        {"VALIDATING", job_status::queued},
        {"VALIDATED", job_status::queued},
        {"RUNNING", job_status::running},
        {"TRANSPILING", job_status::running},
        {"TRANSPILED", job_status::running},
        {"COMPLETED", job_status::completed},
        {"CANCELLED", job_status::cancelled},
        {"ERROR", job_status::error},
    };

    auto it = known.find(upper);
    if (it != known.end()) {
        return it->second;
    }

    // ERROR_CREATING_JOB, ERROR_VALIDATING_JOB, ERROR_RUNNING_JOB, ...
    if (upper.rfind("ERROR_", 0) == 0) {
        return job_status::error;
    }

    return std::nullopt;
}

}  // namespace jobwire
