/**
 * @file status_frame.cpp
 * @brief Status frame decoding
 */

#include "jobwire/stream/status_frame.h"

#include <nlohmann/json.hpp>

namespace jobwire {

using json = nlohmann::json;

namespace {

constexpr std::size_t max_frame_excerpt = 128;

auto protocol_error(const std::string& reason, const std::string& text) -> unexpected {
    auto excerpt = text.size() > max_frame_excerpt
        ? text.substr(0, max_frame_excerpt) + "..."
        : text;
    return unexpected{error{error_code::protocol_error,
        "Invalid status frame (" + reason + "): " + excerpt}};
}

auto decode_status(const json& body, const std::string& text, const std::string& job_id)
    -> result<status_frame> {
    if (!body.is_object()) {
        return protocol_error("not an object", text);
    }

    auto status_it = body.find("status");
    if (status_it == body.end() || !status_it->is_string()) {
        return protocol_error("missing status", text);
    }

    auto id_it = body.find("job_id");
    if (id_it == body.end()) {
        id_it = body.find("jobId");
    }
    if (id_it != body.end()) {
        if (!id_it->is_string() || id_it->get<std::string>() != job_id) {
            return protocol_error("job id mismatch", text);
        }
    }

    auto name = status_it->get<std::string>();
    auto status = parse_job_status(name);
    if (!status) {
        return protocol_error("unknown status '" + name + "'", text);
    }

    status_frame frame;
    frame.kind = frame_kind::status;
    frame.event = status_event{job_id, *status, text};
    return frame;
}

}  // namespace

auto make_subscribe_frame(const std::string& job_id, const std::string& credential)
    -> std::string {
    json frame = {
        {"job_id", job_id},
        {"credential", credential}
    };
    return frame.dump();
}

auto parse_status_frame(const std::string& text, const std::string& job_id)
    -> result<status_frame> {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return protocol_error("not JSON", text);
    }
    if (!doc.is_object()) {
        return protocol_error("not an object", text);
    }

    auto type_it = doc.find("type");
    if (type_it == doc.end()) {
        return decode_status(doc, text, job_id);
    }
    if (!type_it->is_string()) {
        return protocol_error("non-string type", text);
    }

    auto type = type_it->get<std::string>();
    if (type == "job-status") {
        auto data_it = doc.find("data");
        if (data_it == doc.end()) {
            return protocol_error("missing data", text);
        }
        return decode_status(*data_it, text, job_id);
    }

    if (type == "authenticated" || type == "authentication-success") {
        status_frame frame;
        frame.kind = frame_kind::authenticated;
        return frame;
    }

    if (type == "authentication-failed" || type == "authentication-error") {
        status_frame frame;
        frame.kind = frame_kind::auth_rejected;
        auto data_it = doc.find("data");
        if (data_it != doc.end()) {
            frame.detail = data_it->is_string() ? data_it->get<std::string>() : data_it->dump();
        }
        return frame;
    }

    return protocol_error("unknown type '" + type + "'", text);
}

}  // namespace jobwire
