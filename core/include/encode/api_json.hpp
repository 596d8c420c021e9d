#pragma once

#include <string>

#include <ingest/source_descriptor.hpp>
#include <relay/relay_controller.hpp>

namespace fr {
    struct StartRequest {
        bool valid = false;
        SourceDescriptor source = SourceDescriptor::device(0);
        std::string error;
    };

    // Decodes {"stream_url": <int | string>}. A missing key, a null value or an
    // empty body selects device 0.
    StartRequest parse_start_request(const std::string& body);

    std::string make_result_json(const std::string& status, const std::string& message);
    std::string make_status_json(const RelayStatus& st, uint64_t buffer_seq);
}
