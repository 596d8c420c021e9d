#include <encode/api_json.hpp>

#include <limits>
#include <nlohmann/json.hpp>

namespace fr {
    using json = nlohmann::json;

    static StartRequest invalid(std::string why) {
        StartRequest r;
        r.valid = false;
        r.error = std::move(why);
        return r;
    }

    StartRequest parse_start_request(const std::string& body) {
        StartRequest req;
        req.valid = true;

        if (body.find_first_not_of(" \t\r\n") == std::string::npos) return req;

        const json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) return invalid("body is not valid JSON");
        if (!j.is_object()) return invalid("body must be a JSON object");

        auto it = j.find("stream_url");
        if (it == j.end() || it->is_null()) return req;

        if (it->is_number_integer()) {
            const bool too_big = it->is_number_unsigned() &&
                                 it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max());
            const auto v = too_big ? int64_t{-1} : it->get<int64_t>();
            if (v < 0 || v > std::numeric_limits<int>::max()) {
                return invalid("stream_url device index out of range");
            }
            req.source = SourceDescriptor::device(static_cast<int>(v));
            return req;
        }

        if (it->is_string()) {
            const auto s = it->get<std::string>();
            if (s.empty()) return invalid("stream_url is empty");
            req.source = SourceDescriptor::parse(s);
            return req;
        }

        return invalid("stream_url must be a device index or a URI string");
    }

    std::string make_result_json(const std::string& status, const std::string& message) {
        json j;
        j["status"] = status;
        j["message"] = message;
        return j.dump();
    }

    std::string make_status_json(const RelayStatus& st, uint64_t buffer_seq) {
        json j;
        j["state"] = to_string(st.state);
        j["source"] = st.source ? json(st.source->to_string()) : json(nullptr);
        j["generation"] = st.generation;
        j["frame_seq"] = buffer_seq;
        j["stop_timeouts"] = st.stop_timeouts;
        j["capture"] = {
            {"frames_read", st.capture.frames_read},
            {"frames_published", st.capture.frames_published},
            {"publishes_dropped", st.capture.publishes_dropped},
            {"read_failures", st.capture.read_failures},
            {"encode_failures", st.capture.encode_failures},
        };
        return j.dump();
    }
}
