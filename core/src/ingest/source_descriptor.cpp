#include <ingest/source_descriptor.hpp>

#include <cctype>

namespace fr {
    static bool all_digits(const std::string& text) {
        if (text.empty() || text.size() > 9) return false;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }

    SourceDescriptor SourceDescriptor::parse(const std::string& text) {
        SourceDescriptor d = all_digits(text) ? device(std::stoi(text)) : from_uri(text);
        d.label = text;
        return d;
    }

    std::string SourceDescriptor::to_string() const {
        if (!label.empty()) return label;
        if (kind == Kind::Device) return std::to_string(device_index);
        return uri;
    }
}
