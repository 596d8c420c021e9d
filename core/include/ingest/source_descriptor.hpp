#pragma once

#include <string>

namespace fr {
    // Names an upstream video origin: a capture device index or a URI/path.
    struct SourceDescriptor {
        enum class Kind { Device, Uri };

        Kind kind = Kind::Device;
        int device_index = 0;
        std::string uri;
        std::string label; // text as requested; to_string() prefers it

        static SourceDescriptor device(int index) {
            SourceDescriptor d;
            d.kind = Kind::Device;
            d.device_index = index;
            return d;
        }

        static SourceDescriptor from_uri(std::string u) {
            SourceDescriptor d;
            d.kind = Kind::Uri;
            d.uri = std::move(u);
            return d;
        }

        // "0" -> device 0, everything else -> uri. Keeps `text` as the label.
        static SourceDescriptor parse(const std::string& text);

        bool is_device() const { return kind == Kind::Device; }

        std::string to_string() const;

        // the label is presentation only and does not take part in equality
        bool operator==(const SourceDescriptor& o) const {
            return kind == o.kind && device_index == o.device_index && uri == o.uri;
        }
        bool operator!=(const SourceDescriptor& o) const { return !(*this == o); }
    };
}
