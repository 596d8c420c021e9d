#pragma once

#include <functional>
#include <memory>
#include <string>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>
#include <ingest/source_descriptor.hpp>

namespace fr {
    // Builds an unopened source for a descriptor. The relay controller takes one
    // of these so tests can substitute fake sources.
    using FrameSourceFactory = std::function<std::unique_ptr<IFrameSource>(const SourceDescriptor&)>;

    std::string build_gst_pipeline(const SourceDescriptor& desc, const SourceConfig& cfg, const std::string& sink_name);

    std::unique_ptr<IFrameSource> make_frame_source(const SourceDescriptor& desc, const SourceConfig& cfg);

    FrameSourceFactory gst_source_factory(SourceConfig cfg);
}
