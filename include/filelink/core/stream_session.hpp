// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <filelink/core/chunk_plan.hpp>
#include <filelink/core/chunk_source.hpp>
#include <filelink/core/concurrency_gate.hpp>
#include <filelink/core/config.hpp>
#include <filelink/core/prefetch_pipeline.hpp>
#include <filelink/core/range.hpp>
#include <filelink/core/stream_assembler.hpp>
#include <memory>

namespace filelink::core {

// Everything one ranged response needs while its body is produced.
//
// The producer starts on construction. Destruction, on any path, stops and
// joins the producer and only then gives the admission slot back.
class StreamSession {
public:
    StreamSession(AdmissionToken token,
                  FileInfo file,
                  ByteRange range,
                  std::shared_ptr<ChunkSource> source,
                  const StreamLimits& limits);
    ~StreamSession();

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    // Next slice of the body; see StreamAssembler::next
    [[nodiscard]] std::expected<std::optional<StreamAssembler::Slice>, std::error_code> next() {
        return assembler_.next();
    }

    // Tear down early; also done by the destructor
    void close() noexcept;

    [[nodiscard]] const FileInfo& file() const noexcept { return file_; }
    [[nodiscard]] const ByteRange& range() const noexcept { return range_; }
    [[nodiscard]] const ChunkPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] const PrefetchPipeline& pipeline() const noexcept { return pipeline_; }
    [[nodiscard]] const StreamAssembler& assembler() const noexcept { return assembler_; }

private:
    AdmissionToken token_;  // Declared first so it is released last
    FileInfo file_;
    ByteRange range_;
    ChunkPlan plan_;
    PrefetchPipeline pipeline_;
    StreamAssembler assembler_;
};

} // namespace filelink::core
