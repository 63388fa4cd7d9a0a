// Copyright (c) 2026 changcheng967. All rights reserved.

#include <filelink/core/stream_session.hpp>

namespace filelink::core {

StreamSession::StreamSession(AdmissionToken token,
                             FileInfo file,
                             ByteRange range,
                             std::shared_ptr<ChunkSource> source,
                             const StreamLimits& limits)
    : token_(std::move(token))
    , file_(std::move(file))
    , range_(range.clamped(file_.handle.size))
    , plan_(plan_chunks(range_, file_.handle.size, limits.chunk_size))
    , pipeline_(std::move(source), file_.handle, plan_, limits)
    , assembler_(plan_, pipeline_.buffer(), limits.pull_timeout, limits.max_pull_retries) {
    pipeline_.start();
}

StreamSession::~StreamSession() {
    close();
}

void StreamSession::close() noexcept {
    pipeline_.cancel();
    token_.release();
}

} // namespace filelink::core
