#pragma once

#include "chunked/core/error.hpp"
#include "chunked/events/components.hpp"
#include "chunked/network/http_router.hpp"
#include "chunked/server/upload_service.hpp"

namespace chunked::server {

/**
 * @brief Mount the upload protocol on a router
 *
 * ROUTES:
 *   POST   /api/upload/status                     {fingerprint, artifact_name}
 *   PUT    /api/upload/chunk                      X-Fingerprint, X-Chunk-Index, raw body (streamed)
 *   POST   /api/upload/merge                      {fingerprint, artifact_name, total_chunks, total_size}
 *   DELETE /api/upload/chunk/:fingerprint/:index  discard one chunk
 *   DELETE /api/upload/:fingerprint               abandon the whole Chunk Set
 *   GET    /api/stats                             counters (when `metrics` is given)
 *
 * Errors are JSON `{error, code}`; a count mismatch adds `expected` and
 * `actual`. Both `service` and `metrics` must outlive the router.
 */
void register_upload_routes(network::HttpRouter& router,
                            UploadService& service,
                            const events::MetricsComponent* metrics = nullptr);

network::HttpStatus http_status_for(ErrorCode code);

network::HttpResponse make_error_response(const Error& error);

} // namespace chunked::server
