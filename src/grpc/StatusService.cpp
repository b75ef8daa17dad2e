// SPDX-License-Identifier: BSD-2-Clause

#include "pingsift/grpc/StatusService.h"

#include "pingsift/io/TimestampFormat.h"
#include "pingsift/log/Log.h"

#include <chrono>
#include <utility>

namespace pingsift::grpc_service {

StatusServiceImpl::StatusServiceImpl(const state::RunningState& state,
                                     state::StatusFormat default_format,
                                     std::string timestamp_format)
    : state_(state),
      default_format_(default_format),
      timestamp_format_(std::move(timestamp_format)) {}

::grpc::Status StatusServiceImpl::GetStatus(::grpc::ServerContext* /*context*/,
                                            const pingsift::api::StatusRequest* request,
                                            pingsift::api::StatusReply* response) {
    auto format = default_format_;
    if (!request->format().empty()) {
        auto parsed = state::parse_status_format(request->format());
        if (!parsed) {
            return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT,
                                  "format must be text or json");
        }
        format = *parsed;
    }

    const auto snap = state_.snapshot();
    const auto& c = snap.counters;

    response->set_started_at_unix_seconds(state::started_epoch_seconds(snap));
    response->set_uptime_seconds(snap.uptime_seconds);
    response->set_lines_seen(c.lines_seen);
    response->set_forwarded(c.forwarded);
    response->set_replies(c.replies);
    response->set_errors(c.errors);
    response->set_unrecognized(c.unrecognized);
    response->set_latency_exceeded(c.latency_exceeded);
    response->set_duplicates(c.duplicates);
    response->set_gaps_detected(c.gaps_detected);
    response->set_gap_probes_lost(c.gap_probes_lost);
    response->set_heartbeats(c.heartbeats);
    response->set_status_reports(c.status_reports);
    if (snap.last_sequence) {
        response->set_last_sequence(*snap.last_sequence);
    }
    response->set_last_line(snap.last_line);

    const auto prefix = format_wall_time(std::chrono::system_clock::now(), timestamp_format_);
    response->set_rendered(format == state::StatusFormat::Json
                               ? state::StatusReporter::render_json(snap, prefix)
                               : state::StatusReporter::render_text(snap, prefix));

    PINGSIFT_LOG_DEBUG("GetStatus served (lines=%llu)",
                       static_cast<unsigned long long>(c.lines_seen));
    return ::grpc::Status::OK;
}

StatusServer::StatusServer(const state::RunningState& state,
                           state::StatusFormat default_format,
                           std::string timestamp_format)
    : service_(state, default_format, std::move(timestamp_format)) {}

StatusServer::~StatusServer() {
    stop();
}

bool StatusServer::start(const std::string& listen) {
    if (server_) return true;

    ::grpc::ServerBuilder builder;
    int bound_port = 0;
    builder.AddListeningPort(listen, ::grpc::InsecureServerCredentials(), &bound_port);
    builder.RegisterService(&service_);

    server_ = builder.BuildAndStart();
    if (!server_ || bound_port == 0) {
        PINGSIFT_LOG_ERROR("failed to start status service on %s", listen.c_str());
        server_.reset();
        return false;
    }

    PINGSIFT_LOG_INFO("status service listening on %s", listen.c_str());
    return true;
}

void StatusServer::stop() {
    if (!server_) return;
    server_->Shutdown();
    server_->Wait();
    server_.reset();
}

} // namespace pingsift::grpc_service
