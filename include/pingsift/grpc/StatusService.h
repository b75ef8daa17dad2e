// SPDX-License-Identifier: BSD-2-Clause

#pragma once

#include "pingsift/state/RunningState.h"
#include "pingsift/state/StatusReporter.h"
#include "pingsift.grpc.pb.h"

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

namespace pingsift::grpc_service {

/**
 * @brief gRPC front end for status snapshots.
 *
 * Another liveness trigger next to SIGUSR1: each call takes the same
 * lock-protected snapshot, fills the reply and leaves the secondary channel
 * alone. Handlers run on gRPC's threads and only read the running state.
 */
class StatusServiceImpl final :
    public pingsift::api::StatusService::Service {
public:
    /**
     * @param state            Running state owned by main().
     * @param default_format   Used when the request leaves format empty.
     * @param timestamp_format strftime pattern for the rendered prefix.
     */
    StatusServiceImpl(const state::RunningState& state,
                      state::StatusFormat default_format,
                      std::string timestamp_format);

    ::grpc::Status GetStatus(::grpc::ServerContext* context,
                             const pingsift::api::StatusRequest* request,
                             pingsift::api::StatusReply* response) override;

private:
    const state::RunningState& state_;
    state::StatusFormat default_format_;
    std::string timestamp_format_;
};

/**
 * @brief Owns the gRPC server that hosts StatusServiceImpl.
 */
class StatusServer {
public:
    StatusServer(const state::RunningState& state,
                 state::StatusFormat default_format,
                 std::string timestamp_format);
    ~StatusServer();

    /**
     * @brief Bind @p listen ("host:port") and start serving.
     * @return false when the server could not be started.
     */
    bool start(const std::string& listen);

    void stop();

private:
    StatusServiceImpl service_;
    std::unique_ptr<::grpc::Server> server_;
};

} // namespace pingsift::grpc_service
