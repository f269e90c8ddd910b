/**
 * @file rpc_server.hpp
 * @brief Serves scheduler RPCs over TcpTransport.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "network/transport.hpp"
#include "rpc/messages.hpp"
#include "service/scheduler_service.hpp"

#include <cstdint>
#include <vector>

namespace tco_scheduler {

/**
 * @brief Decodes requests, calls SchedulerService, encodes responses.
 *
 * Service errors are returned to the caller as error responses carrying
 * the ErrorCode; malformed requests get a Protocol error.
 */
class SchedulerRpcServer {
public:
    SchedulerRpcServer(SchedulerService& service, Logger& logger);
    ~SchedulerRpcServer();

    SchedulerRpcServer(const SchedulerRpcServer&) = delete;
    SchedulerRpcServer& operator=(const SchedulerRpcServer&) = delete;

    /// Listen on @p port (0 = ephemeral) and start serving. Returns the bound port.
    Result<uint16_t> start(uint16_t port, size_t worker_threads = 4);
    void stop();

    /// Handle one encoded request; always produces an encoded response.
    [[nodiscard]] std::vector<uint8_t> handle(const std::vector<uint8_t>& request);

private:
    Result<RpcResponse> dispatch(const RpcRequest& request);

    SchedulerService& service_;
    Logger& logger_;
    TcpTransport transport_;
};

/// Milliseconds since the Unix epoch; 0 for an unset time.
[[nodiscard]] int64_t to_epoch_ms(const std::optional<Timestamp>& ts) noexcept;
[[nodiscard]] Timestamp from_epoch_ms(int64_t ms) noexcept;

/// Job described by a SubmitJob request.
[[nodiscard]] Job to_job(const SubmitJobRequest& request);

/// Registry attributes described by a RegisterNode request.
[[nodiscard]] NodeSpec to_node_spec(const RegisterNodeRequest& request);

}  // namespace tco_scheduler
