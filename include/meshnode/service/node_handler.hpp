#pragma once
/**
 * @file node_handler.hpp
 * @brief The node's request handler: health endpoint plus the routing engine.
 */

#include <memory>
#include <string>

#include "meshnode/net/request_handler.hpp"
#include "meshnode/obs/logger.hpp"
#include "meshnode/routing/request_executor.hpp"

namespace meshnode::service {

    /** @class NodeHandler
     *  @brief Answers GET /health locally and hands every other path to the executor.
     *  @details Builds the per-request child logger (request_id, method, path,
     *           remote_addr) and logs arrival and completion.
     */
    class NodeHandler final : public net::RequestHandler {
    public:
        NodeHandler(std::string service_name,
                    std::shared_ptr<const routing::RequestExecutor> executor,
                    obs::Logger logger);

        boost::asio::awaitable<net::Response>
        handle(const net::Request& req, const net::RequestContext& ctx) const override;

        [[nodiscard]] const std::string& service_name() const noexcept { return service_name_; }

    private:
        net::Response health(const net::Request& req) const;

        std::string service_name_;
        std::shared_ptr<const routing::RequestExecutor> executor_;
        obs::Logger logger_;
    };

} // namespace meshnode::service
