#pragma once

#include <utility>  // before Boost.Asio: boost 1.74 awaitable.hpp uses std::exchange
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <memory>

#include "bulk_cpp/config.hpp"
#include "bulk_cpp/operation.hpp"
#include "bulk_cpp/result.hpp"

namespace bulk_cpp {

    /**
     * @brief One authenticated session to the remote data platform.
     *
     * Implementations own the transport. They must report throttling and
     * transport faults through BatchOutcome rather than by throwing; an
     * exception escaping execute_batch() is treated as a transport fault.
     */
    class RemoteSession {
       public:
        virtual ~RemoteSession() = default;

        /**
         * @brief Execute one batch call.
         * @param request Records of one batch, with the affinity token
         * already attached by the owning Connection.
         */
        virtual boost::asio::awaitable<BatchResponse> execute_batch(
            BatchRequest const& request) = 0;

        /**
         * @brief Query the service's recommended client parallelism.
         */
        virtual boost::asio::awaitable<Result<std::size_t>>
        recommended_parallelism() = 0;
    };

    /**
     * @brief Credential provider: materializes new authenticated sessions.
     */
    class SessionFactory {
       public:
        virtual ~SessionFactory() = default;

        /**
         * @brief Create a session for the given connection source.
         * @return The session, or ConnectionCreationFailed.
         */
        virtual boost::asio::awaitable<Result<std::unique_ptr<RemoteSession>>>
        create_session(ConnectionSource const& source) = 0;
    };

}  // namespace bulk_cpp
