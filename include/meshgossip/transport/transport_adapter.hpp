/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/signals2/signal.hpp>
#include <meshgossip/common/types.hpp>
#include <meshgossip/coro/coro.hpp>
#include <qtils/enum_error_code.hpp>

namespace meshgossip::transport {
  enum class TransportError {
    PAYLOAD_TOO_LARGE,
    NOT_STARTED,
    UNKNOWN_PEER,
    SEND_FAILED,
  };

  Q_ENUM_ERROR_CODE(TransportError) {
    using E = decltype(e);
    switch (e) {
      case E::PAYLOAD_TOO_LARGE:
        return "Payload exceeds transport limit";
      case E::NOT_STARTED:
        return "Transport is not advertising or discovering";
      case E::UNKNOWN_PEER:
        return "Peer is not reachable";
      case E::SEND_FAILED:
        return "Transport failed to deliver payload";
    }
    abort();
  }

  /**
   * Notifications raised by a transport.
   * Handlers are invoked on the io_context the transport runs on.
   */
  struct TransportEvents {
    /// (sender, raw payload text)
    boost::signals2::signal<void(const PeerId &, const std::string &)>
        payload_received;
    /// (peer, advertised name)
    boost::signals2::signal<void(const PeerId &, const std::string &)>
        endpoint_found;
    boost::signals2::signal<void(const PeerId &)> endpoint_lost;
  };

  /**
   * Short range radio link (advertise, discover, send small text payloads).
   * Delivery is best effort and payloads are bounded by `maxPayloadBytes()`.
   */
  class TransportAdapter {
   public:
    virtual ~TransportAdapter() = default;

    virtual CoroOutcome<void> startAdvertising(std::string name) = 0;

    virtual CoroOutcome<void> startDiscovery() = 0;

    /// Stop advertising and discovery, drop all links.
    virtual CoroOutcome<void> stopAll() = 0;

    virtual CoroOutcome<void> sendPayload(PeerId peer,
                                          std::string payload) = 0;

    /// Send to every connected peer. Fails only if no send could be made.
    virtual CoroOutcome<void> broadcastPayload(std::string payload) = 0;

    virtual size_t maxPayloadBytes() const = 0;

    virtual TransportEvents &events() = 0;
  };
}  // namespace meshgossip::transport
