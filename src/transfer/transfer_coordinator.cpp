#include "peerdrop/transfer/transfer_coordinator.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::transfer {

std::shared_ptr<TransferCoordinator> TransferCoordinator::create(boost::asio::io_context& io_context,
                                                                 std::shared_ptr<network::SignalingTransport> transport,
                                                                 std::shared_ptr<network::SessionNegotiator> negotiator,
                                                                 TransferCallbacks callbacks,
                                                                 TransferOptions options) {
    if (!transport || !negotiator) {
        throw std::invalid_argument("TransferCoordinator requires a transport and a negotiator");
    }
    if (!options.validate()) {
        throw std::invalid_argument("Invalid transfer options");
    }
    
    auto coordinator = std::make_shared<TransferCoordinator>(
        ConstructionTag(), io_context, std::move(transport), std::move(negotiator),
        std::move(callbacks), std::move(options));
    coordinator->start();
    return coordinator;
}

TransferCoordinator::TransferCoordinator(ConstructionTag,
                                         boost::asio::io_context& io_context,
                                         std::shared_ptr<network::SignalingTransport> transport,
                                         std::shared_ptr<network::SessionNegotiator> negotiator,
                                         TransferCallbacks callbacks,
                                         TransferOptions options)
    : io_context_(io_context)
    , transport_(std::move(transport))
    , negotiator_(std::move(negotiator))
    , callbacks_(std::move(callbacks))
    , options_(std::move(options))
    , registry_([this](const PeerId& peer_id, Role role) {
        return std::make_shared<PeerSession>(io_context_, peer_id, role, options_, negotiator_,
                                             weak_from_this());
    })
    , strand_(boost::asio::make_strand(io_context))
    , idle_timer_(strand_)
    , destroyed_(false)
{
}

TransferCoordinator::~TransferCoordinator() {
    destroy();
}

void TransferCoordinator::start() {
    std::weak_ptr<TransferCoordinator> weak = weak_from_this();
    transport_->subscribe([weak](const network::SignalEnvelope& envelope) {
        if (auto self = weak.lock()) {
            self->on_signal(envelope);
        }
    });
    
    if (options_.idle_timeout.count() > 0) {
        boost::asio::post(strand_, [weak]() {
            if (auto self = weak.lock()) {
                self->schedule_idle_sweep();
            }
        });
    }
    
    LOG_DEBUG("Transfer coordinator listening for signals");
}

std::future<TransferResult> TransferCoordinator::send_file(const PeerId& peer_id, storage::FileBlob file) {
    std::promise<TransferResult> offer_sent;
    auto future = offer_sent.get_future();
    
    if (destroyed_) {
        offer_sent.set_value(TransferResult(TransferError::SHUT_DOWN, "Coordinator has been destroyed"));
        return future;
    }
    
    auto [session, created] = registry_.get_or_create(peer_id, Role::SENDER);
    if (!created) {
        TransferResult result(TransferError::INVALID_STATE,
                              "A " + std::string(to_string(session->get_role())) +
                              " session with " + peer_id + " is already active");
        LOG_WARN("send_file to {} rejected: {}", peer_id, result.message);
        notify_error(peer_id, result);
        offer_sent.set_value(result);
        return future;
    }
    
    LOG_INFO("Sending '{}' ({} bytes) to {}", file.name, file.size(), peer_id);
    session->begin_send(std::move(file), std::move(offer_sent));
    return future;
}

void TransferCoordinator::on_signal(const network::SignalEnvelope& envelope) {
    if (destroyed_) {
        LOG_DEBUG("Ignoring signal from {} after destroy", envelope.from);
        return;
    }
    
    std::string error;
    auto payload = network::decode_signal(envelope.data, &error);
    if (!payload) {
        notify_error(envelope.from, TransferResult(TransferError::MALFORMED_FRAME,
                                                   "Malformed signal from " + envelope.from + ": " + error));
        return;
    }
    
    LOG_TRACE("Signal '{}' from {}", network::signal_type(*payload), envelope.from);
    
    if (auto* offer = std::get_if<network::OfferSignal>(&*payload)) {
        auto session = registry_.get_or_create(envelope.from, Role::RECEIVER).first;
        session->handle_offer(std::move(*offer));
        return;
    }
    
    auto session = registry_.find(envelope.from);
    if (!session) {
        LOG_DEBUG("Dropping {} from {}: no session", network::signal_type(*payload), envelope.from);
        return;
    }
    
    if (auto* answer = std::get_if<network::AnswerSignal>(&*payload)) {
        session->handle_answer(std::move(*answer));
    } else if (auto* candidate = std::get_if<network::CandidateSignal>(&*payload)) {
        session->handle_candidate(std::move(*candidate));
    }
}

void TransferCoordinator::destroy() {
    if (destroyed_.exchange(true)) {
        return;
    }
    
    transport_->unsubscribe();
    boost::asio::post(strand_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            self->idle_timer_.cancel();
        }
    });
    registry_.remove_all();
    
    // Wait out any callback already in flight.
    std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
    LOG_INFO("Transfer coordinator destroyed");
}

void TransferCoordinator::on_session_signal(const PeerId& peer_id, const network::SignalPayload& signal) {
    if (destroyed_) {
        return;
    }
    transport_->send(peer_id, network::encode_signal(signal));
}

void TransferCoordinator::on_session_progress(const PeerId& peer_id, std::uint64_t bytes, std::uint64_t total) {
    std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
    if (destroyed_ || !callbacks_.on_progress) {
        return;
    }
    callbacks_.on_progress(bytes, total);
}

void TransferCoordinator::on_session_complete(const PeerId& peer_id, storage::FileBlob file) {
    std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
    if (destroyed_ || !callbacks_.on_complete) {
        return;
    }
    callbacks_.on_complete(file, file.name, peer_id);
}

void TransferCoordinator::on_session_error(const PeerId& peer_id, const TransferResult& result) {
    notify_error(peer_id, result);
}

void TransferCoordinator::on_session_connection_state(const PeerId& peer_id, network::ConnectionState state) {
    std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
    if (destroyed_ || !callbacks_.on_connection_state_change) {
        return;
    }
    callbacks_.on_connection_state_change(peer_id, state);
}

void TransferCoordinator::on_session_closed(const PeerId& peer_id, const std::shared_ptr<PeerSession>& session) {
    registry_.remove_if_same(peer_id, session);
}

void TransferCoordinator::notify_error(const PeerId& peer_id, const TransferResult& result) {
    std::lock_guard<std::recursive_mutex> lock(callbacks_mutex_);
    if (destroyed_ || !callbacks_.on_error) {
        return;
    }
    callbacks_.on_error(peer_id, result);
}

void TransferCoordinator::schedule_idle_sweep() {
    if (destroyed_) {
        return;
    }
    
    auto interval = std::max(options_.idle_timeout / 2, std::chrono::milliseconds(10));
    idle_timer_.expires_after(interval);
    
    std::weak_ptr<TransferCoordinator> weak = weak_from_this();
    idle_timer_.async_wait([weak](const boost::system::error_code& ec) {
        auto self = weak.lock();
        if (ec || !self || self->destroyed_) {
            return;
        }
        
        for (const auto& session : self->registry_.snapshot()) {
            session->expire_if_idle(self->options_.idle_timeout);
        }
        self->schedule_idle_sweep();
    });
}

} // namespace peerdrop::transfer
