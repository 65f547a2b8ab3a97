#include "peerdrop/transfer/peer_session.hpp"
#include "peerdrop/network/control_frame.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::transfer {

PeerSession::PeerSession(boost::asio::io_context& io_context,
                         PeerId peer_id,
                         Role role,
                         const TransferOptions& options,
                         std::shared_ptr<network::SessionNegotiator> negotiator,
                         std::weak_ptr<SessionListener> listener)
    : io_context_(io_context)
    , strand_(boost::asio::make_strand(io_context))
    , timer_(strand_)
    , peer_id_(std::move(peer_id))
    , role_(role)
    , options_(options)
    , codec_(options.chunk_size)
    , flow_(options.chunk_size, options.high_water_chunks, options.backoff)
    , negotiator_(std::move(negotiator))
    , listener_(std::move(listener))
    , state_(SessionState::NEGOTIATING)
    , shutdown_requested_(false)
    , last_activity_(std::chrono::steady_clock::now())
    , next_chunk_(0)
    , send_started_(false)
    , answer_applied_(false)
    , bytes_sent_(0)
    , backpressure_waits_(0)
    , peak_buffered_(0)
    , offer_applied_(false)
    , received_bytes_(0)
    , received_chunk_count_(0)
{
    LOG_DEBUG("Created {} session for peer {}", to_string(role_), peer_id_);
}

PeerSession::~PeerSession() {
    release();
}

void PeerSession::begin_send(storage::FileBlob file, std::promise<TransferResult> offer_sent) {
    boost::asio::post(strand_, [self = shared_from_this(),
                                file = std::move(file),
                                offer_sent = std::move(offer_sent)]() mutable {
        self->do_begin_send(std::move(file), std::move(offer_sent));
    });
}

void PeerSession::handle_offer(network::OfferSignal offer) {
    boost::asio::post(strand_, [self = shared_from_this(), offer = std::move(offer)]() mutable {
        self->do_handle_offer(std::move(offer));
    });
}

void PeerSession::handle_answer(network::AnswerSignal answer) {
    boost::asio::post(strand_, [self = shared_from_this(), answer = std::move(answer)]() mutable {
        self->do_handle_answer(std::move(answer));
    });
}

void PeerSession::handle_candidate(network::CandidateSignal candidate) {
    boost::asio::post(strand_, [self = shared_from_this(), candidate = std::move(candidate)]() mutable {
        self->do_handle_candidate(std::move(candidate));
    });
}

void PeerSession::shutdown() {
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_.reset();
    }
    shutdown_requested_ = true;
    
    boost::asio::post(strand_, [self = shared_from_this()]() {
        if (!is_terminal(self->state_)) {
            self->transition(SessionState::CLOSED);
        }
        self->release();
        LOG_DEBUG("Session for peer {} shut down", self->peer_id_);
    });
}

void PeerSession::expire_if_idle(std::chrono::milliseconds max_idle) {
    boost::asio::post(strand_, [self = shared_from_this(), max_idle]() {
        if (is_terminal(self->state_)) {
            return;
        }
        
        auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - self->last_activity_);
        if (idle >= max_idle) {
            self->fail(TransferResult(TransferError::TIMEOUT,
                                      "Session idle for " + std::to_string(idle.count()) + "ms"));
        }
    });
}

std::optional<storage::FileMetadata> PeerSession::get_metadata() const {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    return metadata_;
}

void PeerSession::do_begin_send(storage::FileBlob file, std::promise<TransferResult> offer_sent) {
    if (shutdown_requested_ || is_terminal(state_)) {
        offer_sent.set_value(TransferResult(TransferError::SHUT_DOWN, "Session is shut down"));
        return;
    }
    
    if (role_ != Role::SENDER || send_started_) {
        offer_sent.set_value(TransferResult(TransferError::INVALID_STATE,
                                            "A transfer to " + peer_id_ + " is already in progress"));
        return;
    }
    
    send_started_ = true;
    touch();
    
    auto metadata = file.metadata();
    set_metadata(metadata);
    file_ = std::move(file);
    
    try {
        open_connection();
        
        auto channel = connection_->create_data_channel(CHANNEL_LABEL);
        if (!channel) {
            throw network::NegotiationError("Negotiator returned no data channel");
        }
        attach_channel(channel);
        channel_ = channel;
        
        auto offer = connection_->create_offer();
        emit(network::OfferSignal{offer, metadata});
        
        LOG_INFO("Offered '{}' ({} bytes) to {}", metadata.file_name, metadata.file_size, peer_id_);
        offer_sent.set_value(TransferResult(TransferError::SUCCESS));
    } catch (const network::NegotiationError& e) {
        TransferResult result(TransferError::NEGOTIATION_FAILURE, e.what());
        offer_sent.set_value(result);
        fail(result);
    }
}

void PeerSession::do_handle_offer(network::OfferSignal offer) {
    touch();
    
    if (role_ != Role::RECEIVER || offer_applied_ || state_ != SessionState::NEGOTIATING) {
        report(TransferResult(TransferError::INVALID_STATE,
                              "Unexpected offer from " + peer_id_ + " in state " + to_string(state_)));
        return;
    }
    offer_applied_ = true;
    
    if (offer.metadata) {
        if (offer.metadata->file_size > options_.max_file_size) {
            fail(TransferResult(TransferError::FILE_TOO_LARGE,
                                "Offered file of " + std::to_string(offer.metadata->file_size) +
                                " bytes exceeds the limit of " + std::to_string(options_.max_file_size)));
            return;
        }
        set_metadata(*offer.metadata);
        LOG_INFO("Incoming '{}' ({} bytes) from {}", offer.metadata->file_name,
                 offer.metadata->file_size, peer_id_);
    }
    
    try {
        open_connection();
        connection_->set_remote_description(offer.description);
        auto answer = connection_->create_answer();
        emit(network::AnswerSignal{answer});
    } catch (const network::NegotiationError& e) {
        fail(TransferResult(TransferError::NEGOTIATION_FAILURE, e.what()));
    }
}

void PeerSession::do_handle_answer(network::AnswerSignal answer) {
    touch();
    
    if (role_ != Role::SENDER || !connection_ || answer_applied_ ||
        state_ != SessionState::NEGOTIATING) {
        report(TransferResult(TransferError::INVALID_STATE,
                              "Unexpected answer from " + peer_id_ + " in state " + to_string(state_)));
        return;
    }
    answer_applied_ = true;
    
    try {
        connection_->set_remote_description(answer.description);
        LOG_DEBUG("Applied answer from {}", peer_id_);
    } catch (const network::NegotiationError& e) {
        fail(TransferResult(TransferError::NEGOTIATION_FAILURE, e.what()));
    }
}

void PeerSession::do_handle_candidate(network::CandidateSignal candidate) {
    if (is_terminal(state_)) {
        LOG_DEBUG("Dropping candidate for finished session with {}", peer_id_);
        return;
    }
    if (!connection_) {
        LOG_DEBUG("Dropping candidate from {}: no connection yet", peer_id_);
        return;
    }
    
    touch();
    try {
        connection_->add_remote_candidate(candidate.candidate);
    } catch (const network::NegotiationError& e) {
        fail(TransferResult(TransferError::NEGOTIATION_FAILURE, e.what()));
    }
}

void PeerSession::open_connection() {
    if (connection_) {
        return;
    }
    
    connection_ = negotiator_->create_connection(peer_id_, options_.negotiator);
    if (!connection_) {
        throw network::NegotiationError("Negotiator returned no connection for " + peer_id_);
    }
    
    std::weak_ptr<PeerSession> weak = weak_from_this();
    
    connection_->on_local_candidate([weak](const network::IceCandidate& candidate) {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, candidate]() {
                self->on_local_candidate(candidate);
            });
        }
    });
    
    connection_->on_state_change([weak](network::ConnectionState state) {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, state]() {
                self->on_connection_state(state);
            });
        }
    });
    
    // Handlers go on the channel right away so no event fired between
    // acceptance and adoption is lost.
    connection_->on_data_channel([weak](std::shared_ptr<network::DataChannel> channel) {
        auto self = weak.lock();
        if (!self || !channel) {
            return;
        }
        self->attach_channel(channel);
        boost::asio::post(self->strand_, [self, channel]() {
            self->on_remote_data_channel(channel);
        });
    });
}

void PeerSession::attach_channel(const std::shared_ptr<network::DataChannel>& channel) {
    std::weak_ptr<PeerSession> weak = weak_from_this();
    
    channel->on_open([weak]() {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self]() { self->on_channel_open(); });
        }
    });
    
    channel->on_text([weak](const std::string& text) {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, text]() { self->on_channel_text(text); });
        }
    });
    
    channel->on_binary([weak](std::vector<std::uint8_t> data) {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, data = std::move(data)]() mutable {
                self->on_channel_binary(std::move(data));
            });
        }
    });
    
    channel->on_error([weak](const std::string& message) {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self, message]() { self->on_channel_error(message); });
        }
    });
    
    channel->on_close([weak]() {
        if (auto self = weak.lock()) {
            boost::asio::post(self->strand_, [self]() { self->on_channel_closed(); });
        }
    });
}

void PeerSession::detach_channel(const std::shared_ptr<network::DataChannel>& channel) {
    channel->on_open(nullptr);
    channel->on_text(nullptr);
    channel->on_binary(nullptr);
    channel->on_error(nullptr);
    channel->on_close(nullptr);
}

void PeerSession::on_local_candidate(const network::IceCandidate& candidate) {
    if (is_terminal(state_)) {
        return;
    }
    emit(network::CandidateSignal{candidate});
}

void PeerSession::on_connection_state(network::ConnectionState state) {
    LOG_DEBUG("Connection to {} is {}", peer_id_, network::to_string(state));
    
    if (auto l = listener()) {
        l->on_session_connection_state(peer_id_, state);
    }
    
    if (is_terminal(state_)) {
        return;
    }
    
    switch (state) {
        case network::ConnectionState::FAILED:
            fail(TransferResult(TransferError::CHANNEL_ERROR, "Connection to " + peer_id_ + " failed"));
            break;
        case network::ConnectionState::DISCONNECTED:
        case network::ConnectionState::CLOSED:
            finish();
            break;
        default:
            touch();
            break;
    }
}

void PeerSession::on_remote_data_channel(std::shared_ptr<network::DataChannel> channel) {
    if (role_ != Role::RECEIVER || channel_ || is_terminal(state_)) {
        LOG_WARN("Rejecting unexpected data channel '{}' from {}", channel->label(), peer_id_);
        detach_channel(channel);
        channel->close();
        return;
    }
    
    channel_ = std::move(channel);
    LOG_DEBUG("Accepted data channel '{}' from {}", channel_->label(), peer_id_);
    
    // The open event may have fired before the handlers were in place.
    if (channel_->is_open()) {
        on_channel_open();
    }
}

void PeerSession::on_channel_open() {
    if (!channel_ || state_ != SessionState::NEGOTIATING) {
        return;
    }
    
    touch();
    transition(SessionState::CHANNEL_OPEN);
    
    if (role_ == Role::RECEIVER) {
        return;
    }
    
    transition(SessionState::TRANSFERRING);
    
    auto metadata = get_metadata();
    if (!channel_->send_text(network::encode_control_frame(network::MetadataFrame{*metadata}))) {
        fail(TransferResult(TransferError::CHANNEL_ERROR, "Failed to send metadata frame"));
        return;
    }
    flow_.on_enqueued(channel_->buffered_amount());
    peak_buffered_ = flow_.get_peak_buffered();
    
    send_chunks();
}

void PeerSession::on_channel_text(const std::string& text) {
    touch();
    
    if (role_ != Role::RECEIVER) {
        LOG_DEBUG("Sender ignoring text message from {}", peer_id_);
        return;
    }
    if (is_terminal(state_) || state_ == SessionState::COMPLETE) {
        return;
    }
    
    std::string error;
    auto frame = network::decode_control_frame(text, &error);
    if (!frame) {
        report(TransferResult(TransferError::MALFORMED_FRAME, "Malformed control frame: " + error));
        return;
    }
    
    if (auto* metadata_frame = std::get_if<network::MetadataFrame>(&*frame)) {
        auto current = get_metadata();
        if (current) {
            if (*current != metadata_frame->metadata) {
                LOG_WARN("Metadata frame from {} differs from the offer, keeping the offer's", peer_id_);
            }
        } else if (received_chunk_count_ > 0) {
            report(TransferResult(TransferError::MALFORMED_FRAME, "Metadata frame after file data"));
            return;
        } else if (metadata_frame->metadata.file_size > options_.max_file_size) {
            fail(TransferResult(TransferError::FILE_TOO_LARGE,
                                "Announced file of " + std::to_string(metadata_frame->metadata.file_size) +
                                " bytes exceeds the limit of " + std::to_string(options_.max_file_size)));
            return;
        } else {
            set_metadata(metadata_frame->metadata);
        }
        
        enter_transferring();
        return;
    }
    
    if (!get_metadata()) {
        report(TransferResult(TransferError::MALFORMED_FRAME, "End frame before metadata"));
        return;
    }
    
    if (enter_transferring()) {
        complete_receive();
    }
}

void PeerSession::on_channel_binary(std::vector<std::uint8_t> data) {
    touch();
    
    if (role_ != Role::RECEIVER) {
        LOG_DEBUG("Sender ignoring binary message from {}", peer_id_);
        return;
    }
    if (is_terminal(state_) || state_ == SessionState::COMPLETE) {
        return;
    }
    
    enter_transferring();
    
    if (received_bytes_ + data.size() > options_.max_file_size) {
        fail(TransferResult(TransferError::FILE_TOO_LARGE,
                            "Received data exceeds the limit of " + std::to_string(options_.max_file_size)));
        return;
    }
    
    auto size = data.size();
    received_chunks_.push_back(std::move(data));
    received_bytes_ += size;
    received_chunk_count_ = received_chunks_.size();
    
    auto metadata = get_metadata();
    if (metadata) {
        if (auto l = listener()) {
            l->on_session_progress(peer_id_, received_bytes_, metadata->file_size);
        }
    }
}

void PeerSession::on_channel_error(const std::string& message) {
    if (is_terminal(state_)) {
        return;
    }
    fail(TransferResult(TransferError::CHANNEL_ERROR, "Data channel error: " + message));
}

void PeerSession::on_channel_closed() {
    if (is_terminal(state_)) {
        return;
    }
    
    if (state_ == SessionState::COMPLETE) {
        finish();
        return;
    }
    
    fail(TransferResult(TransferError::CHANNEL_ERROR, "Data channel closed before the transfer completed"));
}

bool PeerSession::enter_transferring() {
    if (state_ == SessionState::NEGOTIATING) {
        transition(SessionState::CHANNEL_OPEN);
    }
    if (state_ == SessionState::CHANNEL_OPEN) {
        transition(SessionState::TRANSFERRING);
    }
    return state_ == SessionState::TRANSFERRING;
}

void PeerSession::send_chunks() {
    if (shutdown_requested_ || state_ != SessionState::TRANSFERRING) {
        return;
    }
    if (!channel_ || !channel_->is_open()) {
        fail(TransferResult(TransferError::CHANNEL_ERROR, "Data channel closed during transfer"));
        return;
    }
    
    auto chunks = codec_.split(file_->data);
    auto total = file_->size();
    
    while (next_chunk_ < chunks.size()) {
        if (flow_.should_wait(channel_->buffered_amount())) {
            flow_.on_wait();
            backpressure_waits_ = flow_.get_wait_count();
            LOG_TRACE("Backing off {}ms, {} bytes buffered to {}",
                      flow_.get_retry_delay().count(), channel_->buffered_amount(), peer_id_);
            schedule(flow_.get_retry_delay(), &PeerSession::send_chunks);
            return;
        }
        
        auto chunk = chunks.chunk_at(next_chunk_);
        if (!channel_->send_binary(chunk)) {
            fail(TransferResult(TransferError::CHANNEL_ERROR,
                                "Failed to send chunk " + std::to_string(next_chunk_)));
            return;
        }
        
        next_chunk_++;
        bytes_sent_ += chunk.size();
        flow_.on_enqueued(channel_->buffered_amount());
        peak_buffered_ = flow_.get_peak_buffered();
        touch();
        
        if (auto l = listener()) {
            l->on_session_progress(peer_id_, bytes_sent_, total);
        }
        
        // A progress callback may have torn everything down.
        if (shutdown_requested_ || state_ != SessionState::TRANSFERRING) {
            return;
        }
    }
    
    send_end();
}

void PeerSession::send_end() {
    if (shutdown_requested_ || state_ != SessionState::TRANSFERRING) {
        return;
    }
    if (!channel_ || !channel_->is_open()) {
        fail(TransferResult(TransferError::CHANNEL_ERROR, "Data channel closed during transfer"));
        return;
    }
    
    if (flow_.should_wait(channel_->buffered_amount())) {
        flow_.on_wait();
        backpressure_waits_ = flow_.get_wait_count();
        schedule(flow_.get_retry_delay(), &PeerSession::send_end);
        return;
    }
    
    if (!channel_->send_text(network::encode_control_frame(network::EndFrame{}))) {
        fail(TransferResult(TransferError::CHANNEL_ERROR, "Failed to send end frame"));
        return;
    }
    flow_.on_enqueued(channel_->buffered_amount());
    peak_buffered_ = flow_.get_peak_buffered();
    
    transition(SessionState::COMPLETE);
    LOG_INFO("Sent '{}' to {} ({} bytes, {} backoffs)", file_->name, peer_id_,
             bytes_sent_.load(), backpressure_waits_.load());
    
    wait_for_drain();
}

void PeerSession::wait_for_drain() {
    if (state_ != SessionState::COMPLETE) {
        return;
    }
    
    if (channel_ && channel_->is_open() && channel_->buffered_amount() > 0) {
        schedule(options_.backoff, &PeerSession::wait_for_drain);
        return;
    }
    
    finish();
}

void PeerSession::complete_receive() {
    transition(SessionState::COMPLETE);
    
    auto metadata = *get_metadata();
    storage::FileBlob file(metadata.file_name, metadata.file_type, ChunkCodec::assemble(received_chunks_));
    
    received_chunks_.clear();
    received_bytes_ = 0;
    received_chunk_count_ = 0;
    
    if (file.size() != metadata.file_size) {
        LOG_WARN("Received {} bytes from {} but {} were announced", file.size(), peer_id_, metadata.file_size);
    }
    LOG_INFO("Received '{}' ({} bytes) from {}", file.name, file.size(), peer_id_);
    
    if (auto l = listener()) {
        l->on_session_complete(peer_id_, std::move(file));
    }
    
    finish();
}

void PeerSession::schedule(std::chrono::milliseconds delay, Step step) {
    timer_.expires_after(delay);
    timer_.async_wait([weak = weak_from_this(), step](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            (self.get()->*step)();
        }
    });
}

bool PeerSession::transition(SessionState next) {
    SessionState current = state_;
    if (!is_legal_transition(current, next)) {
        LOG_WARN("Session {} rejected transition {} -> {}", peer_id_, to_string(current), to_string(next));
        return false;
    }
    
    LOG_DEBUG("Session {} {} -> {}", peer_id_, to_string(current), to_string(next));
    state_ = next;
    return true;
}

void PeerSession::set_metadata(const storage::FileMetadata& metadata) {
    std::lock_guard<std::mutex> lock(metadata_mutex_);
    if (!metadata_) {
        metadata_ = metadata;
    }
}

void PeerSession::finish() {
    if (is_terminal(state_)) {
        return;
    }
    
    transition(SessionState::CLOSED);
    release();
    
    if (auto l = listener()) {
        l->on_session_closed(peer_id_, shared_from_this());
    }
}

void PeerSession::fail(const TransferResult& result) {
    if (is_terminal(state_)) {
        return;
    }
    
    // Nothing is left to lose once the last frame is out.
    if (state_ == SessionState::COMPLETE) {
        LOG_DEBUG("Session {} closing after completion: {}", peer_id_, result.message);
        finish();
        return;
    }
    
    transition(SessionState::FAILED);
    LOG_ERROR("Session with {} failed ({}): {}", peer_id_, to_string(result.error), result.message);
    release();
    
    if (auto l = listener()) {
        l->on_session_closed(peer_id_, shared_from_this());
        l->on_session_error(peer_id_, result);
    }
}

void PeerSession::report(const TransferResult& result) {
    LOG_WARN("Session with {} ({}): {}", peer_id_, to_string(result.error), result.message);
    if (auto l = listener()) {
        l->on_session_error(peer_id_, result);
    }
}

void PeerSession::emit(network::SignalPayload signal) {
    if (auto l = listener()) {
        l->on_session_signal(peer_id_, signal);
    }
}

void PeerSession::release() {
    timer_.cancel();
    
    if (channel_) {
        detach_channel(channel_);
        channel_->close();
        channel_.reset();
    }
    
    if (connection_) {
        connection_->on_local_candidate(nullptr);
        connection_->on_state_change(nullptr);
        connection_->on_data_channel(nullptr);
        connection_->close();
        connection_.reset();
    }
    
    received_chunks_.clear();
    received_bytes_ = 0;
    received_chunk_count_ = 0;
    file_.reset();
}

void PeerSession::touch() {
    last_activity_ = std::chrono::steady_clock::now();
}

std::shared_ptr<SessionListener> PeerSession::listener() const {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    return listener_.lock();
}

} // namespace peerdrop::transfer
