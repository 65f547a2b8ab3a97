#pragma once

#include "peerdrop/network/negotiator.hpp"
#include "peerdrop/network/signaling.hpp"
#include "peerdrop/storage/file_metadata.hpp"
#include "peerdrop/transfer/chunk_codec.hpp"
#include "peerdrop/transfer/flow_control.hpp"
#include "peerdrop/transfer/transfer_options.hpp"
#include "peerdrop/transfer/transfer_types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace peerdrop::transfer {

class PeerSession;

// Receives everything a session produces. Calls arrive on the session's
// strand, so calls for different peers may run concurrently.
class SessionListener {
public:
    virtual ~SessionListener() = default;
    
    virtual void on_session_signal(const PeerId& peer_id, const network::SignalPayload& signal) = 0;
    virtual void on_session_progress(const PeerId& peer_id, std::uint64_t bytes, std::uint64_t total) = 0;
    virtual void on_session_complete(const PeerId& peer_id, storage::FileBlob file) = 0;
    virtual void on_session_error(const PeerId& peer_id, const TransferResult& result) = 0;
    virtual void on_session_connection_state(const PeerId& peer_id, network::ConnectionState state) = 0;
    
    // The session reached Closed or Failed and has released its channel.
    virtual void on_session_closed(const PeerId& peer_id, const std::shared_ptr<PeerSession>& session) = 0;
};

// One negotiation and transfer with one remote peer. Every event, whether a
// public call, a channel callback or a timer, is posted to the session's
// strand, so the session's state is only ever touched by one handler at a
// time.
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    
    static constexpr const char* CHANNEL_LABEL = "fileTransfer";
    
    PeerSession(boost::asio::io_context& io_context,
                PeerId peer_id,
                Role role,
                const TransferOptions& options,
                std::shared_ptr<network::SessionNegotiator> negotiator,
                std::weak_ptr<SessionListener> listener);
    ~PeerSession();
    
    PeerSession(const PeerSession&) = delete;
    PeerSession& operator=(const PeerSession&) = delete;
    
    // Sender: open a channel and send the offer. offer_sent resolves once the
    // offer has been handed to the listener, or with the failure.
    void begin_send(storage::FileBlob file, std::promise<TransferResult> offer_sent);
    
    void handle_offer(network::OfferSignal offer);
    void handle_answer(network::AnswerSignal answer);
    void handle_candidate(network::CandidateSignal candidate);
    
    // Tears the session down without any further listener calls.
    void shutdown();
    
    void expire_if_idle(std::chrono::milliseconds max_idle);
    
    const PeerId& get_peer_id() const { return peer_id_; }
    Role get_role() const { return role_; }
    SessionState get_state() const { return state_; }
    
    std::optional<storage::FileMetadata> get_metadata() const;
    std::uint64_t get_received_bytes() const { return received_bytes_; }
    std::size_t get_received_chunk_count() const { return received_chunk_count_; }
    std::uint64_t get_bytes_sent() const { return bytes_sent_; }
    std::uint32_t get_backpressure_waits() const { return backpressure_waits_; }
    std::size_t get_peak_buffered() const { return peak_buffered_; }
    
private:
    using Step = void (PeerSession::*)();
    
    void do_begin_send(storage::FileBlob file, std::promise<TransferResult> offer_sent);
    void do_handle_offer(network::OfferSignal offer);
    void do_handle_answer(network::AnswerSignal answer);
    void do_handle_candidate(network::CandidateSignal candidate);
    
    void open_connection();
    void attach_channel(const std::shared_ptr<network::DataChannel>& channel);
    static void detach_channel(const std::shared_ptr<network::DataChannel>& channel);
    
    void on_local_candidate(const network::IceCandidate& candidate);
    void on_connection_state(network::ConnectionState state);
    void on_remote_data_channel(std::shared_ptr<network::DataChannel> channel);
    void on_channel_open();
    void on_channel_text(const std::string& text);
    void on_channel_binary(std::vector<std::uint8_t> data);
    void on_channel_error(const std::string& message);
    void on_channel_closed();
    
    bool enter_transferring();
    void send_chunks();
    void send_end();
    void wait_for_drain();
    void complete_receive();
    
    void schedule(std::chrono::milliseconds delay, Step step);
    bool transition(SessionState next);
    void set_metadata(const storage::FileMetadata& metadata);
    void finish();
    void fail(const TransferResult& result);
    void report(const TransferResult& result);
    void emit(network::SignalPayload signal);
    void release();
    void touch();
    
    std::shared_ptr<SessionListener> listener() const;
    
    boost::asio::io_context& io_context_;
    Strand strand_;
    boost::asio::steady_timer timer_;
    
    PeerId peer_id_;
    Role role_;
    TransferOptions options_;
    ChunkCodec codec_;
    FlowController flow_;
    std::shared_ptr<network::SessionNegotiator> negotiator_;
    
    mutable std::mutex listener_mutex_;
    std::weak_ptr<SessionListener> listener_;
    
    std::shared_ptr<network::PeerConnection> connection_;
    std::shared_ptr<network::DataChannel> channel_;
    
    std::atomic<SessionState> state_;
    std::atomic<bool> shutdown_requested_;
    std::chrono::steady_clock::time_point last_activity_;
    
    mutable std::mutex metadata_mutex_;
    std::optional<storage::FileMetadata> metadata_;
    
    // Sender
    std::optional<storage::FileBlob> file_;
    std::size_t next_chunk_;
    bool send_started_;
    bool answer_applied_;
    std::atomic<std::uint64_t> bytes_sent_;
    std::atomic<std::uint32_t> backpressure_waits_;
    std::atomic<std::size_t> peak_buffered_;
    
    // Receiver
    bool offer_applied_;
    std::vector<std::vector<std::uint8_t>> received_chunks_;
    std::atomic<std::uint64_t> received_bytes_;
    std::atomic<std::size_t> received_chunk_count_;
};

} // namespace peerdrop::transfer
