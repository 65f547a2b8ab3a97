#include <gtest/gtest.h>
#include "peerdrop/network/loopback.hpp"

using namespace peerdrop::network;

class LoopbackNetworkTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<LoopbackNetwork>(io_);
        caller_ = network_->create_connection("callee");
        callee_ = network_->create_connection("caller");
        
        caller_->on_state_change([this](ConnectionState state) { caller_states_.push_back(state); });
        callee_->on_data_channel([this](std::shared_ptr<DataChannel> channel) { remote_channel_ = channel; });
    }
    
    void run() {
        io_.restart();
        io_.run();
    }
    
    // Offer/answer exchange with one channel created up front.
    void connect() {
        local_channel_ = caller_->create_data_channel("fileTransfer");
        auto offer = caller_->create_offer();
        callee_->set_remote_description(offer);
        auto answer = callee_->create_answer();
        caller_->set_remote_description(answer);
        run();
        ASSERT_TRUE(remote_channel_);
    }
    
    boost::asio::io_context io_;
    std::shared_ptr<LoopbackNetwork> network_;
    std::shared_ptr<LoopbackPeerConnection> caller_;
    std::shared_ptr<LoopbackPeerConnection> callee_;
    std::shared_ptr<DataChannel> local_channel_;
    std::shared_ptr<DataChannel> remote_channel_;
    std::vector<ConnectionState> caller_states_;
};

TEST_F(LoopbackNetworkTest, OfferAnswerOpensChannelOnBothEnds) {
    connect();
    
    EXPECT_TRUE(local_channel_->is_open());
    EXPECT_TRUE(remote_channel_->is_open());
    EXPECT_EQ(remote_channel_->label(), "fileTransfer");
    
    ASSERT_GE(caller_states_.size(), 2u);
    EXPECT_EQ(caller_states_.front(), ConnectionState::CONNECTING);
    EXPECT_EQ(caller_states_.back(), ConnectionState::CONNECTED);
    
    EXPECT_EQ(network_->get_connections_created(), 2u);
    EXPECT_EQ(network_->get_channels_created(), 1u);
}

TEST_F(LoopbackNetworkTest, ChannelNotOpenBeforeAnswer) {
    local_channel_ = caller_->create_data_channel("fileTransfer");
    caller_->create_offer();
    run();
    
    EXPECT_FALSE(local_channel_->is_open());
    EXPECT_FALSE(local_channel_->send_text("early"));
    EXPECT_FALSE(remote_channel_);
}

TEST_F(LoopbackNetworkTest, MessagesArriveInOrder) {
    connect();
    
    std::vector<std::string> received;
    remote_channel_->on_text([&](const std::string& text) { received.push_back("text:" + text); });
    remote_channel_->on_binary([&](std::vector<std::uint8_t> data) {
        received.push_back("binary:" + std::to_string(data.size()));
    });
    
    std::vector<std::uint8_t> payload(1000, 0x5a);
    EXPECT_TRUE(local_channel_->send_text("first"));
    EXPECT_TRUE(local_channel_->send_binary(payload));
    EXPECT_TRUE(local_channel_->send_text("last"));
    EXPECT_EQ(local_channel_->buffered_amount(), 1009u);
    
    run();
    
    EXPECT_EQ(received, (std::vector<std::string>{"text:first", "binary:1000", "text:last"}));
    EXPECT_EQ(local_channel_->buffered_amount(), 0u);
}

TEST_F(LoopbackNetworkTest, PausedDeliveryHoldsBufferedBytes) {
    connect();
    
    std::size_t delivered = 0;
    remote_channel_->on_binary([&](std::vector<std::uint8_t> data) { delivered += data.size(); });
    
    network_->set_delivery_paused(true);
    std::vector<std::uint8_t> chunk(100, 1);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(local_channel_->send_binary(chunk));
    }
    run();
    
    EXPECT_EQ(delivered, 0u);
    EXPECT_EQ(local_channel_->buffered_amount(), 300u);
    
    network_->set_delivery_paused(false);
    run();
    
    EXPECT_EQ(delivered, 300u);
    EXPECT_EQ(local_channel_->buffered_amount(), 0u);
    
    auto loopback_channel = std::dynamic_pointer_cast<LoopbackDataChannel>(local_channel_);
    ASSERT_TRUE(loopback_channel);
    EXPECT_EQ(loopback_channel->peak_buffered_amount(), 300u);
}

TEST_F(LoopbackNetworkTest, CloseReachesRemoteAfterPendingMessages) {
    connect();
    
    std::vector<std::string> events;
    remote_channel_->on_text([&](const std::string& text) { events.push_back(text); });
    remote_channel_->on_close([&]() { events.push_back("closed"); });
    
    local_channel_->send_text("bye");
    local_channel_->close();
    run();
    
    EXPECT_EQ(events, (std::vector<std::string>{"bye", "closed"}));
    EXPECT_FALSE(remote_channel_->is_open());
    EXPECT_FALSE(remote_channel_->send_text("too late"));
}

TEST_F(LoopbackNetworkTest, ClosingConnectionClosesChannels) {
    connect();
    
    bool remote_closed = false;
    remote_channel_->on_close([&]() { remote_closed = true; });
    
    caller_->close();
    run();
    
    EXPECT_TRUE(caller_->is_closed());
    EXPECT_TRUE(remote_closed);
    EXPECT_EQ(caller_states_.back(), ConnectionState::CLOSED);
    EXPECT_THROW(caller_->create_offer(), NegotiationError);
}

TEST_F(LoopbackNetworkTest, InjectedErrorReachesHandler) {
    connect();
    
    std::string error;
    local_channel_->on_error([&](const std::string& message) { error = message; });
    
    std::dynamic_pointer_cast<LoopbackDataChannel>(local_channel_)->inject_error("boom");
    run();
    
    EXPECT_EQ(error, "boom");
}

TEST_F(LoopbackNetworkTest, LocalCandidatesAreAnnounced) {
    std::vector<IceCandidate> candidates;
    caller_->on_local_candidate([&](const IceCandidate& candidate) { candidates.push_back(candidate); });
    
    caller_->create_offer();
    run();
    
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_NE(candidates[0].candidate.find("typ host"), std::string::npos);
    
    callee_->add_remote_candidate(candidates[0]);
    EXPECT_EQ(callee_->get_remote_candidates(), candidates);
}

TEST_F(LoopbackNetworkTest, RejectsInvalidNegotiation) {
    EXPECT_THROW(callee_->create_answer(), NegotiationError);
    EXPECT_THROW(callee_->set_remote_description(SessionDescription{"offer", "not a loopback sdp"}),
                 NegotiationError);
    EXPECT_THROW(callee_->add_remote_candidate(IceCandidate{"", "0", 0}), NegotiationError);
    
    auto offer = caller_->create_offer();
    EXPECT_THROW(caller_->set_remote_description(SessionDescription{"pranswer", offer.sdp}),
                 NegotiationError);
    
    // An answer needs a local offer first.
    auto stray = network_->create_connection("stray");
    EXPECT_THROW(stray->set_remote_description(SessionDescription{"answer", offer.sdp}), NegotiationError);
}

TEST(LoopbackNegotiatorTest, CreatesConnectionsUntilTold) {
    boost::asio::io_context io;
    auto network = std::make_shared<LoopbackNetwork>(io);
    LoopbackNegotiator negotiator(network);
    
    NegotiatorConfig config{{"stun:stun.example.org:3478"}};
    auto connection = negotiator.create_connection("peer-a", config);
    ASSERT_TRUE(connection);
    EXPECT_EQ(negotiator.get_last_config().ice_servers, config.ice_servers);
    EXPECT_EQ(network->get_connections_created(), 1u);
    
    negotiator.set_fail_connections(true);
    EXPECT_THROW(negotiator.create_connection("peer-b", config), NegotiationError);
    EXPECT_EQ(network->get_connections_created(), 1u);
}

TEST(LoopbackSignalingTest, RoutesPayloadsToSubscriber) {
    boost::asio::io_context io;
    auto hub = std::make_shared<LoopbackSignalingHub>(io);
    auto alice = hub->create_endpoint("alice");
    auto bob = hub->create_endpoint("bob");
    
    std::vector<SignalEnvelope> received;
    bob->subscribe([&](const SignalEnvelope& envelope) { received.push_back(envelope); });
    EXPECT_TRUE(bob->is_subscribed());
    
    nlohmann::json payload = {{"type", "answer"}, {"sdp", {{"type", "answer"}, {"sdp", "x"}}}};
    alice->send("bob", payload);
    alice->send("carol", payload);
    io.run();
    
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].from, "alice");
    EXPECT_EQ(received[0].data, payload);
    EXPECT_EQ(hub->get_messages_routed(), 2u);
    EXPECT_EQ(alice->get_sent_payloads().size(), 2u);
}

TEST(LoopbackSignalingTest, UnsubscribedEndpointDropsPayloads) {
    boost::asio::io_context io;
    auto hub = std::make_shared<LoopbackSignalingHub>(io);
    auto alice = hub->create_endpoint("alice");
    auto bob = hub->create_endpoint("bob");
    
    int calls = 0;
    bob->subscribe([&](const SignalEnvelope&) { calls++; });
    bob->unsubscribe();
    EXPECT_FALSE(bob->is_subscribed());
    
    alice->send("bob", nlohmann::json{{"type", "end"}});
    io.run();
    
    EXPECT_EQ(calls, 0);
}
