#include <gtest/gtest.h>
#include "peerdrop/network/signaling.hpp"

using namespace peerdrop::network;
using nlohmann::json;

TEST(SignalingTest, EncodeOfferCarriesMetadataInline) {
    OfferSignal offer{SessionDescription{"offer", "v=0 abc"},
                      peerdrop::storage::FileMetadata("photo.png", 2048, "image/png")};
    
    auto j = encode_signal(offer);
    
    EXPECT_EQ(j["type"], "offer");
    EXPECT_EQ(j["sdp"]["type"], "offer");
    EXPECT_EQ(j["sdp"]["sdp"], "v=0 abc");
    EXPECT_EQ(j["fileName"], "photo.png");
    EXPECT_EQ(j["fileSize"], 2048);
    EXPECT_EQ(j["fileType"], "image/png");
}

TEST(SignalingTest, EncodeAnswer) {
    auto j = encode_signal(AnswerSignal{SessionDescription{"answer", "v=0 xyz"}});
    
    EXPECT_EQ(j, json::parse(R"({"type":"answer","sdp":{"type":"answer","sdp":"v=0 xyz"}})"));
}

TEST(SignalingTest, EncodeCandidate) {
    auto j = encode_signal(CandidateSignal{IceCandidate{"candidate:1 1 udp 1 10.0.0.1 5000 typ host", "0", 0}});
    
    EXPECT_EQ(j["type"], "ice-candidate");
    EXPECT_EQ(j["candidate"]["candidate"], "candidate:1 1 udp 1 10.0.0.1 5000 typ host");
    EXPECT_EQ(j["candidate"]["sdpMid"], "0");
    EXPECT_EQ(j["candidate"]["sdpMLineIndex"], 0);
}

TEST(SignalingTest, DecodeOffer) {
    auto payload = decode_signal(json::parse(R"({
        "type": "offer",
        "sdp": {"type": "offer", "sdp": "blob"},
        "fileName": "a.bin", "fileSize": 10, "fileType": ""
    })"));
    
    ASSERT_TRUE(payload.has_value());
    auto& offer = std::get<OfferSignal>(*payload);
    EXPECT_EQ(offer.description, (SessionDescription{"offer", "blob"}));
    ASSERT_TRUE(offer.metadata.has_value());
    EXPECT_EQ(offer.metadata->file_name, "a.bin");
    EXPECT_EQ(offer.metadata->file_size, 10u);
    EXPECT_EQ(signal_type(*payload), std::string("offer"));
}

TEST(SignalingTest, DecodeOfferWithoutMetadata) {
    auto payload = decode_signal(json::parse(R"({"type":"offer","sdp":{"type":"offer","sdp":"blob"}})"));
    
    ASSERT_TRUE(payload.has_value());
    EXPECT_FALSE(std::get<OfferSignal>(*payload).metadata.has_value());
}

TEST(SignalingTest, DecodeCandidate) {
    auto payload = decode_signal(json::parse(
        R"({"type":"ice-candidate","candidate":{"candidate":"c1","sdpMid":"data","sdpMLineIndex":2}})"));
    
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(std::get<CandidateSignal>(*payload).candidate, (IceCandidate{"c1", "data", 2}));
    EXPECT_EQ(signal_type(*payload), std::string("ice-candidate"));
}

TEST(SignalingTest, EncodedPayloadsDecodeUnchanged) {
    std::vector<SignalPayload> payloads = {
        OfferSignal{SessionDescription{"offer", "s1"}, peerdrop::storage::FileMetadata("f", 1, "t")},
        AnswerSignal{SessionDescription{"answer", "s2"}},
        CandidateSignal{IceCandidate{"c", "m", 1}}
    };
    
    for (const auto& payload : payloads) {
        auto decoded = decode_signal(encode_signal(payload));
        ASSERT_TRUE(decoded.has_value());
        EXPECT_EQ(decoded->index(), payload.index());
        EXPECT_EQ(encode_signal(*decoded), encode_signal(payload));
    }
}

TEST(SignalingTest, RejectsMalformedPayloads) {
    std::string error;
    
    EXPECT_FALSE(decode_signal(json("offer"), &error).has_value());
    EXPECT_FALSE(decode_signal(json::parse(R"({"sdp":{}})"), &error).has_value());
    EXPECT_FALSE(decode_signal(json::parse(R"({"type":"answer"})"), &error).has_value());
    EXPECT_FALSE(decode_signal(json::parse(R"({"type":"answer","sdp":"raw"})"), &error).has_value());
    EXPECT_FALSE(decode_signal(json::parse(R"({"type":"ice-candidate","candidate":{}})"), &error).has_value());
    
    EXPECT_FALSE(decode_signal(json::parse(R"({"type":"bye"})"), &error).has_value());
    EXPECT_EQ(error, "Unknown signal type: bye");
}
