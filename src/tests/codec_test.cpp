#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "transfer/codec.hpp"
#include "transfer/transfer_error.hpp"

using namespace peerdrop::transfer;
using peerdrop::crypto::CryptoEngine;

class CodecTest : public ::testing::Test {
protected:
  static std::vector<uint8_t> control(const std::string& json) {
    std::vector<uint8_t> frame{0};
    frame.insert(frame.end(), json.begin(), json.end());
    return frame;
  }
};

TEST_F(CodecTest, ControlFramesStartWithPrefixZero) {
  const auto frame = Codec::encode(ControlMessage::ready());
  ASSERT_FALSE(frame.empty());
  EXPECT_EQ(frame[0], 0);
  EXPECT_EQ(std::string(frame.begin() + 1, frame.end()), R"({"type":"ready"})");
}

TEST_F(CodecTest, DecodesEveryControlType) {
  const auto ack = std::get<ControlMessage>(Codec::decode(control(R"({"type":"ack","index":41})")));
  EXPECT_EQ(ack.type, ControlType::ACK);
  EXPECT_EQ(ack.index, 41u);

  const auto done = std::get<ControlMessage>(Codec::decode(control(R"({"type":"done"})")));
  EXPECT_EQ(done.type, ControlType::DONE);

  const auto error = std::get<ControlMessage>(Codec::decode(control(R"({"type":"error","message":"disk full"})")));
  EXPECT_EQ(error.type, ControlType::ERROR);
  EXPECT_EQ(error.message, "disk full");

  const auto info = std::get<ControlMessage>(Codec::decode(
      control(R"({"type":"encrypted_file_info","nonce":"AAECAwQFBgcICQoL","ciphertext":"Zm9v"})")));
  EXPECT_EQ(info.type, ControlType::ENCRYPTED_FILE_INFO);
  EXPECT_EQ(info.nonce, (std::vector<uint8_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11}));
  EXPECT_EQ(info.ciphertext, (std::vector<uint8_t>{'f', 'o', 'o'}));

  const auto plain = std::get<ControlMessage>(Codec::decode(
      control(R"({"type":"file_info","filename":"a.txt","size":1})")));
  EXPECT_EQ(plain.type, ControlType::FILE_INFO);
}

TEST_F(CodecTest, EncryptedFileInfoSurvivesEncoding) {
  const auto nonce = CryptoEngine::generate_nonce();
  const std::vector<uint8_t> ciphertext{9, 8, 7, 6, 5};
  const auto frame = Codec::encode(ControlMessage::encrypted_file_info(nonce, ciphertext));

  const auto decoded = std::get<ControlMessage>(Codec::decode(frame));
  EXPECT_EQ(decoded.type, ControlType::ENCRYPTED_FILE_INFO);
  EXPECT_EQ(decoded.nonce, std::vector<uint8_t>(nonce.begin(), nonce.end()));
  EXPECT_EQ(decoded.ciphertext, ciphertext);
}

TEST_F(CodecTest, RefusesToEncodePlaintextMetadata) {
  ControlMessage message;
  message.type = ControlType::FILE_INFO;
  EXPECT_THROW(Codec::encode(message), TransferError);
}

TEST_F(CodecTest, ChunkFrameLayout) {
  ChunkMessage chunk;
  chunk.index = 0x0102030405060708ULL;
  chunk.nonce = CryptoEngine::chunk_nonce(chunk.index, CryptoEngine::Salt{0xAA, 0xBB, 0xCC, 0xDD});
  chunk.ciphertext.assign(CryptoEngine::TAG_SIZE + 3, 0x55);

  const auto frame = Codec::encode(chunk);
  ASSERT_EQ(frame.size(), Codec::CHUNK_HEADER_SIZE + chunk.ciphertext.size());
  EXPECT_EQ(frame[0], 2);
  EXPECT_EQ(frame[1], 0x01);
  EXPECT_EQ(frame[8], 0x08);
  EXPECT_EQ(frame[17], 0xAA);
  EXPECT_EQ(frame[20], 0xDD);
  EXPECT_EQ(frame[21], 0x55);

  const auto decoded = std::get<ChunkMessage>(Codec::decode(frame));
  EXPECT_EQ(decoded.index, chunk.index);
  EXPECT_EQ(decoded.nonce, chunk.nonce);
  EXPECT_EQ(decoded.ciphertext, chunk.ciphertext);
}

TEST_F(CodecTest, ShortestChunkFrameIsABareTag) {
  std::vector<uint8_t> frame(Codec::MIN_CHUNK_FRAME, 0);
  frame[0] = 2;
  EXPECT_EQ(Codec::MIN_CHUNK_FRAME, 37u);
  EXPECT_NO_THROW(Codec::decode(frame));

  frame.pop_back();
  EXPECT_THROW(Codec::decode(frame), ProtocolViolation);
}

TEST_F(CodecTest, LegacyChunksAreRecognized) {
  std::vector<uint8_t> frame{1, 0, 0, 0, 0, 0, 0, 0, 4, 'x'};
  const auto legacy = std::get<LegacyChunk>(Codec::decode(frame));
  EXPECT_EQ(legacy.index, 4u);
}

TEST_F(CodecTest, RejectsMalformedFrames) {
  EXPECT_THROW(Codec::decode({}), ProtocolViolation);
  EXPECT_THROW(Codec::decode({7, 1, 2}), ProtocolViolation);
  EXPECT_THROW(Codec::decode(control("{not json")), ProtocolViolation);
  EXPECT_THROW(Codec::decode(control(R"({"index":1})")), ProtocolViolation);
  EXPECT_THROW(Codec::decode(control(R"({"type":"ack"})")), ProtocolViolation);
  EXPECT_THROW(Codec::decode(control(R"({"type":"ack","index":-1})")), ProtocolViolation);
  EXPECT_THROW(Codec::decode(control(R"({"type":"encrypted_file_info","nonce":"!!"})")), ProtocolViolation);
  EXPECT_THROW(Codec::decode(control(R"({"type":"teleport"})")), ProtocolViolation);
}
