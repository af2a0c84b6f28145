/**
 * @file receive_reassembler_test.cpp
 * @brief Header/body splitting across arbitrary delivery boundaries
 */

#include "filebeam/ReceiveReassembler.h"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace FileBeam;

namespace {

class Recorder {
public:
    std::vector<FileHeader> headers;
    std::string body;
    bool rejectHeader = false;
    bool rejectBody = false;

    ReceiveReassembler make() {
        return ReceiveReassembler(
            [this](const FileHeader& header, std::string& errorMsg) {
                if (rejectHeader) {
                    errorMsg = "header rejected";
                    return false;
                }
                headers.push_back(header);
                return true;
            },
            [this](const uint8_t* data, size_t size, std::string& errorMsg) {
                if (rejectBody) {
                    errorMsg = "body rejected";
                    return false;
                }
                body.append(reinterpret_cast<const char*>(data), size);
                return true;
            });
    }
};

std::vector<uint8_t> wire(const std::string& name, const std::string& body) {
    std::vector<uint8_t> out;
    std::string error;
    EXPECT_TRUE(encodeFileHeader(name, body.size(), out, error)) << error;
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

}  // namespace

TEST(ReceiveReassemblerTest, SingleDeliveryCarriesHeaderAndBody) {
    Recorder rec;
    auto reassembler = rec.make();
    const auto bytes = wire("report.pdf", "hello");
    std::string error;

    ASSERT_TRUE(reassembler.push(bytes.data(), bytes.size(), error)) << error;
    ASSERT_EQ(rec.headers.size(), 1u);
    EXPECT_EQ(rec.headers[0].fileName, "report.pdf");
    EXPECT_EQ(rec.headers[0].fileSize, 5u);
    EXPECT_EQ(rec.body, "hello");
    EXPECT_EQ(reassembler.state(), ReassemblyState::STREAMING_BODY);
    EXPECT_TRUE(reassembler.hasHeader());
    EXPECT_EQ(reassembler.header().fileName, "report.pdf");
    EXPECT_EQ(reassembler.bufferedBytes(), 0u);
    EXPECT_TRUE(reassembler.finish(error));
}

/**
 * @test One byte per delivery still yields one header and the exact body
 */
TEST(ReceiveReassemblerTest, ByteByByteDelivery) {
    Recorder rec;
    auto reassembler = rec.make();
    const auto bytes = wire("report.pdf", "hello");
    std::string error;

    for (uint8_t b : bytes) {
        ASSERT_TRUE(reassembler.push(&b, 1, error)) << error;
    }

    ASSERT_EQ(rec.headers.size(), 1u);
    EXPECT_EQ(rec.body, "hello");
    EXPECT_EQ(reassembler.bodyBytesForwarded(), 5u);
}

TEST(ReceiveReassemblerTest, EverySplitPointProducesSameResult) {
    const auto bytes = wire("a/b.txt", "0123456789");

    for (size_t split = 0; split <= bytes.size(); ++split) {
        Recorder rec;
        auto reassembler = rec.make();
        std::string error;

        ASSERT_TRUE(reassembler.push(bytes.data(), split, error));
        ASSERT_TRUE(reassembler.push(bytes.data() + split, bytes.size() - split, error));

        ASSERT_EQ(rec.headers.size(), 1u) << "split " << split;
        EXPECT_EQ(rec.body, "0123456789") << "split " << split;
    }
}

TEST(ReceiveReassemblerTest, BytesBeyondDeclaredSizeAreStillForwarded) {
    Recorder rec;
    auto reassembler = rec.make();
    auto bytes = wire("x", "abc");
    bytes.push_back('!');
    std::string error;

    ASSERT_TRUE(reassembler.push(bytes.data(), bytes.size(), error));
    EXPECT_EQ(rec.body, "abc!");
    EXPECT_EQ(rec.headers[0].fileSize, 3u);
}

TEST(ReceiveReassemblerTest, FinishBeforeHeaderIsAnError) {
    Recorder rec;
    auto reassembler = rec.make();
    const uint8_t partial[5] = {1, 0, 0, 0, 0};
    std::string error;

    ASSERT_TRUE(reassembler.push(partial, sizeof(partial), error));
    EXPECT_EQ(reassembler.bufferedBytes(), 5u);
    EXPECT_FALSE(reassembler.finish(error));
    EXPECT_EQ(error, "Connection closed before header received (5 bytes buffered)");
    EXPECT_TRUE(rec.headers.empty());
}

TEST(ReceiveReassemblerTest, HandlerFailurePropagates) {
    Recorder rec;
    rec.rejectHeader = true;
    auto reassembler = rec.make();
    const auto bytes = wire("x", "abc");
    std::string error;

    EXPECT_FALSE(reassembler.push(bytes.data(), bytes.size(), error));
    EXPECT_EQ(error, "header rejected");
    EXPECT_TRUE(rec.body.empty());
}

TEST(ReceiveReassemblerTest, EmptyPushIsNoOp) {
    Recorder rec;
    auto reassembler = rec.make();
    std::string error;

    EXPECT_TRUE(reassembler.push(nullptr, 0, error));
    EXPECT_EQ(reassembler.state(), ReassemblyState::AWAITING_HEADER);
    EXPECT_EQ(reassemblyStateToString(reassembler.state()), "AwaitingHeader");
}
