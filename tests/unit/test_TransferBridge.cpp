#include <gtest/gtest.h>
#include "bridge/TransferBridge.hpp"
#include "fakes/FakeSession.hpp"
#include "util/errors.hpp"

#include <nlohmann/json.hpp>

using namespace fb;
using namespace fb::bridge;
using namespace fb::bridge::model;
using namespace fb::test;
using fb::remote::RemoteEntry;

namespace {

// <meta charset="Shift_JIS"> page with テスト 日本語 in the body
std::vector<uint8_t> shiftJisPage() {
    auto page = bytesOf(R"(<html><head><meta charset="Shift_JIS"><title>)");
    const std::vector<uint8_t> tesuto = {0x83, 0x65, 0x83, 0x58, 0x83, 0x67};
    const std::vector<uint8_t> nihongo = {0x93, 0xFA, 0x96, 0x7B, 0x8C, 0xEA};
    page.insert(page.end(), tesuto.begin(), tesuto.end());
    const auto mid = bytesOf("</title></head><body><p>");
    page.insert(page.end(), mid.begin(), mid.end());
    page.insert(page.end(), nihongo.begin(), nihongo.end());
    const auto tail = bytesOf("</p></body></html>\n");
    page.insert(page.end(), tail.begin(), tail.end());
    return page;
}

const std::string TESUTO_UTF8 = "\xE3\x83\x86\xE3\x82\xB9\xE3\x83\x88";
const std::string NIHONGO_UTF8 = "\xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E";

}

class TransferBridgeTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();
    config::RemoteConfig cfg;
    std::unique_ptr<TransferBridge> bridge;

    void SetUp() override {
        cfg.host = "ftp.example.com";
        cfg.base_path = "/public_html";
        cfg.block_size = 16;
        bridge = std::make_unique<TransferBridge>(cfg, std::make_shared<FakeConnector>(remote));
    }

    void expectSessionsBalanced(const int expected) const {
        EXPECT_EQ(remote->connects, expected);
        EXPECT_EQ(remote->closes, expected);
    }
};

TEST_F(TransferBridgeTest, ListMapsEntries) {
    remote->dirs["/public_html/site/"] = {
        {".", "cdir", 0, "20240101000000"},
        {"..", "pdir", 0, "20240101000000"},
        {"index.html", "file", 2048, "20240315123000"},
        {"images", "dir", 0, "20240316080000"},
        {"blob", "file", 7, "20240316080001"},
        {"", "file", 1, ""},
    };

    const auto entries = bridge->list("site/");
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].name, "index.html");
    EXPECT_EQ(entries[0].path, "site/index.html");
    EXPECT_EQ(entries[0].kind, EntryKind::File);
    EXPECT_EQ(entries[0].size, 2048u);
    EXPECT_EQ(entries[0].modified, "20240315123000");
    EXPECT_EQ(entries[0].mime_type, "text/html");

    EXPECT_EQ(entries[1].kind, EntryKind::Directory);
    EXPECT_EQ(entries[1].path, "site/images");

    EXPECT_EQ(entries[2].mime_type, "");
    expectSessionsBalanced(1);
}

TEST_F(TransferBridgeTest, ListJsonShape) {
    remote->dirs["/public_html/"] = {{"a.png", "file", 10, "20240101000000"}};
    const nlohmann::json j = bridge->list("");
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["name"], "a.png");
    EXPECT_EQ(j[0]["path"], "/a.png");
    EXPECT_EQ(j[0]["type"], "file");
    EXPECT_EQ(j[0]["size"], 10);
    EXPECT_EQ(j[0]["modified"], "20240101000000");
    EXPECT_EQ(j[0]["mimeType"], "image/png");
}

TEST_F(TransferBridgeTest, ListEmptyDirectory) {
    remote->dirs["/public_html/empty"] = {};
    EXPECT_TRUE(bridge->list("empty").empty());
    expectSessionsBalanced(1);
}

TEST_F(TransferBridgeTest, TraversalRejectedBeforeAnySession) {
    EXPECT_THROW((void)bridge->list("/../../etc/passwd"), InvalidPath);
    EXPECT_THROW((void)bridge->read("/../../etc/passwd"), InvalidPath);
    EXPECT_THROW((void)bridge->write("../x.html", "x"), InvalidPath);
    EXPECT_THROW((void)bridge->uploadBinary("..", "x.png", {1, 2}), InvalidPath);
    EXPECT_THROW((void)bridge->uploadBinary("img", "../../x.png", {1, 2}), InvalidPath);
    expectSessionsBalanced(0);
}

TEST_F(TransferBridgeTest, ReadShiftJisPageAndWriteItBack) {
    const auto original = shiftJisPage();
    remote->files["/public_html/index.html"] = original;

    const auto read = bridge->read("index.html");
    EXPECT_EQ(read.detected_encoding, "cp932");
    EXPECT_EQ(read.mime_type, "text/html");
    EXPECT_NE(read.content.find(TESUTO_UTF8), std::string::npos);
    EXPECT_NE(read.content.find(NIHONGO_UTF8), std::string::npos);

    (void)bridge->write("index.html", read.content, read.detected_encoding);
    EXPECT_EQ(remote->files["/public_html/index.html"], original);
    expectSessionsBalanced(2);
}

TEST_F(TransferBridgeTest, ReadStreamsInConfiguredBlocks) {
    remote->files["/public_html/a.txt"] = bytesOf(std::string(100, 'x'));
    const auto read = bridge->read("a.txt");
    EXPECT_EQ(read.content, std::string(100, 'x'));
    ASSERT_EQ(remote->blockSizes.size(), 1u);
    EXPECT_EQ(remote->blockSizes[0], 16u);
}

TEST_F(TransferBridgeTest, ReadBinaryAsBase64) {
    const std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0xFF};
    remote->files["/public_html/img/logo.png"] = png;

    const auto read = bridge->read("img/logo.png");
    EXPECT_EQ(read.detected_encoding, "binary");
    EXPECT_EQ(read.mime_type, "image/png");
    EXPECT_EQ(read.content, "iVBORw0KGgoA/w==");

    const nlohmann::json j = read;
    EXPECT_EQ(j["detectedEncoding"], "binary");
    EXPECT_EQ(j["mimeType"], "image/png");
}

TEST_F(TransferBridgeTest, ReadUnknownExtensionIsOctetStream) {
    remote->files["/public_html/data.bin"] = {1, 2, 3};
    EXPECT_EQ(bridge->read("data.bin").mime_type, "application/octet-stream");
}

TEST_F(TransferBridgeTest, ReadFaultMidStreamIsTransferError) {
    remote->files["/public_html/big.txt"] = bytesOf(std::string(64, 'y'));
    remote->failMidDownload = true;
    EXPECT_THROW((void)bridge->read("big.txt"), TransferError);
    expectSessionsBalanced(1);
}

TEST_F(TransferBridgeTest, ReadMissingFileCarriesCause) {
    try {
        (void)bridge->read("missing.txt");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_NE(std::string(e.what()).find("550"), std::string::npos);
    }
    expectSessionsBalanced(1);
}

TEST_F(TransferBridgeTest, WriteDefaultsToUtf8) {
    const std::string text = "<p>" + NIHONGO_UTF8 + "</p>";
    const nlohmann::json j = bridge->write("a.html", text);
    EXPECT_EQ(j, nlohmann::json({{"status", "ok"}}));
    EXPECT_EQ(remote->files["/public_html/a.html"], bytesOf(text));
}

TEST_F(TransferBridgeTest, WriteCanonicalizesEncodingName) {
    (void)bridge->write("a.html", NIHONGO_UTF8, "Shift_JIS");
    EXPECT_EQ(remote->files["/public_html/a.html"],
              (std::vector<uint8_t>{0x93, 0xFA, 0x96, 0x7B, 0x8C, 0xEA}));
}

TEST_F(TransferBridgeTest, UnrepresentableWriteUploadsNothing) {
    try {
        (void)bridge->write("a.html", "smile \xF0\x9F\x98\x80", "cp932");
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.encoding(), "cp932");
        EXPECT_NE(std::string(e.what()).find("UTF-8"), std::string::npos);
    }
    EXPECT_TRUE(remote->uploadedPaths.empty());
    expectSessionsBalanced(0);
}

TEST_F(TransferBridgeTest, UnknownWriteEncodingIsEncodeError) {
    EXPECT_THROW((void)bridge->write("a.html", "x", "klingon-8"), EncodeError);
    expectSessionsBalanced(0);
}

TEST_F(TransferBridgeTest, UploadFaultIsTransferError) {
    remote->failUpload = true;
    EXPECT_THROW((void)bridge->write("a.html", "x"), TransferError);
    expectSessionsBalanced(1);
}

TEST_F(TransferBridgeTest, LoginAndConnectFaultsAreTransferErrors) {
    remote->failLogin = true;
    EXPECT_THROW((void)bridge->list(""), TransferError);
    expectSessionsBalanced(1);

    remote->failConnect = true;
    EXPECT_THROW((void)bridge->list(""), TransferError);
    expectSessionsBalanced(1);
}

TEST_F(TransferBridgeTest, CloseFailureDoesNotMaskResult) {
    remote->dirs["/public_html/"] = {};
    remote->failClose = true;
    EXPECT_NO_THROW((void)bridge->list(""));

    remote->failList = true;
    EXPECT_THROW((void)bridge->list(""), TransferError);
    expectSessionsBalanced(2);
}

TEST_F(TransferBridgeTest, NonStandardCloseFailureIsContained) {
    remote->dirs["/public_html/"] = {};
    remote->failCloseWithNonStandardError = true;
    EXPECT_NO_THROW((void)bridge->list(""));

    remote->failList = true;
    EXPECT_THROW((void)bridge->list(""), TransferError);
    expectSessionsBalanced(2);
}

TEST_F(TransferBridgeTest, UploadBinaryStoresBytesUnmodified) {
    const std::vector<uint8_t> jpg = {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10};
    const auto result = bridge->uploadBinary("images", "photo.jpg", jpg);
    EXPECT_EQ(result.url, "images/photo.jpg");
    EXPECT_EQ(remote->files["/public_html/images/photo.jpg"], jpg);

    const nlohmann::json j = result;
    EXPECT_EQ(j, nlohmann::json({{"url", "images/photo.jpg"}}));
    expectSessionsBalanced(1);
}

TEST(HealthTest, ReportsVersion) {
    const nlohmann::json j = health();
    EXPECT_EQ(j, nlohmann::json({{"status", "ok"}, {"version", "1.2.0"}}));
}
