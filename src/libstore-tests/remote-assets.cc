#include "charx/store/remote-assets.hh"
#include "charx/store/tests/file-transfer.hh"
#include "charx/util/hash.hh"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

namespace charx {

using ::testing::_;
using ::testing::Field;
using ::testing::Return;
using ::testing::Throw;

TEST(remoteAssetUrl, hashesTheArchiveHashAgain)
{
    auto h = sha256Base16("archive");
    ASSERT_EQ(remoteAssetUrl("https://hub.example", h), "https://hub.example/rs/assets/" + sha256Base16(h) + ".png");
}

static const std::string archiveBytes = "bytes";

TEST(checkRemoteAssets, hitOnSuccessfulResponse)
{
    testing::MockFileTransfer ft;
    auto expectedUrl = remoteAssetUrl("https://hub", sha256Base16("bytes"));

    FileTransferResult ok;
    ok.status = 200;
    EXPECT_CALL(ft, transfer(Field(&FileTransferRequest::uri, expectedUrl))).WillOnce(Return(ok));

    StringSource source(archiveBytes);
    auto res = checkRemoteAssets(ft, "https://hub", source);
    ASSERT_TRUE(res.exists);
    ASSERT_EQ(res.hash, sha256Base16("bytes"));
}

TEST(checkRemoteAssets, notFoundIsAMiss)
{
    testing::MockFileTransfer ft;
    EXPECT_CALL(ft, transfer(_))
        .WillOnce(Throw(FileTransferError(FileTransfer::NotFound, 404, "HTTP error 404")));

    StringSource source(archiveBytes);
    auto res = checkRemoteAssets(ft, "https://hub", source);
    ASSERT_FALSE(res.exists);
    ASSERT_EQ(res.hash, sha256Base16("bytes"));
}

TEST(checkRemoteAssets, transferFailureIsAMiss)
{
    testing::MockFileTransfer ft;
    EXPECT_CALL(ft, transfer(_))
        .WillOnce(Throw(FileTransferError(FileTransfer::Transient, 0, "connection refused")));

    StringSource source(archiveBytes);
    ASSERT_FALSE(checkRemoteAssets(ft, "https://hub", source).exists);
}

TEST(checkRemoteAssets, otherErrorsPropagate)
{
    testing::MockFileTransfer ft;
    EXPECT_CALL(ft, transfer(_)).WillOnce(Throw(Error("unexpected failure")));

    StringSource source(archiveBytes);
    ASSERT_THROW(checkRemoteAssets(ft, "https://hub", source), Error);
}

TEST(checkRemoteAssets, hashesTheWholeSourceInChunks)
{
    std::string large(1 << 20, 'z');
    large += "tail";

    testing::MockFileTransfer ft;
    FileTransferResult ok;
    ok.status = 200;
    EXPECT_CALL(ft, transfer(Field(&FileTransferRequest::uri, remoteAssetUrl("https://hub", sha256Base16(large)))))
        .WillOnce(Return(ok));

    StringSource source(large);
    auto res = checkRemoteAssets(ft, "https://hub", source);
    ASSERT_EQ(res.hash, sha256Base16(large));
    ASSERT_EQ(source.pos, large.size());
}

} // namespace charx
