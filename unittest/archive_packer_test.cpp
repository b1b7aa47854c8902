#include <gtest/gtest.h>
#include "archive_packer.hpp"
#include "fake_remote_session.hpp"

class ArchivePackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        PackerOptions options;
        options.timestamp = [] { return std::string("20250102_030405"); };
        packer_ = std::make_unique<ArchivePacker>(logger_, options);
    }

    TransferLogger logger_{"", LogLevel::Error, false};
    std::unique_ptr<ArchivePacker> packer_;
    FakeRemoteSession session_{"src.example.com"};
};

// Test archive naming and placement
TEST_F(ArchivePackerTest, PlanNamesArchiveInStagingDirectory) {
    auto planned = packer_->plan("/home/u", "mail/example.com/info");
    ASSERT_TRUE(planned.has_value());
    EXPECT_EQ(planned->fileName, "info_20250102_030405.tar.gz");
    EXPECT_EQ(planned->remotePath, "/home/u/tmp_trans/info_20250102_030405.tar.gz");
    EXPECT_EQ(planned->sourceBasePath, "/home/u/mail/example.com");
    EXPECT_EQ(planned->containedRelativeRoot, "info");
    EXPECT_TRUE(planned->fileListPath.empty());
}

TEST_F(ArchivePackerTest, PlanRejectsPathWithoutLeaf) {
    auto planned = packer_->plan("/home/u", "site/..");
    ASSERT_FALSE(planned.has_value());
    EXPECT_EQ(planned.error().kind, TransferErrorKind::PackError);
}

// Test the commands a successful pack sends
TEST_F(ArchivePackerTest, PackRunsTarAndStat) {
    session_.on("stat -c", "2048\n");

    auto archive = packer_->pack(session_, "/home/u", "public_html");
    ASSERT_TRUE(archive.has_value());
    ASSERT_TRUE(archive->byteSize.has_value());
    EXPECT_EQ(*archive->byteSize, 2048u);

    const auto& commands = session_.commands();
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0], "mkdir -p /home/u/tmp_trans");
    EXPECT_EQ(commands[1], "cd /home/u && tar czf /home/u/tmp_trans/public_html_20250102_030405.tar.gz "
                           "--exclude-backups --warning=no-file-changed -- public_html");
    EXPECT_EQ(commands[2], "stat -c %s /home/u/tmp_trans/public_html_20250102_030405.tar.gz");
}

// Test that a tar failure lists the parent directory and fails
TEST_F(ArchivePackerTest, TarFailureListsParent) {
    session_.on("tar czf", "", 2, "tar: public_html: Cannot stat: No such file or directory\n");

    auto archive = packer_->pack(session_, "/home/u", "public_html");
    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().kind, TransferErrorKind::PackError);
    EXPECT_NE(archive.error().message.find("exit code 2: tar: public_html: Cannot stat"), std::string::npos);
    EXPECT_TRUE(session_.ran("ls -la /home/u"));
    EXPECT_FALSE(session_.ran("stat -c"));
}

TEST_F(ArchivePackerTest, MissingArtifactIsPackError) {
    session_.on("stat -c", "", 1);
    auto archive = packer_->pack(session_, "/home/u", "public_html");
    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().message,
              "Archive was not created: src.example.com:/home/u/tmp_trans/public_html_20250102_030405.tar.gz");
}

TEST_F(ArchivePackerTest, StagingFailureStopsPack) {
    session_.on("mkdir -p", "", 1, "Permission denied");
    auto archive = packer_->pack(session_, "/home/u", "public_html");
    ASSERT_FALSE(archive.has_value());
    EXPECT_FALSE(session_.ran("tar czf"));
}

// Test file list archives built from explicit members
TEST_F(ArchivePackerTest, PackFileListWritesListAndArchives) {
    session_.on("stat -c", "512");
    auto planned = packer_->planFileList("/home/u", "public_html", "recovery");
    EXPECT_EQ(planned.fileName, "public_html_recovery_20250102_030405.tar.gz");
    EXPECT_EQ(planned.fileListPath, "/home/u/tmp_trans/public_html_recovery_20250102_030405.list");
    EXPECT_EQ(planned.sourceBasePath, "/home/u/public_html");

    MissingFileSet files{"a.txt", "img/b c.png"};
    auto archive = packer_->packFileList(session_, planned, files);
    ASSERT_TRUE(archive.has_value());

    EXPECT_TRUE(session_.ran(": > /home/u/tmp_trans/public_html_recovery_20250102_030405.list"));
    EXPECT_TRUE(session_.ran("printf '%s\\0' a.txt 'img/b c.png' >> "
                             "/home/u/tmp_trans/public_html_recovery_20250102_030405.list"));
    EXPECT_TRUE(session_.ran("cd /home/u/public_html && tar czf "
                             "/home/u/tmp_trans/public_html_recovery_20250102_030405.tar.gz --null -T "
                             "/home/u/tmp_trans/public_html_recovery_20250102_030405.list"));
}

TEST_F(ArchivePackerTest, PackFileListChunksLongLists) {
    MissingFileSet files;
    for (int i = 0; i < 450; ++i) {
        files.insert("file_" + std::to_string(i));
    }
    auto planned = packer_->planFileList("/home/u", "public_html", "recovery");
    ASSERT_TRUE(packer_->packFileList(session_, planned, files).has_value());
    EXPECT_EQ(session_.count("printf"), 3);
}

TEST_F(ArchivePackerTest, PackFileListRejectsEmptySet) {
    auto planned = packer_->planFileList("/home/u", "public_html", "recovery");
    auto archive = packer_->packFileList(session_, planned, {});
    ASSERT_FALSE(archive.has_value());
    EXPECT_EQ(archive.error().message, "No files to archive");
    EXPECT_TRUE(session_.commands().empty());
}
