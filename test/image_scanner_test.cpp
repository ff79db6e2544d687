#include "ImageScanner.hpp"
#include "test_utils.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class ImageScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir_.isValid());
        root_ = QDir(temp_dir_.path()).canonicalPath();
    }

    QString path(const QString& relative) const {
        return QDir(root_).filePath(relative);
    }

    QTemporaryDir temp_dir_;
    QString root_;
};

TEST_F(ImageScannerTest, FlatScanIgnoresSubfolders)
{
    ASSERT_TRUE(write_file(path("a.png")));
    ASSERT_TRUE(write_file(path("sub/b.jpg")));
    ASSERT_TRUE(write_file(path("sub/ignore.txt")));

    const ScanResult result = ImageScanner::scan(root_, false);
    ASSERT_TRUE(result.success());
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].filename, "a.png");
    EXPECT_EQ(result.records[0].relative_path, "");
    EXPECT_EQ(result.records[0].full_path, path("a.png"));
}

TEST_F(ImageScannerTest, RecursiveScanRecordsRelativePaths)
{
    ASSERT_TRUE(write_file(path("a.png")));
    ASSERT_TRUE(write_file(path("sub/b.jpg")));
    ASSERT_TRUE(write_file(path("sub/ignore.txt")));
    ASSERT_TRUE(write_file(path("sub/deeper/c.webp")));

    const ScanResult result = ImageScanner::scan(root_, true);
    ASSERT_TRUE(result.success());
    ASSERT_EQ(result.records.size(), 3u);

    EXPECT_EQ(result.records[0].filename, "a.png");
    EXPECT_EQ(result.records[0].relative_path, "");

    EXPECT_EQ(result.records[1].filename, "b.jpg");
    EXPECT_EQ(result.records[1].relative_path, "sub");
    EXPECT_EQ(result.records[1].display_path(), "sub/b.jpg");

    EXPECT_EQ(result.records[2].filename, "c.webp");
    EXPECT_EQ(result.records[2].relative_path, "sub/deeper");
    EXPECT_EQ(result.records[2].full_path, path("sub/deeper/c.webp"));
}

TEST_F(ImageScannerTest, ResultsAreSortedAndRepeatable)
{
    ASSERT_TRUE(write_file(path("zeta.png")));
    ASSERT_TRUE(write_file(path("alpha.JPG")));
    ASSERT_TRUE(write_file(path("m/mid.bmp")));
    ASSERT_TRUE(write_file(path("beta.jpeg")));

    const ScanResult first = ImageScanner::scan(root_, true);
    const ScanResult second = ImageScanner::scan(root_, true);
    ASSERT_EQ(first.records.size(), 4u);
    EXPECT_EQ(first.records, second.records);

    for (size_t i = 1; i < first.records.size(); ++i) {
        EXPECT_LT(first.records[i - 1].full_path, first.records[i].full_path);
    }
}

TEST_F(ImageScannerTest, MissingRootIsAnError)
{
    const ScanResult result = ImageScanner::scan(path("nope"), false);
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.records.empty());
    EXPECT_TRUE(result.error.contains("not found"));

    EXPECT_FALSE(ImageScanner::scan(QString(), true).success());
}

TEST_F(ImageScannerTest, EmptyFolderIsNotAnError)
{
    const ScanResult result = ImageScanner::scan(root_, true);
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(result.records.empty());
}

TEST_F(ImageScannerTest, RejectsFolderIsNotScanned)
{
    ASSERT_TRUE(write_file(path("a.png")));
    ASSERT_TRUE(write_file(path("_REJECTS/old.png")));
    ASSERT_TRUE(write_file(path("sub/_REJECTS/nested.png")));

    const ScanResult result = ImageScanner::scan(root_, true);
    ASSERT_EQ(result.records.size(), 2u);
    EXPECT_EQ(result.records[0].filename, "a.png");
    // Only the top-level reject folder is special
    EXPECT_EQ(result.records[1].relative_path, "sub/_REJECTS");
}

TEST_F(ImageScannerTest, LinkedDirectoriesAreNotFollowed)
{
    QTemporaryDir outside;
    ASSERT_TRUE(outside.isValid());
    ASSERT_TRUE(write_file(QDir(outside.path()).filePath("elsewhere.png")));
    ASSERT_TRUE(write_file(path("real/a.png")));
    ASSERT_TRUE(QFile::link(outside.path(), path("linked")));
    // Loop back to the root
    ASSERT_TRUE(QFile::link(root_, path("real/loop")));

    const ScanResult result = ImageScanner::scan(root_, true);
    ASSERT_TRUE(result.success());
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].display_path(), "real/a.png");
}

TEST_F(ImageScannerTest, UnreadableSubfolderIsSkipped)
{
    ASSERT_TRUE(write_file(path("a.png")));
    ASSERT_TRUE(write_file(path("locked/b.png")));

    const QString locked = path("locked");
    const QFile::Permissions original = QFile::permissions(locked);
    ASSERT_TRUE(QFile::setPermissions(locked, QFile::Permissions()));

    if (QFileInfo(locked).isReadable()) {
        QFile::setPermissions(locked, original);
        GTEST_SKIP() << "Permissions are not enforced for this user";
    }

    const ScanResult result = ImageScanner::scan(root_, true);
    QFile::setPermissions(locked, original);

    ASSERT_TRUE(result.success());
    ASSERT_EQ(result.records.size(), 1u);
    EXPECT_EQ(result.records[0].filename, "a.png");
    ASSERT_EQ(result.skipped_directories.size(), 1);
    EXPECT_EQ(result.skipped_directories[0], locked);
}

TEST_F(ImageScannerTest, RecognizesImageExtensions)
{
    EXPECT_TRUE(ImageScanner::is_supported_image("a.png"));
    EXPECT_TRUE(ImageScanner::is_supported_image("a.JPG"));
    EXPECT_TRUE(ImageScanner::is_supported_image("a.Jpeg"));
    EXPECT_TRUE(ImageScanner::is_supported_image("a.bmp"));
    EXPECT_TRUE(ImageScanner::is_supported_image("a.webp"));
    EXPECT_TRUE(ImageScanner::is_supported_image("archive.tar.png"));

    EXPECT_FALSE(ImageScanner::is_supported_image("a.gif"));
    EXPECT_FALSE(ImageScanner::is_supported_image("a.txt"));
    EXPECT_FALSE(ImageScanner::is_supported_image("png"));
    EXPECT_FALSE(ImageScanner::is_supported_image("a.png.bak"));
}
