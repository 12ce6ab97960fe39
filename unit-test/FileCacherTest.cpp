#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "storage/file_cacher.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace std::filesystem;
using namespace mjudge;

class FileCacherTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        setup_test_environment();
    }

    void SetUp() override {
        dir = fresh_temp_dir();
    }

    path dir;
};

TEST_F(FileCacherTest, DigestIsSha1OfContentTest) {
    EXPECT_EQ(sha1_digest("abc"), "a9993e364706816aba3e25717850c26c9cd0d89d");
    EXPECT_EQ(sha1_digest(""), "da39a3ee5e6b4b0d3255bfef95601890afd80709");

    string long_digest = sha1_digest(string(1 << 20, 'a'));
    EXPECT_EQ(long_digest.size(), 40u);
    EXPECT_EQ(long_digest.find_first_not_of("0123456789abcdef"), string::npos);
}

TEST_F(FileCacherTest, PutAndGetContentTest) {
    local_file_cacher cacher(dir / "storage");
    string digest = cacher.put_file_content("hello\n", "greeting");
    EXPECT_EQ(digest, sha1_digest("hello\n"));
    EXPECT_TRUE(cacher.exists(digest));
    EXPECT_EQ(cacher.get_file_content(digest), "hello\n");

    // 相同内容只存储一份
    EXPECT_EQ(cacher.put_file_content("hello\n", "again"), digest);
    EXPECT_EQ(count_entries(dir / "storage"), 1);
}

TEST_F(FileCacherTest, PutFromPathAndGetToPathTest) {
    local_file_cacher cacher(dir / "storage");
    write_file_content(dir / "source.txt", "42 43\n");
    string digest = cacher.put_file_from_path(dir / "source.txt", "source");

    cacher.get_file_to_path(digest, dir / "copy.txt");
    EXPECT_EQ(read_file_content(dir / "copy.txt"), "42 43\n");
}

TEST_F(FileCacherTest, MissingFileTest) {
    local_file_cacher cacher(dir / "storage");
    EXPECT_FALSE(cacher.exists(sha1_digest("nothing")));
    EXPECT_THROW(cacher.get_file_content(sha1_digest("nothing")), storage_error);
    EXPECT_THROW(cacher.get_file_to_path(sha1_digest("nothing"), dir / "x"), storage_error);
    EXPECT_THROW(cacher.put_file_from_path(dir / "not-exist", "missing"), storage_error);
}

TEST_F(FileCacherTest, MalformedDigestTest) {
    local_file_cacher cacher(dir / "storage");
    EXPECT_THROW(cacher.get_file_content("../../etc/passwd"), storage_error);
    EXPECT_THROW(cacher.exists(""), storage_error);
}
