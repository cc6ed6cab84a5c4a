#include <catch2/catch.hpp>

#include "archivedir/destination.hpp"
#include "archivedir/errors.hpp"

using namespace archivedir;
using destination::Kind;

TEST_CASE("local paths stay local") {
    auto dest = destination::Parse("/mnt/backup/photos");
    REQUIRE(dest.kind == Kind::Local);
    REQUIRE_FALSE(dest.IsRemote());
    REQUIRE(dest.path == "/mnt/backup/photos");
    REQUIRE(dest.Provider() == "local");
    REQUIRE(destination::Parse("relative/dir").path == "relative/dir");
}

TEST_CASE("s3 specifiers split bucket and prefix") {
    auto dest = destination::Parse("s3://my-bucket/backups//2024/");
    REQUIRE(dest.kind == Kind::S3);
    REQUIRE(dest.bucket == "my-bucket");
    REQUIRE(dest.path == "backups/2024");
    REQUIRE(dest.ToString() == "s3://my-bucket/backups/2024");

    auto bare = destination::Parse("s3://my-bucket");
    REQUIRE(bare.bucket == "my-bucket");
    REQUIRE(bare.path.empty());
    REQUIRE_THROWS_AS(destination::Parse("s3://"), ConfigError);
}

TEST_CASE("drive folder path and folder id forms") {
    auto by_path = destination::Parse("gdrive://Backups/laptop");
    REQUIRE(by_path.kind == Kind::DriveFolderPath);
    REQUIRE(by_path.path == "Backups/laptop");

    auto gs = destination::Parse("gs://Backups");
    REQUIRE(gs.kind == Kind::DriveFolderPath);
    REQUIRE(gs.Provider() == "gdrive");

    auto by_id = destination::Parse("gdrive://id:1AbC_xyz/sub");
    REQUIRE(by_id.kind == Kind::DriveFolderId);
    REQUIRE(by_id.folder_id == "1AbC_xyz");
    REQUIRE(by_id.path == "sub");
    REQUIRE(by_id.ToString() == "gdrive://id:1AbC_xyz/sub");

    auto url = destination::Parse("https://drive.google.com/drive/folders/1AbC_xyz?usp=sharing");
    REQUIRE(url.kind == Kind::DriveFolderId);
    REQUIRE(url.folder_id == "1AbC_xyz");
    REQUIRE(url.path.empty());

    REQUIRE_THROWS_AS(destination::Parse("gdrive://"), ConfigError);
    REQUIRE_THROWS_AS(destination::Parse("gdrive://id:"), ConfigError);
}

TEST_CASE("onedrive and unknown schemes") {
    auto dest = destination::Parse("onedrive://Documents/Backups");
    REQUIRE(dest.kind == Kind::OneDrive);
    REQUIRE(dest.path == "Documents/Backups");
    REQUIRE(dest.Provider() == "onedrive");

    REQUIRE_THROWS_AS(destination::Parse("ftp://host/dir"), ConfigError);
    REQUIRE_THROWS_AS(destination::Parse(""), ConfigError);
}

TEST_CASE("child destinations go one folder deeper") {
    REQUIRE(destination::Parse("s3://bucket").Child("1700000000").ToString() == "s3://bucket/1700000000");
    REQUIRE(destination::Parse("onedrive://a/b").Child("c").path == "a/b/c");
    REQUIRE(destination::Parse("/tmp/out").Child("run").path == "/tmp/out/run");
}
