#include "webxfer/file_entry.hpp"
#include "webxfer/mime.hpp"
#include "webxfer/shell_commands.hpp"
#include <gtest/gtest.h>

#include <ctime>
#include <string>

using namespace webxfer;

namespace {

// 2024-06-15T12:00:00Z
constexpr std::time_t NOW = 1718452800;

const char *LISTING =
    "total 16\n"
    "drwxr-xr-x  4 alice staff  4096 Jun 14 08:00 .\n"
    "drwxr-xr-x 12 root  root   4096 Jan  2  2023 ..\n"
    "-rw-r--r--  1 alice staff  1234 Jan 10 09:30 my file.txt\n"
    "drwx------  2 alice staff  4096 Dec 24 18:00 .ssh\n"
    "lrwxrwxrwx  1 alice staff     7 Mar  3  2021 bin -> usr/bin\n"
    "crw-rw-rw-  1 root  root   1, 3 Mar  3  2021 null\n";

}

TEST(ShellEscapeTest, QuotesAndEscapesSingleQuotes) {
    EXPECT_EQ(escape_shell_path("/tmp/a b"), "'/tmp/a b'");
    EXPECT_EQ(escape_shell_path("it's"), "'it'\\''s'");
    EXPECT_EQ(escape_shell_path("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(ShellCommandTest, DashPathsAreNotTakenAsOptions) {
    EXPECT_EQ(build_remove_file_command("-rf"), "rm -f -- '-rf'");
    EXPECT_EQ(build_remove_dir_command("--help", false), "rmdir -- '--help'");
    EXPECT_EQ(build_list_command("-R", false), "ls -la -- '-R'");
    EXPECT_EQ(build_stat_command("-x"), "ls -lad -- '-x'");
    EXPECT_EQ(build_mkdir_command("-p", 0700), "mkdir -m 700 -- '-p'");
    EXPECT_EQ(build_read_command("-n"), "cat -- '-n'");
}

TEST(ShellCommandTest, BuildsExpectedCommands) {
    EXPECT_EQ(build_list_command("/srv", false), "ls -la -- '/srv'");
    EXPECT_EQ(build_list_command("/srv", true), "ls -laA -- '/srv'");
    EXPECT_EQ(build_stat_command("/srv/x"), "ls -lad -- '/srv/x'");
    EXPECT_EQ(build_mkdir_command("/srv/new", 0755), "mkdir -m 755 -- '/srv/new'");
    EXPECT_EQ(build_remove_file_command("/srv/x"), "rm -f -- '/srv/x'");
    EXPECT_EQ(build_remove_dir_command("/srv/d", false), "rmdir -- '/srv/d'");
    EXPECT_EQ(build_remove_dir_command("/srv/d", true), "rm -rf -- '/srv/d'");
    EXPECT_EQ(build_read_command("/srv/x"), "cat -- '/srv/x'");
    EXPECT_EQ(build_write_command("/srv/x", true), "cat > '/srv/x'");
    EXPECT_EQ(build_write_command("/srv/x", false), "set -C; cat > '/srv/x'");
    EXPECT_EQ(resolve_home_path("/home/alice\n"), "/home/alice");
}

TEST(LsParsingTest, PermissionStringToOctal) {
    EXPECT_EQ(parse_permission_string("-rwxr-xr-x"), 0755u);
    EXPECT_EQ(parse_permission_string("-rw-r-----"), 0640u);
    EXPECT_EQ(parse_permission_string("d---------"), 0u);
}

TEST(LsParsingTest, DatesResolveToMostRecentPastYear) {
    EXPECT_EQ(parse_ls_date("Jan", "10", "09:30", NOW), "2024-01-10T09:30:00.000Z");
    EXPECT_EQ(parse_ls_date("Dec", "24", "18:00", NOW), "2023-12-24T18:00:00.000Z");
    EXPECT_EQ(parse_ls_date("Mar", "3", "2021", NOW), "2021-03-03T00:00:00.000Z");
    EXPECT_EQ(parse_ls_date("Foo", "3", "2021", NOW), "1970-01-01T00:00:00.000Z");
}

TEST(LsParsingTest, DirectoryListingSkipsTotalAndDotEntries) {
    auto entries = parse_directory_listing(LISTING, "/home/alice", NOW);
    ASSERT_EQ(entries.size(), 4u);

    const FileEntry &file = entries[0];
    EXPECT_EQ(file.name, "my file.txt");
    EXPECT_EQ(file.path, "/home/alice/my file.txt");
    EXPECT_EQ(file.type, EntryType::File);
    EXPECT_EQ(file.size, 1234u);
    EXPECT_EQ(file.permissions, "rw-r--r--");
    EXPECT_EQ(file.permissions_octal, 0644u);
    EXPECT_EQ(file.owner, "alice");
    EXPECT_EQ(file.group, "staff");
    EXPECT_EQ(file.modified_at, "2024-01-10T09:30:00.000Z");
    EXPECT_FALSE(file.is_hidden);

    EXPECT_EQ(entries[1].name, ".ssh");
    EXPECT_EQ(entries[1].type, EntryType::Directory);
    EXPECT_TRUE(entries[1].is_hidden);

    EXPECT_EQ(entries[2].name, "bin");
    EXPECT_EQ(entries[2].type, EntryType::Symlink);

    EXPECT_EQ(entries[3].type, EntryType::Other);
}

TEST(LsParsingTest, StatEntryUsesRequestedPath) {
    auto entry = parse_stat_entry("-rw-------  1 alice staff  42 Jun  1 10:00 /home/alice/.env\n", "/home/alice/.env", NOW);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, ".env");
    EXPECT_EQ(entry->path, "/home/alice/.env");
    EXPECT_EQ(entry->size, 42u);
    EXPECT_TRUE(entry->is_hidden);

    EXPECT_FALSE(parse_stat_entry("ls: cannot access '/nope': No such file or directory\n", "/nope", NOW).has_value());
}

TEST(FileEntryTest, AttributesMapToUniformShape) {
    RemoteAttributes attrs;
    attrs.size = 10;
    attrs.mode = 0100640;
    attrs.uid = 1000;
    attrs.gid = 100;
    attrs.mtime = 0;
    attrs.atime = 86400;

    FileEntry entry = entry_from_attributes("notes.md", "/home/alice/notes.md", attrs);
    EXPECT_EQ(entry.type, EntryType::File);
    EXPECT_EQ(entry.permissions, "rw-r-----");
    EXPECT_EQ(entry.permissions_octal, 0640u);
    EXPECT_EQ(entry.owner, "1000");
    EXPECT_EQ(entry.modified_at, "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(entry.accessed_at, "1970-01-02T00:00:00.000Z");
    EXPECT_EQ(entry_type_from_mode(0040755), EntryType::Directory);
    EXPECT_EQ(entry_type_from_mode(0120777), EntryType::Symlink);
    EXPECT_EQ(join_remote("/", "etc"), "/etc");
}

TEST(MimeTypeTest, LooksUpByLowercasedExtension) {
    EXPECT_EQ(mime_type_for("photo.JPG"), "image/jpeg");
    EXPECT_EQ(mime_type_for("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(mime_type_for("README"), DEFAULT_MIME_TYPE);
    EXPECT_EQ(mime_type_for("data.unknownext"), DEFAULT_MIME_TYPE);
}
