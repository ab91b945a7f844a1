#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include "dirmirror/event_classifier.h"
#include "test_util.h"

using namespace dirmirror;
using events::ChangeEvent;

class EventClassifierTest : public test::MirrorTest {
protected:
    EventClassifierTest() : classifier(roots_) {}

    EventClassifier classifier;
};

TEST_F(EventClassifierTest, CreatedRegularFileBecomesCopy) {
    test::write_file(src("a.txt"), "hello");

    auto result = classifier.classify(ChangeEvent::created(src("a.txt")));
    ASSERT_TRUE(std::holds_alternative<action::CopyFile>(result)) << describe(result);
    const auto& copy = std::get<action::CopyFile>(result);
    EXPECT_EQ(copy.destination, out("a.txt"));
    EXPECT_EQ(copy.reason, action::CopyReason::Created);
    EXPECT_EQ(describe(result), "Created[file]: " + src("a.txt"));
}

TEST_F(EventClassifierTest, CreatedDirectoryCarriesPermissions) {
    ASSERT_EQ(::mkdir(src("sub").c_str(), 0750), 0);
    ASSERT_EQ(::chmod(src("sub").c_str(), 0750), 0);

    auto result = classifier.classify(ChangeEvent::created(src("sub")));
    ASSERT_TRUE(std::holds_alternative<action::CreateDir>(result));
    const auto& dir = std::get<action::CreateDir>(result);
    EXPECT_EQ(dir.destination, out("sub"));
    EXPECT_EQ(dir.permissions, 0750u);
}

TEST_F(EventClassifierTest, CreatedSymlinkRemapsInternalTarget) {
    test::write_file(src("real.txt"), "x");
    ASSERT_EQ(::symlink(src("real.txt").c_str(), src("abs").c_str()), 0);
    ASSERT_EQ(::symlink("real.txt", src("rel").c_str()), 0);
    ASSERT_EQ(::symlink("/usr/share", src("ext").c_str()), 0);

    auto abs = classifier.classify(ChangeEvent::created(src("abs")));
    ASSERT_TRUE(std::holds_alternative<action::CreateSymlink>(abs));
    EXPECT_EQ(std::get<action::CreateSymlink>(abs).target, out("real.txt"));
    EXPECT_EQ(std::get<action::CreateSymlink>(abs).destination, out("abs"));

    auto rel = classifier.classify(ChangeEvent::created(src("rel")));
    ASSERT_TRUE(std::holds_alternative<action::CreateSymlink>(rel));
    EXPECT_EQ(std::get<action::CreateSymlink>(rel).target, "real.txt");

    auto ext = classifier.classify(ChangeEvent::created(src("ext")));
    ASSERT_TRUE(std::holds_alternative<action::CreateSymlink>(ext));
    EXPECT_EQ(std::get<action::CreateSymlink>(ext).target, "/usr/share");
    EXPECT_EQ(describe(ext), "Created[symlink]: " + src("ext") + " -> /usr/share");
}

TEST_F(EventClassifierTest, CreatedHardlinkIsUnsupported) {
    test::write_file(src("a.txt"), "x");
    ASSERT_EQ(::link(src("a.txt").c_str(), src("b.txt").c_str()), 0);

    auto result = classifier.classify(ChangeEvent::created(src("b.txt")));
    ASSERT_TRUE(std::holds_alternative<action::Unsupported>(result));
    EXPECT_EQ(std::get<action::Unsupported>(result).reason, "hardlink");
    EXPECT_FALSE(mutates_destination(result));
}

TEST_F(EventClassifierTest, CreatedFifoIsUnsupported) {
    ASSERT_EQ(::mkfifo(src("pipe").c_str(), 0600), 0);

    auto result = classifier.classify(ChangeEvent::created(src("pipe")));
    ASSERT_TRUE(std::holds_alternative<action::Unsupported>(result));
    EXPECT_EQ(std::get<action::Unsupported>(result).reason, "create-other");
}

TEST_F(EventClassifierTest, VanishedCreateIsUnresolved) {
    auto result = classifier.classify(ChangeEvent::created(src("gone")));
    ASSERT_TRUE(std::holds_alternative<action::Unresolved>(result));
    EXPECT_EQ(std::get<action::Unresolved>(result).error.code(), ErrorCode::MetadataReadFailure);
}

TEST_F(EventClassifierTest, DataModifyBecomesCopyWithoutProbing) {
    auto result = classifier.classify(ChangeEvent::dataModified(src("not-there-yet")));
    ASSERT_TRUE(std::holds_alternative<action::CopyFile>(result));
    EXPECT_EQ(std::get<action::CopyFile>(result).reason, action::CopyReason::Modified);
    EXPECT_EQ(describe(result), "Modified[file]: " + src("not-there-yet"));
}

TEST_F(EventClassifierTest, MetadataModifyBecomesSync) {
    auto result = classifier.classify(ChangeEvent::metadataModified(src("a.txt")));
    ASSERT_TRUE(std::holds_alternative<action::SyncMetadata>(result));
    EXPECT_EQ(std::get<action::SyncMetadata>(result).destination, out("a.txt"));
    EXPECT_EQ(describe(result), "Modify[metadata]: " + src("a.txt"));
}

TEST_F(EventClassifierTest, RenameBothRemapsEachEndpoint) {
    auto result = classifier.classify(ChangeEvent::renamed(src("a"), src("dir/b")));
    ASSERT_TRUE(std::holds_alternative<action::RenameEntry>(result));
    const auto& rename = std::get<action::RenameEntry>(result);
    EXPECT_EQ(rename.destination_from, out("a"));
    EXPECT_EQ(rename.destination_to, out("dir/b"));
    EXPECT_EQ(describe(result), "Renamed: " + src("a") + " -> " + src("dir/b"));
}

TEST_F(EventClassifierTest, RenameHalvesAreIgnored) {
    ChangeEvent from;
    from.kind = events::EventKind::Modify;
    from.modify_kind = events::ModifyKind::Name;
    from.rename_mode = events::RenameMode::From;
    from.paths = {src("a")};

    ChangeEvent to = from;
    to.rename_mode = events::RenameMode::To;

    EXPECT_TRUE(std::holds_alternative<action::Ignore>(classifier.classify(from)));
    EXPECT_TRUE(std::holds_alternative<action::Ignore>(classifier.classify(to)));
}

TEST_F(EventClassifierTest, RenameWithSinglePathIsMalformed) {
    ChangeEvent event;
    event.kind = events::EventKind::Modify;
    event.modify_kind = events::ModifyKind::Name;
    event.rename_mode = events::RenameMode::Both;
    event.paths = {src("a")};

    auto result = classifier.classify(event);
    ASSERT_TRUE(std::holds_alternative<action::Unsupported>(result));
    EXPECT_EQ(std::get<action::Unsupported>(result).reason, "malformed");
}

TEST_F(EventClassifierTest, RenameOutOfTreeIsUnresolved) {
    auto result = classifier.classify(ChangeEvent::renamed(src("a"), "/elsewhere/a"));
    ASSERT_TRUE(std::holds_alternative<action::Unresolved>(result));
    EXPECT_EQ(std::get<action::Unresolved>(result).source, "/elsewhere/a");
}

TEST_F(EventClassifierTest, RemoveBecomesRemoveEntry) {
    auto result = classifier.classify(ChangeEvent::removed(src("a.txt")));
    ASSERT_TRUE(std::holds_alternative<action::RemoveEntry>(result));
    EXPECT_EQ(std::get<action::RemoveEntry>(result).destination, out("a.txt"));
    EXPECT_EQ(describe(result), "Deleted: " + src("a.txt"));
}

TEST_F(EventClassifierTest, RemoveOutsideWatchRootIsUnresolved) {
    auto result = classifier.classify(ChangeEvent::removed("/etc/passwd"));
    ASSERT_TRUE(std::holds_alternative<action::Unresolved>(result));
    EXPECT_EQ(std::get<action::Unresolved>(result).error.code(), ErrorCode::PathNotContained);
}

TEST_F(EventClassifierTest, AccessIsIgnored) {
    auto result = classifier.classify(ChangeEvent::accessed(src("a.txt")));
    ASSERT_TRUE(std::holds_alternative<action::Ignore>(result));
    EXPECT_EQ(describe(result), "Ignored: " + src("a.txt"));
}

TEST_F(EventClassifierTest, OtherKindsAreUnsupported) {
    ChangeEvent other;
    other.kind = events::EventKind::Other;
    other.paths = {src("x")};
    auto other_result = classifier.classify(other);
    ASSERT_TRUE(std::holds_alternative<action::Unsupported>(other_result));
    EXPECT_EQ(std::get<action::Unsupported>(other_result).reason, "other");

    ChangeEvent unknown;
    unknown.kind = events::EventKind::Unrecognized;
    unknown.paths = {src("x")};
    auto unknown_result = classifier.classify(unknown);
    ASSERT_TRUE(std::holds_alternative<action::Unsupported>(unknown_result));
    EXPECT_EQ(describe(unknown_result), "Unsupported[unrecognized]: " + src("x"));

    ChangeEvent modify_other;
    modify_other.kind = events::EventKind::Modify;
    modify_other.modify_kind = events::ModifyKind::Other;
    modify_other.paths = {src("x")};
    auto modify_result = classifier.classify(modify_other);
    ASSERT_TRUE(std::holds_alternative<action::Unsupported>(modify_result));
    EXPECT_EQ(std::get<action::Unsupported>(modify_result).reason, "modify-other");
}

TEST_F(EventClassifierTest, EventWithoutPathsIsMalformed) {
    ChangeEvent event;
    event.kind = events::EventKind::Create;

    auto result = classifier.classify(event);
    ASSERT_TRUE(std::holds_alternative<action::Unsupported>(result));
    EXPECT_EQ(std::get<action::Unsupported>(result).reason, "malformed");
}

TEST(MirrorActionTest, NamesAndMutation) {
    MirrorAction copy = action::CopyFile{"/w/a", "/o/a", action::CopyReason::Created};
    MirrorAction unresolved = action::Unresolved{"/x", Error(ErrorCode::PathNotContained, "outside")};

    EXPECT_STREQ(action_name(copy), "CopyFile");
    EXPECT_STREQ(action_name(unresolved), "Unresolved");
    EXPECT_TRUE(mutates_destination(copy));
    EXPECT_FALSE(mutates_destination(unresolved));
    EXPECT_EQ(describe(unresolved), "Unresolved: /x (outside)");
}
