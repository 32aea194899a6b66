#include "SidecarFixture.hpp"
#include "storage/sidecar.hpp"
#include "storage/SidecarStore.hpp"
#include "fs/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <thread>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace folio::fs;
using namespace folio::fs::model;
using namespace folio::storage;

class SidecarTest : public folio::test::SidecarFixture {
protected:
    std::string readFile(const std::filesystem::path& path) const {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST(IdentifierTest, ParsesCanonicalForm) {
    const auto id = parseIdentifier("0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(boost::uuids::to_string(*id), "0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d");
}

TEST(IdentifierTest, RejectsNonCanonicalForms) {
    EXPECT_FALSE(parseIdentifier("0A1B2C3D-4E5F-4A6B-8C7D-9E0F1A2B3C4D"));
    EXPECT_FALSE(parseIdentifier("0a1b2c3d4e5f4a6b8c7d9e0f1a2b3c4d"));
    EXPECT_FALSE(parseIdentifier("{0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d}"));
    EXPECT_FALSE(parseIdentifier("0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4g"));
    EXPECT_FALSE(parseIdentifier(""));
}

TEST(IdentifierTest, StoredReferencesAcceptAnyUuidForm) {
    const auto canonical = parseIdentifier("0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d");
    ASSERT_TRUE(canonical.has_value());
    EXPECT_EQ(parseIdentifierAnyForm("0A1B2C3D-4E5F-4A6B-8C7D-9E0F1A2B3C4D"), canonical);
    EXPECT_EQ(parseIdentifierAnyForm("0a1b2c3d4e5f4a6b8c7d9e0f1a2b3c4d"), canonical);
    EXPECT_EQ(parseIdentifierAnyForm("{0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d}"), canonical);
    EXPECT_FALSE(parseIdentifierAnyForm("nowhere"));
    EXPECT_FALSE(parseIdentifierAnyForm(""));
}

TEST(ClassifyPathTest, AcceptsMetadataAndContentSidecars) {
    const std::string id = "0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d";
    EXPECT_TRUE(sidecar::classifyPath("/base/" + id + ".metadata"));
    EXPECT_TRUE(sidecar::classifyPath("/base/" + id + ".content"));
    EXPECT_TRUE(sidecar::isMetadataPath("/base/" + id + ".metadata"));
    EXPECT_FALSE(sidecar::isMetadataPath("/base/" + id + ".content"));
}

TEST(ClassifyPathTest, IgnoresEverythingElse) {
    const std::string id = "0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d";
    EXPECT_FALSE(sidecar::classifyPath("/base/" + id + ".pdf"));
    EXPECT_FALSE(sidecar::classifyPath("/base/" + id + ".metadata.tmp"));
    EXPECT_FALSE(sidecar::classifyPath("/base/" + id + "/page.rm"));
    EXPECT_FALSE(sidecar::classifyPath("/base/not-a-uuid.metadata"));
    EXPECT_FALSE(sidecar::classifyPath("/base/0A1B2C3D-4E5F-4A6B-8C7D-9E0F1A2B3C4D.metadata"));
}

TEST_F(SidecarTest, ReadsCollection) {
    const auto parent = newId();
    const auto id = writeDirectory("Books", Parent::directory(parent), true);

    const auto item = sidecar::readItem(base, id);
    EXPECT_EQ(item.id, id);
    EXPECT_EQ(item.name, "Books");
    EXPECT_EQ(item.parent, Parent::directory(parent));
    EXPECT_TRUE(item.pinned);
    EXPECT_TRUE(item.isDirectory());
    EXPECT_FALSE(item.format.has_value());
}

TEST_F(SidecarTest, ReadsDocumentWithFormat) {
    const auto id = writeDocument("Alice", Parent::trash(), "epub");

    const auto item = sidecar::readItem(base, id);
    EXPECT_TRUE(item.isDocument());
    EXPECT_EQ(item.parent, Parent::trash());
    ASSERT_TRUE(item.format.has_value());
    EXPECT_EQ(*item.format, Format::Epub);
}

TEST_F(SidecarTest, MissingMetadataIsNotFound) {
    EXPECT_THROW((void)sidecar::readItem(base, newId()), NotFound);
}

TEST_F(SidecarTest, DocumentWithoutContentIsNotFound) {
    const auto id = writeDocument("Orphan");
    std::filesystem::remove(base / (boost::uuids::to_string(id) + ".content"));
    EXPECT_THROW((void)sidecar::readItem(base, id), NotFound);
}

TEST_F(SidecarTest, MalformedJsonIsParseError) {
    const auto id = newId();
    writeFile(base / (boost::uuids::to_string(id) + ".metadata"), "{ \"type\": ");
    EXPECT_THROW((void)sidecar::readItem(base, id), ParseError);
}

TEST_F(SidecarTest, SchemaMismatchIsParseError) {
    const auto id = newId();
    writeMetadata(id, "SomethingElse", "Odd", Parent::root(), false);
    EXPECT_THROW((void)sidecar::readItem(base, id), ParseError);

    const auto noName = newId();
    writeFile(base / (boost::uuids::to_string(noName) + ".metadata"),
              R"({"type": "CollectionType", "parent": "", "pinned": false})");
    EXPECT_THROW((void)sidecar::readItem(base, noName), ParseError);

    const auto badParent = newId();
    writeFile(base / (boost::uuids::to_string(badParent) + ".metadata"),
              R"({"type": "CollectionType", "visibleName": "X", "parent": "nowhere", "pinned": false})");
    EXPECT_THROW((void)sidecar::readItem(base, badParent), ParseError);
}

TEST_F(SidecarTest, UppercaseParentReferenceIsAccepted) {
    const auto folder = writeDirectory("Folder");
    auto upper = boost::uuids::to_string(folder);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](const unsigned char c) { return std::toupper(c); });

    const auto id = newId();
    writeFile(base / (boost::uuids::to_string(id) + ".metadata"),
              R"({"type": "CollectionType", "visibleName": "Child", "parent": ")" + upper + R"(", "pinned": false})");

    EXPECT_EQ(sidecar::readItem(base, id).parent, Parent::directory(folder));
}

TEST_F(SidecarTest, UnknownFileTypeIsParseError) {
    const auto id = writeDocument("Scan", Parent::root(), "djvu");
    EXPECT_THROW((void)sidecar::readItem(base, id), ParseError);
}

TEST_F(SidecarTest, RewriteParentPreservesOtherFieldsAndOrder) {
    const auto target = newId();
    const auto id = writeDocument("Alice");
    const auto path = base / (boost::uuids::to_string(id) + ".metadata");

    const auto before = nlohmann::ordered_json::parse(readFile(path));
    sidecar::rewriteParent(base, id, Parent::directory(target));
    const auto after = nlohmann::ordered_json::parse(readFile(path));

    std::vector<std::string> keysBefore, keysAfter;
    for (const auto& el : before.items()) keysBefore.push_back(el.key());
    for (const auto& el : after.items()) keysAfter.push_back(el.key());
    EXPECT_EQ(keysBefore, keysAfter);

    EXPECT_EQ(after["parent"], boost::uuids::to_string(target));
    for (const auto& key : keysBefore)
        if (key != "parent") EXPECT_EQ(before[key], after[key]) << key;

    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));
    EXPECT_EQ(sidecar::readItem(base, id).parent, Parent::directory(target));
}

TEST_F(SidecarTest, RewriteParentToRootAndTrash) {
    const auto id = writeDirectory("Folder", Parent::directory(newId()));

    sidecar::rewriteParent(base, id, Parent::trash());
    EXPECT_EQ(sidecar::readItem(base, id).parent, Parent::trash());

    sidecar::rewriteParent(base, id, Parent::root());
    EXPECT_EQ(sidecar::readItem(base, id).parent, Parent::root());
}

TEST_F(SidecarTest, ConcurrentRewritesLeaveAWellFormedRecord) {
    const auto folder = writeDirectory("Folder");
    const auto doc = writeDocument("Doc");
    constexpr int rounds = 500;

    std::atomic<int> failures{0};
    const auto rewriter = [&](const Parent& first, const Parent& second) {
        for (int i = 0; i < rounds; ++i) {
            try {
                sidecar::rewriteParent(base, doc, i % 2 == 0 ? first : second);
            } catch (const Error&) {
                ++failures;
            }
        }
    };

    std::thread a(rewriter, Parent::directory(folder), Parent::root());
    std::thread b(rewriter, Parent::root(), Parent::trash());
    a.join();
    b.join();

    EXPECT_EQ(failures.load(), 0);

    const auto item = sidecar::readItem(base, doc);
    EXPECT_EQ(item.name, "Doc");
    EXPECT_TRUE(item.parent == Parent::directory(folder) || item.parent.isRoot() || item.parent.isTrash());

    for (const auto& entry : std::filesystem::directory_iterator(base))
        EXPECT_NE(entry.path().extension().string(), ".tmp") << entry.path().string();
}

TEST_F(SidecarTest, RewriteParentOfMissingRecordIsNotFound) {
    EXPECT_THROW(sidecar::rewriteParent(base, newId(), Parent::root()), NotFound);
}

TEST_F(SidecarTest, EnumerateListsOnlyMetadataSidecars) {
    const auto dir = writeDirectory("Folder");
    const auto doc = writeDocument("Doc");
    writeFile(base / "notes.txt", "hello");
    writeFile(base / (boost::uuids::to_string(newId()) + ".pdf"), "%PDF");
    std::filesystem::create_directories(base / (boost::uuids::to_string(doc)));

    auto ids = sidecar::enumerate(base);
    std::sort(ids.begin(), ids.end());
    std::vector expected{dir, doc};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(ids, expected);
}

TEST_F(SidecarTest, EnumerateMissingDirectoryIsIoError) {
    EXPECT_THROW((void)sidecar::enumerate(base / "missing"), IoError);
}

TEST_F(SidecarTest, StoreDelegatesToSidecars) {
    SidecarStore store(base);
    const auto id = writeDocument("Alice", Parent::root(), "notebook");

    EXPECT_EQ(store.basePath().string(), base.string());
    ASSERT_EQ(store.enumerate().size(), 1u);
    EXPECT_EQ(*store.readItem(id).format, Format::Notebook);

    store.rewriteParent(id, Parent::trash());
    EXPECT_TRUE(store.readItem(id).parent.isTrash());
}

TEST(ItemJsonTest, SerializesForCallers) {
    Item item;
    item.id = *parseIdentifier("0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d");
    item.name = "Alice";
    item.parent = Parent::trash();
    item.pinned = true;
    item.kind = Item::Kind::Document;
    item.format = Format::Pdf;

    const nlohmann::json j = item;
    EXPECT_EQ(j["id"], "0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d");
    EXPECT_EQ(j["name"], "Alice");
    EXPECT_EQ(j["parent"], "trash");
    EXPECT_EQ(j["pinned"], true);
    EXPECT_EQ(j["type"], "document");
    EXPECT_EQ(j["format"], "pdf");
}
