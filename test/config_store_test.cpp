#include "ConfigStore.hpp"
#include "test_utils.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <gtest/gtest.h>

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir_.isValid());
        path_ = temp_dir_.filePath("culler_settings.json");
    }

    QJsonObject read_back() const {
        return QJsonDocument::fromJson(read_file(path_)).object();
    }

    QTemporaryDir temp_dir_;
    QString path_;
};

TEST_F(ConfigStoreTest, MissingFileGivesDefaults)
{
    ConfigStore store(path_);
    const QJsonObject doc = store.load();

    EXPECT_EQ(doc, ConfigStore::defaults());
    EXPECT_EQ(store.last_status(), ConfigStatus::Missing);
    EXPECT_FALSE(QFile::exists(path_));
}

TEST_F(ConfigStoreTest, DefaultsAreValid)
{
    const ValidationResult result = ConfigStore::validate(ConfigStore::defaults());
    EXPECT_TRUE(result.ok) << result.reason.toStdString();
}

TEST_F(ConfigStoreTest, MigratesV1AndPersists)
{
    ASSERT_TRUE(write_file(path_, R"({"src": "/photos/in", "keep": "/photos/good"})"));

    ConfigStore store(path_);
    const QJsonObject doc = store.load();

    EXPECT_EQ(store.last_status(), ConfigStatus::Migrated);
    EXPECT_EQ(doc.value("src").toString(), "/photos/in");
    EXPECT_EQ(doc.value("keep").toString(), "/photos/good");
    EXPECT_EQ(doc.value("button_mappings"), ConfigStore::defaults().value("button_mappings"));
    EXPECT_EQ(doc.value("wheel_mappings"), ConfigStore::defaults().value("wheel_mappings"));
    EXPECT_EQ(doc.value("options"), ConfigStore::defaults().value("options"));

    EXPECT_FALSE(ConfigStore::is_v1(doc));
    EXPECT_TRUE(ConfigStore::validate(doc).ok);

    // The migrated form was written back immediately
    const QJsonObject on_disk = read_back();
    EXPECT_EQ(on_disk, doc);

    ConfigStore reloaded(path_);
    EXPECT_EQ(reloaded.load(), doc);
    EXPECT_EQ(reloaded.last_status(), ConfigStatus::Ok);
}

TEST_F(ConfigStoreTest, V1IsValidForMigration)
{
    QJsonObject v1;
    v1.insert("src", "a");
    v1.insert("keep", "b");
    EXPECT_TRUE(ConfigStore::is_v1(v1));
    EXPECT_TRUE(ConfigStore::validate(v1).ok);
}

TEST_F(ConfigStoreTest, SaveThenLoadIsIdentical)
{
    QJsonObject doc = ConfigStore::defaults();
    doc.insert("src", "/data/raw");
    doc.insert("keep", "/data/good");
    QJsonObject buttons = doc.value("button_mappings").toObject();
    buttons.insert("left_click", "skip");
    doc.insert("button_mappings", buttons);
    QJsonObject options = doc.value("options").toObject();
    options.insert("recursive_loading", true);
    doc.insert("options", options);

    ConfigStore store(path_);
    ASSERT_TRUE(store.save(doc));

    ConfigStore reloaded(path_);
    EXPECT_EQ(reloaded.load(), doc);
    EXPECT_EQ(reloaded.last_status(), ConfigStatus::Ok);
}

TEST_F(ConfigStoreTest, SaveWritesStableIndentedJson)
{
    ConfigStore store(path_);
    ASSERT_TRUE(store.save(ConfigStore::defaults()));
    const QByteArray first = read_file(path_);
    ASSERT_TRUE(store.save(ConfigStore::defaults()));
    EXPECT_EQ(read_file(path_), first);
    EXPECT_TRUE(first.contains("\n"));
}

TEST_F(ConfigStoreTest, RejectsUnknownAction)
{
    QJsonObject doc = ConfigStore::defaults();
    QJsonObject wheel = doc.value("wheel_mappings").toObject();
    wheel.insert("wheel_up", "jump");
    doc.insert("wheel_mappings", wheel);

    const ValidationResult result = ConfigStore::validate(doc);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reason, "Invalid action 'jump' for wheel_up");
}

TEST_F(ConfigStoreTest, RejectsCapitalizedAction)
{
    QJsonObject doc = ConfigStore::defaults();
    QJsonObject buttons = doc.value("button_mappings").toObject();
    buttons.insert("right_click", "Reject");
    doc.insert("button_mappings", buttons);

    EXPECT_FALSE(ConfigStore::validate(doc).ok);
}

TEST_F(ConfigStoreTest, RejectsNonStringAction)
{
    QJsonObject doc = ConfigStore::defaults();
    QJsonObject buttons = doc.value("button_mappings").toObject();
    buttons.insert("left_click", 3);
    doc.insert("button_mappings", buttons);

    const ValidationResult result = ConfigStore::validate(doc);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reason, "Action for left_click must be a string");
}

TEST_F(ConfigStoreTest, RejectsNonBooleanRecursive)
{
    QJsonObject doc = ConfigStore::defaults();
    QJsonObject options;
    options.insert("recursive_loading", "yes");
    doc.insert("options", options);

    const ValidationResult result = ConfigStore::validate(doc);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.reason, "recursive_loading must be a boolean");
}

TEST_F(ConfigStoreTest, ReportsSpecificReasons)
{
    QJsonObject doc = ConfigStore::defaults();
    doc.remove("options");
    EXPECT_EQ(ConfigStore::validate(doc).reason, "Missing required key: options");

    doc = ConfigStore::defaults();
    QJsonObject buttons = doc.value("button_mappings").toObject();
    buttons.remove("right_click");
    doc.insert("button_mappings", buttons);
    EXPECT_EQ(ConfigStore::validate(doc).reason, "Missing button mapping: right_click");

    doc = ConfigStore::defaults();
    doc.insert("wheel_mappings", QJsonArray());
    EXPECT_EQ(ConfigStore::validate(doc).reason, "wheel_mappings must be an object");

    doc = ConfigStore::defaults();
    doc.insert("options", QJsonObject());
    EXPECT_EQ(ConfigStore::validate(doc).reason, "Missing option: recursive_loading");
}

TEST_F(ConfigStoreTest, SaveRefusesInvalidDocument)
{
    ConfigStore store(path_);
    ASSERT_TRUE(store.save(ConfigStore::defaults()));
    const QByteArray before = read_file(path_);

    QJsonObject doc = ConfigStore::defaults();
    QJsonObject options;
    options.insert("recursive_loading", 1);
    doc.insert("options", options);

    EXPECT_FALSE(store.save(doc));
    EXPECT_EQ(read_file(path_), before);
    EXPECT_EQ(store.document(), ConfigStore::defaults());

    const ValidationResult applied = store.apply(doc);
    EXPECT_FALSE(applied.ok);
    EXPECT_EQ(applied.reason, "recursive_loading must be a boolean");
}

TEST_F(ConfigStoreTest, MalformedFileFallsBackAndIsPreserved)
{
    const QByteArray broken = "{ \"src\": \"/x\", ";
    ASSERT_TRUE(write_file(path_, broken));

    ConfigStore store(path_);
    EXPECT_EQ(store.load(), ConfigStore::defaults());
    EXPECT_EQ(store.last_status(), ConfigStatus::Invalid);
    EXPECT_FALSE(store.last_error().isEmpty());

    const QString backup = path_ + ConfigStore::kBrokenSuffix;
    EXPECT_EQ(read_file(backup), broken);
    EXPECT_EQ(read_file(path_), broken);
}

TEST_F(ConfigStoreTest, SchemaInvalidFileFallsBack)
{
    ASSERT_TRUE(write_file(path_, R"({"src": "", "keep": "", "button_mappings": {}})"));

    ConfigStore store(path_);
    EXPECT_EQ(store.load(), ConfigStore::defaults());
    EXPECT_EQ(store.last_status(), ConfigStatus::Invalid);
    EXPECT_TRUE(store.last_error().contains("Missing required key: wheel_mappings"));
    EXPECT_TRUE(QFile::exists(path_ + ConfigStore::kBrokenSuffix));
}

TEST_F(ConfigStoreTest, NonObjectJsonFallsBack)
{
    ASSERT_TRUE(write_file(path_, "[1, 2, 3]"));

    ConfigStore store(path_);
    EXPECT_EQ(store.load(), ConfigStore::defaults());
    EXPECT_EQ(store.last_status(), ConfigStatus::Invalid);
}

TEST_F(ConfigStoreTest, GetFollowsDottedPaths)
{
    ConfigStore store(path_);
    store.load();

    EXPECT_EQ(store.get("button_mappings.left_click").toString(), "keep");
    EXPECT_EQ(store.get("options.recursive_loading", true).toBool(), false);

    EXPECT_EQ(store.get("options.missing", "fallback").toString(), "fallback");
    EXPECT_EQ(store.get("nothing.here", 7).toInt(), 7);
    // "src" is a string, so it has no children
    EXPECT_EQ(store.get("src.child", "fallback").toString(), "fallback");
    // Leaf of the wrong type
    EXPECT_EQ(store.get("options.recursive_loading", "text").toString(), "text");
    EXPECT_TRUE(store.get("options.missing").isNull());
}

TEST_F(ConfigStoreTest, SetCreatesIntermediates)
{
    ConfigStore store(path_);
    store.load();

    store.set("src", "/pictures");
    store.set("wheel_mappings.wheel_up", "keep");
    store.set("extra.nested.flag", true);

    EXPECT_EQ(store.source_dir(), "/pictures");
    EXPECT_EQ(store.get("wheel_mappings.wheel_up").toString(), "keep");
    EXPECT_EQ(store.get("wheel_mappings.wheel_down").toString(), "next");
    EXPECT_TRUE(store.get("extra.nested.flag", false).toBool());

    // Replaces a non-object intermediate
    store.set("src.inner", 1);
    EXPECT_EQ(store.get("src.inner", 0).toInt(), 1);
}

TEST_F(ConfigStoreTest, SetThenSavePersists)
{
    ConfigStore store(path_);
    store.load();
    store.set("keep", "/good");
    ASSERT_TRUE(store.save());

    ConfigStore reloaded(path_);
    reloaded.load();
    EXPECT_EQ(reloaded.keep_dir(), "/good");
}

TEST_F(ConfigStoreTest, GestureMappingReadsDocument)
{
    ConfigStore store(path_);
    store.load();
    store.set("button_mappings.right_click", "disabled");

    const GestureMapping mapping = store.gesture_mapping();
    ASSERT_EQ(mapping.size(), 4u);
    EXPECT_EQ(mapping.at(Gesture::PrimaryClick), "keep");
    EXPECT_EQ(mapping.at(Gesture::SecondaryClick), "disabled");
    EXPECT_EQ(mapping.at(Gesture::WheelUp), "previous");
    EXPECT_EQ(mapping.at(Gesture::WheelDown), "next");
}

TEST_F(ConfigStoreTest, SaveCreatesMissingDirectory)
{
    const QString nested = temp_dir_.filePath("a/b/settings.json");
    ConfigStore store(nested);
    EXPECT_TRUE(store.save(ConfigStore::defaults()));
    EXPECT_TRUE(QFile::exists(nested));
}
