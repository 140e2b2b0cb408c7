#include <catch2/catch_test_macros.hpp>
#include "app/merge_command.hpp"
#include "storage/collection.hpp"
#include "storage/database.hpp"
#include "support/fixtures.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

using namespace quire;
using namespace quire::testing;

namespace {

constexpr NotetypeId BASIC{1};

std::string path_in(const QTemporaryDir& dir, const char* name) {
    return dir.filePath(QString::fromLatin1(name)).toStdString();
}

void write_file(const QString& path, const QByteArray& contents) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(contents) == contents.size());
}

} // namespace

TEST_CASE("Merging one collection file into another", "[integration][merge]") {
    REQUIRE(init_hashing().is_ok());
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto target_path = path_in(dir, "target.db");
    const auto source_path = path_in(dir, "source.db");

    {
        auto target = storage::Collection::open(target_path).unwrap();
        seed_notetype(target, basic_notetype(BASIC));
        seed_note(target, make_note(10, BASIC, "shared-old", 1000, {"kept", ""}));
        seed_note(target, make_note(11, BASIC, "shared-new", 1000, {"stale", ""}));
    }
    {
        auto source = storage::Collection::open(source_path).unwrap();
        seed_notetype(source, basic_notetype(BASIC));
        seed_note(source, make_note(10, BASIC, "fresh", 1500, {"<img src=\"foo.jpg\">", "added"}));
        seed_note(source, make_note(20, BASIC, "shared-old", 500, {"ignored", ""}));
        seed_note(source, make_note(21, BASIC, "shared-new", 2000, {"refreshed", ""}));
    }
    write_file(dir.filePath(QStringLiteral("media.json")), R"({"foo.jpg": "foo-2.jpg"})");

    const auto options = app::MergeOptions{
        .targetPath = QString::fromStdString(target_path),
        .sourcePath = QString::fromStdString(source_path),
        .mediaMapPath = dir.filePath(QStringLiteral("media.json")),
        .json = true
    };

    auto output = app::run_merge(options);
    REQUIRE(output.is_ok());

    const auto doc = QJsonDocument::fromJson(output.unwrap().toUtf8());
    REQUIRE(doc.isObject());
    const auto root = doc.object();
    REQUIRE(root.value(QStringLiteral("foundNotes")).toInt() == 3);
    REQUIRE(root.value(QStringLiteral("new")).toArray().size() == 1);
    REQUIRE(root.value(QStringLiteral("updated")).toArray().size() == 1);
    REQUIRE(root.value(QStringLiteral("duplicate")).toArray().size() == 1);
    REQUIRE(root.value(QStringLiteral("conflicting")).toArray().isEmpty());
    REQUIRE(root.value(QStringLiteral("media")).toArray() == QJsonArray{QStringLiteral("foo-2.jpg")});

    const auto id_map = root.value(QStringLiteral("idMap")).toObject();
    REQUIRE(id_map.value(QStringLiteral("10")).toInteger() == 10 + 999);
    REQUIRE(id_map.value(QStringLiteral("20")).toInteger() == 10);
    REQUIRE(id_map.value(QStringLiteral("21")).toInteger() == 11);

    auto target = storage::Collection::open(target_path).unwrap();
    REQUIRE(target.notes().count().unwrap() == 3);
    REQUIRE(target.get_note(NoteId(10)).unwrap()->fields[0] == "kept");
    REQUIRE(target.get_note(NoteId(11)).unwrap()->fields[0] == "refreshed");
    REQUIRE(target.get_note(NoteId(1009)).unwrap()->fields ==
            std::vector<std::string>{"<img src=\"foo-2.jpg\">", "added"});

    SECTION("Stats reflect the merged collection") {
        auto stats = app::run_stats(QString::fromStdString(target_path));
        REQUIRE(stats.unwrap() == QStringLiteral("Notetypes: 1\nNotes: 3\n"));
    }
}

TEST_CASE("A failed merge leaves the target untouched", "[integration][merge]") {
    REQUIRE(init_hashing().is_ok());
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto target_path = path_in(dir, "target.db");
    const auto source_path = path_in(dir, "source.db");

    {
        auto target = storage::Collection::open(target_path).unwrap();
        seed_notetype(target, basic_notetype(BASIC));
    }
    {
        auto source = storage::Collection::open(source_path).unwrap();
        seed_notetype(source, basic_notetype(BASIC));
        seed_notetype(source, create_notetype(NotetypeId(2), "Vocab", {"Word", "Meaning"}, {"Recall"}));
        seed_note(source, make_note(10, BASIC, "a", 1000, {"fine", ""}));
        seed_note(source, make_note(11, NotetypeId(2), "b", 1000, {"fine too", ""}));
        // Drop the notetype so the second note references nothing.
        REQUIRE(source.db().execute("DELETE FROM notetypes WHERE id = 2;").is_ok());
    }

    auto output = app::run_merge(app::MergeOptions{
        .targetPath = QString::fromStdString(target_path),
        .sourcePath = QString::fromStdString(source_path),
        .mediaMapPath = {},
        .json = false
    });

    REQUIRE(output.is_err());
    REQUIRE(output.unwrap_err().kind == ErrorKind::NotFound);

    auto target = storage::Collection::open(target_path).unwrap();
    REQUIRE(target.notes().count().unwrap() == 0);
}

TEST_CASE("Merge argument errors", "[integration][merge]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SECTION("Missing source file") {
        auto output = app::run_merge(app::MergeOptions{
            .targetPath = dir.filePath(QStringLiteral("target.db")),
            .sourcePath = dir.filePath(QStringLiteral("nope.db")),
            .mediaMapPath = {},
            .json = false
        });
        REQUIRE(output.is_err());
        REQUIRE(output.unwrap_err().kind == ErrorKind::NotFound);
    }

    SECTION("Malformed media map") {
        REQUIRE(app::parse_media_map("[1, 2]").is_err());
        REQUIRE(app::parse_media_map("{\"a.jpg\": 3}").is_err());
        REQUIRE(app::parse_media_map("{\"a/b.jpg\": \"c.jpg\"}").unwrap_err().kind ==
                ErrorKind::InvalidInput);
    }

    SECTION("Media map keys and values are normalized") {
        auto map = app::parse_media_map("{\"x.jpg.\": \"y?.jpg\"}").unwrap();
        REQUIRE(map.find("x.jpg") != nullptr);
        REQUIRE(map.find("x.jpg")->name == "y.jpg");
    }

    SECTION("Source and target may not be the same file") {
        const auto path = path_in(dir, "same.db");
        {
            auto col = storage::Collection::open(path).unwrap();
            seed_notetype(col, basic_notetype(BASIC));
        }
        auto output = app::run_merge(app::MergeOptions{
            .targetPath = QString::fromStdString(path),
            .sourcePath = dir.filePath(QStringLiteral("./same.db")),
            .mediaMapPath = {},
            .json = false
        });
        REQUIRE(output.is_err());
        REQUIRE(output.unwrap_err().kind == ErrorKind::InvalidInput);
    }

    SECTION("A source without the collection schema is rejected and left unmodified") {
        const auto source_path = path_in(dir, "foreign.db");
        {
            auto db = storage::Database::open(source_path).unwrap();
            REQUIRE(db.execute("CREATE TABLE things (id INTEGER PRIMARY KEY);").is_ok());
        }
        auto output = app::run_merge(app::MergeOptions{
            .targetPath = dir.filePath(QStringLiteral("target.db")),
            .sourcePath = QString::fromStdString(source_path),
            .mediaMapPath = {},
            .json = false
        });
        REQUIRE(output.is_err());
        REQUIRE(output.unwrap_err().kind == ErrorKind::InvalidInput);

        auto db = storage::Database::open(source_path).unwrap();
        int tables = 0;
        REQUIRE(db.query("SELECT name FROM sqlite_master WHERE type = 'table';",
                         [&](storage::Statement&) { ++tables; }).is_ok());
        REQUIRE(tables == 1);
    }
}
