#include <catch2/catch_test_macros.hpp>
#include "import/import_context.hpp"
#include "support/fixtures.hpp"

using namespace quire;
using namespace quire::import;
using namespace quire::testing;

TEST_CASE("Importing notetypes", "[import][notetype]") {
    auto col = make_collection();
    REQUIRE(col.config().set_int(storage::config_keys::USN, 5).is_ok());

    auto existing = basic_notetype(NotetypeId(1));
    existing.mtime = TimestampSecs(1000);
    existing = seed_notetype(col, existing);

    MediaUseMap media;
    auto ctx = ImportContext::create(col, media).unwrap();
    auto progress = unthrottled_progress();

    SECTION("Unknown notetypes are added under their own id") {
        auto incoming = create_notetype(NotetypeId(2), "Vocab", {"Word", "Meaning"}, {"Recall"});
        REQUIRE(ctx.import_notetypes({incoming}, progress).is_ok());

        auto stored = col.expect_notetype(NotetypeId(2)).unwrap();
        REQUIRE(stored.name == "Vocab");
        REQUIRE(stored.usn == Usn{5});
        REQUIRE(ctx.remapped_notetypes().empty());
    }

    SECTION("Added notetypes get a unique name") {
        auto incoming = basic_notetype(NotetypeId(2));
        REQUIRE(ctx.import_notetypes({incoming}, progress).is_ok());
        REQUIRE(col.expect_notetype(NotetypeId(2)).unwrap().name == "Basic+");
    }

    SECTION("A newer notetype with the same structure is updated in place") {
        auto incoming = existing;
        incoming.mtime = TimestampSecs(2000);
        incoming.css = ".card { color: blue; }";
        REQUIRE(ctx.import_notetypes({incoming}, progress).is_ok());

        auto stored = col.expect_notetype(NotetypeId(1)).unwrap();
        REQUIRE(stored.css == ".card { color: blue; }");
        REQUIRE(stored.mtime == TimestampSecs(2000));
        REQUIRE(stored.usn == Usn{5});
        REQUIRE(ctx.remapped_notetypes().empty());
        REQUIRE(col.notetypes().count().unwrap() == 1);
    }

    SECTION("An older or equal notetype with the same structure is ignored") {
        auto incoming = existing;
        incoming.css = ".card { color: blue; }";
        REQUIRE(ctx.import_notetypes({incoming}, progress).is_ok());

        incoming.mtime = TimestampSecs(10);
        REQUIRE(ctx.import_notetypes({incoming}, progress).is_ok());

        REQUIRE(col.expect_notetype(NotetypeId(1)).unwrap() == existing);
    }

    SECTION("A diverged notetype is added under a new id and remapped") {
        auto incoming = existing;
        incoming.fields.push_back(NoteField{.name = "Extra"});
        REQUIRE(ctx.import_notetypes({incoming}, progress).is_ok());

        REQUIRE(ctx.remapped_notetypes().size() == 1);
        const auto new_id = ctx.remapped_notetypes().at(NotetypeId(1));
        REQUIRE(new_id != NotetypeId(1));

        auto added = col.expect_notetype(new_id).unwrap();
        REQUIRE(field_names(added) == std::vector<std::string>{"Front", "Back", "Extra"});
        REQUIRE(added.name == "Basic+");
        REQUIRE(col.expect_notetype(NotetypeId(1)).unwrap() == existing);
    }

    SECTION("A diverged notetype is remapped even when older") {
        auto incoming = existing;
        incoming.mtime = TimestampSecs(1);
        incoming.templates[0].name = "Forward";
        REQUIRE(ctx.import_notetypes({incoming}, progress).is_ok());
        REQUIRE(ctx.remapped_notetypes().contains(NotetypeId(1)));
    }

    SECTION("Invalid notetypes abort the import") {
        auto incoming = create_notetype(NotetypeId(3), "Broken", {"Only"}, {});
        auto result = ctx.import_notetypes({incoming}, progress);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidInput);
    }
}
