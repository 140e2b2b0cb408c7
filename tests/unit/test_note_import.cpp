#include <catch2/catch_test_macros.hpp>
#include "import/import_context.hpp"
#include "support/fixtures.hpp"

#include <limits>

using namespace quire;
using namespace quire::import;
using namespace quire::testing;

namespace {

constexpr NotetypeId BASIC{1};
constexpr NotetypeId VOCAB{2};

Result<NoteImports> merge(storage::Collection& col,
                          std::vector<Note> notes,
                          std::vector<Notetype> notetypes = {}) {
    MediaUseMap media;
    auto progress = unthrottled_progress();
    return import_notes_and_notetypes(
        col, ImportData{.notetypes = std::move(notetypes), .notes = std::move(notes)},
        media, progress);
}

storage::Collection make_target() {
    auto col = make_collection();
    col.config().set_int(storage::config_keys::USN, 5).unwrap();
    seed_notetype(col, basic_notetype(BASIC));
    seed_notetype(col, create_notetype(VOCAB, "Vocab", {"Word", "Meaning"}, {"Recall"}));
    return col;
}

} // namespace

TEST_CASE("Notes with unseen GUIDs are added", "[import][note]") {
    auto col = make_target();

    auto imports = merge(col, {make_note(100, BASIC, "new-guid", 1500, {"front", "back"})}).unwrap();

    const auto& log = imports.log();
    REQUIRE(log.found_notes == 1);
    REQUIRE(log.new_notes.size() == 1);
    REQUIRE(log.new_notes[0] == LogNote{.id = NoteId(100), .fields = {"front", "back"}});
    REQUIRE(imports.target_for(NoteId(100)) == NoteId(100));

    auto stored = col.get_note(NoteId(100)).unwrap();
    REQUIRE(stored.has_value());
    REQUIRE(stored->guid == "new-guid");
    REQUIRE(stored->fields == std::vector<std::string>{"front", "back"});
    REQUIRE(stored->mtime == TimestampSecs(1500));
    REQUIRE(stored->usn == Usn{5});
    REQUIRE(col.notes().count().unwrap() == 1);
}

TEST_CASE("Colliding note ids are bumped", "[import][note]") {
    auto col = make_target();
    seed_note(col, make_note(100, BASIC, "taken-1", 1000, {"a", ""}));

    SECTION("One step past the taken id") {
        auto imports = merge(col, {make_note(100, BASIC, "fresh", 1000, {"b", ""})}).unwrap();

        const NoteId bumped(100 + NOTE_ID_COLLISION_STEP);
        REQUIRE(imports.target_for(NoteId(100)) == bumped);
        REQUIRE(imports.log().new_notes[0].id == bumped);
        REQUIRE(col.get_note(bumped).unwrap()->fields[0] == "b");
        REQUIRE(col.get_note(NoteId(100)).unwrap()->fields[0] == "a");
    }

    SECTION("Ids inserted earlier in the batch are avoided too") {
        seed_note(col, make_note(100 + NOTE_ID_COLLISION_STEP, BASIC, "taken-2", 1000, {"c", ""}));

        auto imports = merge(col, {
            make_note(100, BASIC, "fresh-1", 1000, {"d", ""}),
            make_note(100 + 2 * NOTE_ID_COLLISION_STEP, BASIC, "fresh-2", 1000, {"e", ""}),
        }).unwrap();

        REQUIRE(imports.target_for(NoteId(100)) == NoteId(100 + 2 * NOTE_ID_COLLISION_STEP));
        REQUIRE(imports.target_for(NoteId(100 + 2 * NOTE_ID_COLLISION_STEP)) ==
                NoteId(100 + 3 * NOTE_ID_COLLISION_STEP));
        REQUIRE(col.notes().count().unwrap() == 4);
    }

    SECTION("Ids near the top of the range fail instead of wrapping") {
        const int64_t near_max = std::numeric_limits<int64_t>::max() - 10;
        seed_note(col, make_note(near_max, BASIC, "taken-max", 1000, {"f", ""}));

        auto result = merge(col, {make_note(near_max, BASIC, "fresh-max", 1000, {"g", ""})});

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidInput);
        REQUIRE(col.notes().count().unwrap() == 2);
    }
}

TEST_CASE("Notes with known GUIDs", "[import][note]") {
    auto col = make_target();
    seed_note(col, make_note(50, BASIC, "shared", 1000, {"old front", "old back"}));
    const auto before = col.get_note(NoteId(50)).unwrap().value();

    SECTION("Newer notes of the same notetype update the target note") {
        auto imports = merge(col, {make_note(77, BASIC, "shared", 2000, {"new front", "new back"})})
            .unwrap();

        REQUIRE(imports.log().updated.size() == 1);
        REQUIRE(imports.log().updated[0].id == NoteId(50));
        REQUIRE(imports.target_for(NoteId(77)) == NoteId(50));

        auto stored = col.get_note(NoteId(50)).unwrap().value();
        REQUIRE(stored.fields == std::vector<std::string>{"new front", "new back"});
        REQUIRE(stored.usn == Usn{5});
        REQUIRE(stored.mtime > TimestampSecs(2000));
        REQUIRE_FALSE(col.get_note(NoteId(77)).unwrap().has_value());
        REQUIRE(col.notes().count().unwrap() == 1);
    }

    SECTION("Equal or older notes are duplicates") {
        auto imports = merge(col, {
            make_note(77, BASIC, "shared", 1000, {"same age", ""}),
            make_note(78, BASIC, "shared", 900, {"older", ""}),
        }).unwrap();

        const auto& log = imports.log();
        REQUIRE(log.duplicate.size() == 2);
        REQUIRE(log.duplicate[0] == LogNote{.id = NoteId(50), .fields = {"same age", ""}});
        REQUIRE(log.duplicate[1].id == NoteId(50));
        REQUIRE(imports.target_for(NoteId(77)) == NoteId(50));
        REQUIRE(imports.target_for(NoteId(78)) == NoteId(50));
        REQUIRE(col.get_note(NoteId(50)).unwrap().value() == before);
    }

    SECTION("Newer notes of another notetype conflict") {
        auto imports = merge(col, {make_note(77, VOCAB, "shared", 2000, {"word", "meaning"})})
            .unwrap();

        REQUIRE(imports.log().conflicting.size() == 1);
        REQUIRE(imports.log().conflicting[0].id == NoteId(77));
        REQUIRE_FALSE(imports.target_for(NoteId(77)).has_value());
        REQUIRE(col.get_note(NoteId(50)).unwrap().value() == before);
    }

    SECTION("Newer notes of a diverged notetype conflict") {
        auto diverged = basic_notetype(BASIC);
        diverged.fields.push_back(NoteField{.name = "Extra"});

        auto imports = merge(col,
            {make_note(77, BASIC, "shared", 2000, {"a", "b", "c"})},
            {diverged}).unwrap();

        REQUIRE(imports.log().conflicting.size() == 1);
        REQUIRE(imports.log().updated.empty());
        REQUIRE(col.get_note(NoteId(50)).unwrap().value() == before);
    }

    SECTION("Older notes of another notetype are still duplicates") {
        auto imports = merge(col, {make_note(77, VOCAB, "shared", 10, {"word", ""})}).unwrap();
        REQUIRE(imports.log().duplicate.size() == 1);
    }

    SECTION("A target note that disappeared mid-session is NotFound") {
        MediaUseMap media;
        auto progress = unthrottled_progress();
        auto ctx = ImportContext::create(col, media).unwrap();
        REQUIRE(col.db().execute("DELETE FROM notes WHERE id = 50;").is_ok());

        auto result = ctx.import_notes({make_note(77, BASIC, "shared", 2000, {"x", "y"})}, progress);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::NotFound);
    }
}

TEST_CASE("Notes of a diverged notetype are re-pointed", "[import][note]") {
    auto col = make_target();
    auto diverged = basic_notetype(BASIC);
    diverged.templates.push_back(CardTemplate{.name = "Card 2"});

    auto imports = merge(col,
        {make_note(100, BASIC, "new-guid", 1000, {"front", "back"})},
        {diverged}).unwrap();

    REQUIRE(imports.log().new_notes.size() == 1);
    auto stored = col.get_note(NoteId(100)).unwrap().value();
    REQUIRE(stored.notetype_id != BASIC);
    REQUIRE(col.expect_notetype(stored.notetype_id).unwrap().templates.size() == 2);
}

TEST_CASE("Notes of an unknown notetype abort the merge", "[import][note]") {
    auto col = make_target();

    auto result = merge(col, {make_note(100, NotetypeId(42), "new-guid", 1000, {"a"})});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::NotFound);
}

TEST_CASE("GUID matching uses the session-start snapshot", "[import][note]") {
    auto col = make_target();
    seed_note(col, make_note(50, BASIC, "shared", 1000, {"old", ""}));

    SECTION("Repeated new GUIDs are each added") {
        auto imports = merge(col, {
            make_note(100, BASIC, "twice", 1000, {"first", ""}),
            make_note(101, BASIC, "twice", 2000, {"second", ""}),
        }).unwrap();

        REQUIRE(imports.log().new_notes.size() == 2);
        REQUIRE(col.notes().count().unwrap() == 3);
        REQUIRE(col.notes().get_by_guid("twice").unwrap()->id == NoteId(100));
    }

    SECTION("Repeated known GUIDs are compared against the original target note") {
        auto imports = merge(col, {
            make_note(100, BASIC, "shared", 2000, {"first", ""}),
            make_note(101, BASIC, "shared", 1500, {"second", ""}),
        }).unwrap();

        REQUIRE(imports.log().updated.size() == 2);
        REQUIRE(col.get_note(NoteId(50)).unwrap()->fields[0] == "second");
    }
}

TEST_CASE("Added notes are prepared like local notes", "[import][note]") {
    auto col = make_target();
    REQUIRE(col.tags().register_tag("Spanish", Usn{0}).is_ok());

    MediaUseMap media;
    media.add_checked("foo.jpg", SafeMediaEntry{.name = "bar.jpg", .index = 0});

    auto note = make_note(100, BASIC, "new-guid", 1000,
                          {"<img src='foo.jpg'>", "cafe\xCC\x81", "overflow"});
    note.tags = {"spanish", "verbs"};

    auto progress = unthrottled_progress();
    auto imports = import_notes_and_notetypes(
        col, ImportData{.notetypes = {}, .notes = {note}}, media, progress).unwrap();

    auto stored = col.get_note(NoteId(100)).unwrap().value();
    REQUIRE(stored.fields == std::vector<std::string>{"<img src='bar.jpg'>", "caf\xC3\xA9; overflow"});
    REQUIRE(stored.tags == std::vector<std::string>{"Spanish", "verbs"});
    REQUIRE(stored.sort_field == " bar.jpg ");
    REQUIRE(imports.log().new_notes[0].fields[0] == " bar.jpg ");
    REQUIRE(media.used_entries().size() == 1);
}

TEST_CASE("Field normalization follows the collection setting", "[import][note]") {
    auto col = make_target();
    REQUIRE(col.config().set_bool(storage::config_keys::NORMALIZE_NOTE_TEXT, false).is_ok());

    REQUIRE(merge(col, {make_note(100, BASIC, "g", 1000, {"cafe\xCC\x81", ""})}).is_ok());

    REQUIRE(col.get_note(NoteId(100)).unwrap()->fields[0] == "cafe\xCC\x81");
}

TEST_CASE("Cancelling stops the remaining notes", "[import][note]") {
    auto col = make_target();

    MediaUseMap media;
    ThrottlingProgressHandler progress(
        [](const ImportProgress& p) { return p.count < 2; },
        std::chrono::milliseconds{0});

    auto result = import_notes_and_notetypes(col, ImportData{.notetypes = {}, .notes = {
        make_note(100, BASIC, "a", 1000, {"a", ""}),
        make_note(101, BASIC, "b", 1000, {"b", ""}),
        make_note(102, BASIC, "c", 1000, {"c", ""}),
    }}, media, progress);

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Interrupted);
    REQUIRE(col.notes().count().unwrap() == 1);
}

TEST_CASE("Progress is reported for notetypes, then notes", "[import][progress]") {
    auto col = make_target();

    MediaUseMap media;
    std::vector<ImportProgress> seen;
    ThrottlingProgressHandler progress(
        [&](const ImportProgress& p) {
            seen.push_back(p);
            return true;
        },
        std::chrono::milliseconds{0});

    auto result = import_notes_and_notetypes(col, ImportData{
        .notetypes = {create_notetype(NotetypeId(3), "Cloze", {"Text"}, {"Cloze"})},
        .notes = {
            make_note(100, BASIC, "a", 1000, {"a", ""}),
            make_note(101, BASIC, "b", 1000, {"b", ""}),
        }}, media, progress);

    REQUIRE(result.is_ok());
    REQUIRE(seen == std::vector<ImportProgress>{
        {.stage = ImportStage::Notetypes, .count = 1},
        {.stage = ImportStage::Notes, .count = 1},
        {.stage = ImportStage::Notes, .count = 2},
    });
}
