#include <catch2/catch_test_macros.hpp>
#include "core/text.hpp"
#include "core/note.hpp"

using namespace quire;

namespace {

MediaRefResolver renaming(std::string from, std::string to) {
    return [from = std::move(from), to = std::move(to)](const std::string& name)
        -> std::optional<std::string> {
        if (name == from) return to;
        return std::nullopt;
    };
}

} // namespace

TEST_CASE("Media references are found in all supported forms", "[text]") {
    const std::string field =
        "<img src=\"a.jpg\"> <IMG class=x src='b.png'> <audio src=c.mp3>"
        "<source src=\"d.ogg\"><object data=\"e.svg\"></object>[sound:f.mp3]";

    REQUIRE(extract_media_refs(field) ==
            std::vector<std::string>{"a.jpg", "b.png", "c.mp3", "d.ogg", "e.svg", "f.mp3"});
}

TEST_CASE("Media references are rewritten in place", "[text]") {
    SECTION("Single quoted attribute") {
        auto out = replace_media_refs("<img src='foo.jpg'>", renaming("foo.jpg", "bar.jpg"));
        REQUIRE(out == std::optional<std::string>{"<img src='bar.jpg'>"});
    }

    SECTION("Sound tag") {
        auto out = replace_media_refs("hi [sound:foo.mp3]!", renaming("foo.mp3", "foo-1.mp3"));
        REQUIRE(out == std::optional<std::string>{"hi [sound:foo-1.mp3]!"});
    }

    SECTION("Unrelated text is untouched") {
        auto out = replace_media_refs("<p>foo.jpg</p><img src=\"foo.jpg\" alt=\"foo.jpg\">",
                                      renaming("foo.jpg", "bar.jpg"));
        REQUIRE(out == std::optional<std::string>{
            "<p>foo.jpg</p><img src=\"bar.jpg\" alt=\"foo.jpg\">"});
    }

    SECTION("Nothing replaced yields nullopt") {
        REQUIRE_FALSE(replace_media_refs("<img src='x.jpg'>", renaming("y.jpg", "z.jpg")));
        REQUIRE_FALSE(replace_media_refs("no media here", renaming("y.jpg", "z.jpg")));
    }

    SECTION("HTML names are unescaped for lookup and escaped on write") {
        auto out = replace_media_refs("<img src=\"a&amp;b.jpg\">", renaming("a&b.jpg", "c&d.jpg"));
        REQUIRE(out == std::optional<std::string>{"<img src=\"c&amp;d.jpg\">"});
    }
}

TEST_CASE("safe_normalized_file_name", "[text]") {
    SECTION("Plain names are unchanged") {
        REQUIRE(safe_normalized_file_name("foo.jpg").unwrap() == "foo.jpg");
    }

    SECTION("Illegal characters and trailing dots are removed") {
        REQUIRE(safe_normalized_file_name("a:b?c*.jpg").unwrap() == "abc.jpg");
        REQUIRE(safe_normalized_file_name("name. .").unwrap() == "name");
    }

    SECTION("Decomposed text is composed") {
        REQUIRE(safe_normalized_file_name("e\xCC\x81.jpg").unwrap() == "\xC3\xA9.jpg");
    }

    SECTION("Unsafe names fail") {
        REQUIRE(safe_normalized_file_name("").is_err());
        REQUIRE(safe_normalized_file_name("..").is_err());
        REQUIRE(safe_normalized_file_name("dir/file.jpg").is_err());
        REQUIRE(safe_normalized_file_name("dir\\file.jpg").is_err());
        REQUIRE(safe_normalized_file_name("con.txt").unwrap_err().kind == ErrorKind::InvalidInput);
    }
}

TEST_CASE("HTML stripping", "[text]") {
    SECTION("Tags, comments and styles are removed; entities decoded") {
        REQUIRE(strip_html("<b>bold</b><!-- c --><style>p{}</style> &amp; &lt;x&gt;") ==
                "bold & <x>");
    }

    SECTION("Media filenames survive") {
        REQUIRE(strip_html_preserving_media_filenames("<img src='bar.jpg'>") == " bar.jpg ");
    }
}

TEST_CASE("Note field helpers", "[text][note]") {
    SECTION("Fields join and split on the unit separator") {
        const std::vector<std::string> fields{"a", "", "c"};
        REQUIRE(split_fields(join_fields(fields)) == fields);
    }

    SECTION("Tags are space-wrapped") {
        REQUIRE(join_tags({"a", "b"}) == " a b ");
        REQUIRE(split_tags("  a  b ") == std::vector<std::string>{"a", "b"});
        REQUIRE(join_tags({}).empty());
    }

    SECTION("Missing fields are padded") {
        Note note;
        note.fields = {"one"};
        fix_field_count(note, 3);
        REQUIRE(note.fields == std::vector<std::string>{"one", "", ""});
    }

    SECTION("Surplus fields are folded into the last one") {
        Note note;
        note.fields = {"one", "two", "three", "", "five"};
        fix_field_count(note, 2);
        REQUIRE(note.fields == std::vector<std::string>{"one", "two; three; five"});
    }

    SECTION("Preparation derives sort field and checksum") {
        auto notetype = basic_notetype(NotetypeId(1));
        notetype.sort_field_idx = 1;
        Note note;
        note.fields = {"<b>front</b>", "cafe\xCC\x81"};
        prepare_for_update(note, notetype, true);

        REQUIRE(note.fields[1] == "caf\xC3\xA9");
        REQUIRE(note.sort_field == "caf\xC3\xA9");
        REQUIRE(note.checksum == field_checksum("front"));
    }

    SECTION("Normalization can be turned off") {
        auto notetype = basic_notetype(NotetypeId(1));
        Note note;
        note.fields = {"cafe\xCC\x81", ""};
        prepare_for_update(note, notetype, false);
        REQUIRE(note.fields[0] == "cafe\xCC\x81");
    }
}
