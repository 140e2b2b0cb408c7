#include "core/notetype.hpp"

namespace quire {

Notetype create_notetype(
    NotetypeId id,
    std::string name,
    const std::vector<std::string>& field_names,
    const std::vector<std::string>& template_names
) {
    Notetype nt{
        .id = id,
        .name = std::move(name),
        .kind = NotetypeKind::Normal,
        .fields = {},
        .templates = {},
        .css = ".card { font-family: arial; font-size: 20px; }",
        .sort_field_idx = 0,
        .mtime = TimestampSecs::now(),
        .usn = Usn{}
    };

    for (const auto& field_name : field_names) {
        nt.fields.push_back(NoteField{
            .name = field_name,
            .ord = static_cast<uint32_t>(nt.fields.size())
        });
    }

    const std::string front = field_names.empty() ? std::string{} : field_names.front();
    const std::string back = field_names.size() > 1 ? field_names[1] : front;
    for (const auto& template_name : template_names) {
        nt.templates.push_back(CardTemplate{
            .name = template_name,
            .ord = static_cast<uint32_t>(nt.templates.size()),
            .question_format = "{{" + front + "}}",
            .answer_format = "{{FrontSide}}<hr id=answer>{{" + back + "}}"
        });
    }

    return nt;
}

std::vector<std::string> field_names(const Notetype& notetype) {
    std::vector<std::string> names;
    names.reserve(notetype.fields.size());
    for (const auto& field : notetype.fields) {
        names.push_back(field.name);
    }
    return names;
}

std::vector<std::string> template_names(const Notetype& notetype) {
    std::vector<std::string> names;
    names.reserve(notetype.templates.size());
    for (const auto& tmpl : notetype.templates) {
        names.push_back(tmpl.name);
    }
    return names;
}

Result<void, Error> prepare_for_update(Notetype& notetype) {
    if (notetype.fields.empty()) {
        return Result<void, Error>::err(Error::invalid_input(
            "Notetype '" + notetype.name + "' has no fields"));
    }
    if (notetype.templates.empty()) {
        return Result<void, Error>::err(Error::invalid_input(
            "Notetype '" + notetype.name + "' has no templates"));
    }

    for (size_t i = 0; i < notetype.fields.size(); ++i) {
        if (notetype.fields[i].name.empty()) {
            return Result<void, Error>::err(Error::invalid_input(
                "Notetype '" + notetype.name + "' has an unnamed field"));
        }
        notetype.fields[i].ord = static_cast<uint32_t>(i);
    }
    for (size_t i = 0; i < notetype.templates.size(); ++i) {
        if (notetype.templates[i].name.empty()) {
            return Result<void, Error>::err(Error::invalid_input(
                "Notetype '" + notetype.name + "' has an unnamed template"));
        }
        notetype.templates[i].ord = static_cast<uint32_t>(i);
    }

    if (notetype.sort_field_idx >= notetype.fields.size()) {
        notetype.sort_field_idx = 0;
    }
    return Result<void, Error>::ok();
}

} // namespace quire
