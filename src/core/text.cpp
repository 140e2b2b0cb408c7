#include "core/text.hpp"

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <algorithm>

namespace quire {

namespace {

// Capture groups of media_ref_regex(): 1-3 are the double-quoted,
// single-quoted and unquoted attribute forms, 4 is a [sound:] tag.
constexpr int FIRST_HTML_GROUP = 1;
constexpr int LAST_HTML_GROUP = 3;
constexpr int SOUND_GROUP = 4;

const QRegularExpression& media_ref_regex() {
    static const QRegularExpression re(
        QString::fromLatin1(
            R"(<(?:(?:img|audio|source)\b[^>]*?\ssrc|object\b[^>]*?\sdata)\s*=\s*)"
            R"((?:"([^"]*)"|'([^']*)'|([^\s>"']+))[^>]*>)"
            R"(|\[sound:([^\]]+)\])"),
        QRegularExpression::CaseInsensitiveOption);
    return re;
}

const QRegularExpression& html_regex() {
    static const QRegularExpression re(
        QString::fromLatin1(
            R"(<!--.*?-->|<style\b[^>]*>.*?</style>|<script\b[^>]*>.*?</script>|<.*?>)"),
        QRegularExpression::CaseInsensitiveOption |
        QRegularExpression::DotMatchesEverythingOption);
    return re;
}

const QRegularExpression& entity_regex() {
    static const QRegularExpression re(
        QString::fromLatin1(R"(&(#[xX][0-9a-fA-F]+|#[0-9]+|[a-zA-Z]+);)"));
    return re;
}

[[nodiscard]] QString to_qstring(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

[[nodiscard]] int captured_group(const QRegularExpressionMatch& match) {
    for (int group = FIRST_HTML_GROUP; group <= SOUND_GROUP; ++group) {
        if (match.capturedStart(group) >= 0) {
            return group;
        }
    }
    return 0;
}

[[nodiscard]] bool is_html_group(int group) {
    return group >= FIRST_HTML_GROUP && group <= LAST_HTML_GROUP;
}

[[nodiscard]] std::optional<QString> decode_entity(const QString& body) {
    if (body.startsWith(QLatin1Char('#'))) {
        bool ok = false;
        const bool hex = body.size() > 1 &&
            (body.at(1) == QLatin1Char('x') || body.at(1) == QLatin1Char('X'));
        const uint code = hex ? body.mid(2).toUInt(&ok, 16) : body.mid(1).toUInt(&ok, 10);
        if (!ok || code == 0 || code > 0x10FFFF) {
            return std::nullopt;
        }
        const char32_t ch = code;
        return QString::fromUcs4(&ch, 1);
    }

    const auto name = body.toLower();
    if (name == QLatin1String("amp")) return QStringLiteral("&");
    if (name == QLatin1String("lt")) return QStringLiteral("<");
    if (name == QLatin1String("gt")) return QStringLiteral(">");
    if (name == QLatin1String("quot")) return QStringLiteral("\"");
    if (name == QLatin1String("apos")) return QStringLiteral("'");
    if (name == QLatin1String("nbsp")) return QStringLiteral(" ");
    return std::nullopt;
}

[[nodiscard]] bool is_illegal_filename_char(QChar c) {
    static const QString illegal = QStringLiteral("<>:\"?*^|");
    return c.unicode() < 0x20 || c.unicode() == 0x7f || illegal.contains(c);
}

[[nodiscard]] bool is_reserved_device_name(const QString& name) {
    static const QStringList reserved = {
        QStringLiteral("CON"), QStringLiteral("PRN"), QStringLiteral("AUX"), QStringLiteral("NUL"),
        QStringLiteral("COM1"), QStringLiteral("COM2"), QStringLiteral("COM3"),
        QStringLiteral("COM4"), QStringLiteral("COM5"), QStringLiteral("COM6"),
        QStringLiteral("COM7"), QStringLiteral("COM8"), QStringLiteral("COM9"),
        QStringLiteral("LPT1"), QStringLiteral("LPT2"), QStringLiteral("LPT3"),
        QStringLiteral("LPT4"), QStringLiteral("LPT5"), QStringLiteral("LPT6"),
        QStringLiteral("LPT7"), QStringLiteral("LPT8"), QStringLiteral("LPT9"),
    };
    const auto stem = name.section(QLatin1Char('.'), 0, 0).toUpper();
    return reserved.contains(stem);
}

} // namespace

std::optional<std::string> replace_media_refs(
    std::string_view text,
    const MediaRefResolver& resolver
) {
    const auto input = to_qstring(text);
    QString output;
    qsizetype copied_up_to = 0;
    bool changed = false;

    auto it = media_ref_regex().globalMatch(input);
    while (it.hasNext()) {
        const auto match = it.next();
        const int group = captured_group(match);
        if (group == 0) continue;

        const bool html = is_html_group(group);
        const auto raw = match.captured(group).toStdString();
        const auto fname = html ? decode_entities(raw) : raw;

        const auto replacement = resolver(fname);
        if (!replacement) continue;

        output += input.mid(copied_up_to, match.capturedStart(group) - copied_up_to);
        output += to_qstring(html ? escape_attribute(*replacement) : *replacement);
        copied_up_to = match.capturedEnd(group);
        changed = true;
    }

    if (!changed) {
        return std::nullopt;
    }
    output += input.mid(copied_up_to);
    return output.toStdString();
}

std::vector<std::string> extract_media_refs(std::string_view text) {
    std::vector<std::string> refs;
    const auto input = to_qstring(text);
    auto it = media_ref_regex().globalMatch(input);
    while (it.hasNext()) {
        const auto match = it.next();
        const int group = captured_group(match);
        if (group == 0) continue;
        const auto raw = match.captured(group).toStdString();
        refs.push_back(is_html_group(group) ? decode_entities(raw) : raw);
    }
    return refs;
}

Result<std::string, Error> safe_normalized_file_name(std::string_view name) {
    auto normalized = to_qstring(name).normalized(QString::NormalizationForm_C);
    normalized.removeIf(is_illegal_filename_char);
    while (!normalized.isEmpty() &&
           (normalized.endsWith(QLatin1Char(' ')) || normalized.endsWith(QLatin1Char('.')))) {
        normalized.chop(1);
    }

    const bool unsafe = normalized.isEmpty() ||
        normalized.contains(QLatin1Char('/')) ||
        normalized.contains(QLatin1Char('\\')) ||
        is_reserved_device_name(normalized);
    if (unsafe) {
        return Result<std::string, Error>::err(Error::invalid_input(
            "Unsafe media file name: " + std::string(name)));
    }
    return Result<std::string, Error>::ok(normalized.toStdString());
}

std::string normalize_to_nfc(std::string_view text) {
    const bool ascii = std::all_of(text.begin(), text.end(),
        [](char c) { return static_cast<unsigned char>(c) < 0x80; });
    if (ascii) {
        return std::string(text);
    }
    return to_qstring(text).normalized(QString::NormalizationForm_C).toStdString();
}

std::string strip_html(std::string_view html) {
    auto stripped = to_qstring(html);
    stripped.remove(html_regex());
    return decode_entities(stripped.toStdString());
}

std::string strip_html_preserving_media_filenames(std::string_view html) {
    const auto input = to_qstring(html);
    QString output;
    qsizetype copied_up_to = 0;

    auto it = media_ref_regex().globalMatch(input);
    while (it.hasNext()) {
        const auto match = it.next();
        const int group = captured_group(match);
        if (!is_html_group(group)) continue;

        output += input.mid(copied_up_to, match.capturedStart(0) - copied_up_to);
        output += QStringLiteral(" ") + match.captured(group) + QStringLiteral(" ");
        copied_up_to = match.capturedEnd(0);
    }
    output += input.mid(copied_up_to);

    return strip_html(output.toStdString());
}

std::string decode_entities(std::string_view html) {
    if (html.find('&') == std::string_view::npos) {
        return std::string(html);
    }

    const auto input = to_qstring(html);
    QString output;
    qsizetype copied_up_to = 0;

    auto it = entity_regex().globalMatch(input);
    while (it.hasNext()) {
        const auto match = it.next();
        const auto decoded = decode_entity(match.captured(1));
        if (!decoded) continue;
        output += input.mid(copied_up_to, match.capturedStart(0) - copied_up_to);
        output += *decoded;
        copied_up_to = match.capturedEnd(0);
    }
    output += input.mid(copied_up_to);
    return output.toStdString();
}

std::string escape_attribute(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace quire
