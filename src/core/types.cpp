#include "core/types.hpp"

#include <random>
#include <string_view>
#include <type_traits>

namespace quire {

namespace {

constexpr std::string_view BASE91_TABLE =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
    "!#$%&()*+,-./:;<=>?@[]^_`{|}~";

} // namespace

static_assert(sizeof(NoteId) == 8, "NoteId should be 8 bytes");
static_assert(std::is_trivially_copyable_v<NoteId>, "NoteId should be trivially copyable");
static_assert(std::is_trivially_copyable_v<TimestampSecs>, "TimestampSecs should be trivially copyable");
static_assert(BASE91_TABLE.size() == 91, "base91 table must have 91 symbols");

int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string generate_guid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    uint64_t value = dist(gen);
    std::string out;
    do {
        out.insert(out.begin(), BASE91_TABLE[value % BASE91_TABLE.size()]);
        value /= BASE91_TABLE.size();
    } while (value > 0);
    return out;
}

} // namespace quire
