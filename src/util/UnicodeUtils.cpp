#include "util/UnicodeUtils.hpp"

#include <memory>
#include <unicode/translit.h>
#include <unicode/unistr.h>

namespace cadence::util {

namespace {

// Building a transliterator compiles its rule set, so each thread keeps one.
// Null when ICU lacks the Latin-ASCII data.
icu::Transliterator* search_transliterator() {
    thread_local std::unique_ptr<icu::Transliterator> trans = [] {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::Transliterator> t(
            icu::Transliterator::createInstance(
                "NFD; [:Nonspacing Mark:] Remove; NFC; Latin-ASCII",
                UTRANS_FORWARD,
                status));
        if (U_FAILURE(status)) {
            t.reset();
        }
        return t;
    }();
    return trans.get();
}

}  // namespace

std::string normalize_for_search(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    if (auto* trans = search_transliterator()) {
        trans->transliterate(unicode_text);
    }

    std::string result;
    unicode_text.toLower().toUTF8String(result);
    return result;
}

std::string fold_case(const std::string& text) {
    if (text.empty()) {
        return text;
    }
    icu::UnicodeString u = icu::UnicodeString::fromUTF8(text);
    std::string result;
    u.foldCase().toUTF8String(result);
    return result;
}

void pop_utf8_char(std::string& text) {
    if (text.empty()) return;
    size_t pos = text.size() - 1;
    // Step back over continuation bytes (10xxxxxx)
    while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    text.erase(pos);
}

}  // namespace cadence::util
