#include <cortex/search/tokenizer.h>

#include <cctype>

namespace cortex::search {

std::vector<std::string> Tokenizer::tokenize(std::string_view text) {
    std::vector<std::string> terms;
    std::string current;

    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            terms.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        terms.push_back(std::move(current));
    }
    return terms;
}

std::set<std::string> Tokenizer::uniqueTerms(std::string_view text) {
    auto terms = tokenize(text);
    return {std::make_move_iterator(terms.begin()), std::make_move_iterator(terms.end())};
}

} // namespace cortex::search
