#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cortex::search {

/**
 * @brief Splits text into lower-cased terms on non-alphanumeric boundaries.
 *
 * Bytes >= 0x80 are treated as term characters so UTF-8 words survive intact.
 */
class Tokenizer {
public:
    static std::vector<std::string> tokenize(std::string_view text);

    // Distinct terms, used for the keyword match counts
    static std::set<std::string> uniqueTerms(std::string_view text);
};

} // namespace cortex::search
