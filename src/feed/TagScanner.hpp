#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Markup {
    struct STag {
        // lower-cased, namespace prefix kept ("media:content")
        std::string                                      name;
        bool                                             closing     = false;
        bool                                             selfClosing = false;

        // lower-cased keys, entity-decoded values, document order
        std::vector<std::pair<std::string, std::string>> attributes;

        // '<' and one past '>'
        size_t                                           begin = 0;
        size_t                                           end   = 0;

        std::optional<std::string>                       attr(std::string_view key) const;
    };

    // Walks tags left to right without building a tree. Comments, CDATA,
    // doctypes and processing instructions are stepped over. Markup that
    // doesn't parse as a tag is treated as text, an unterminated tag ends the
    // scan.
    class CTagScanner {
      public:
        explicit CTagScanner(std::string_view doc, size_t from = 0);

        std::optional<STag> next();
        size_t              position() const;

      private:
        std::string_view m_doc;
        size_t           m_pos = 0;
    };

    // first opening or empty-element tag called name
    std::optional<STag>        findTag(std::string_view doc, std::string_view name);

    // raw content of the first name element, CDATA sections unwrapped, entities left alone
    std::optional<std::string> elementText(std::string_view doc, std::string_view name);

    std::string                unwrapCDATA(std::string_view text);
};
