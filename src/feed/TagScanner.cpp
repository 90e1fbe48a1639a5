#include "TagScanner.hpp"
#include "../helpers/MiscFunctions.hpp"

#include <cctype>

#include <hyprutils/memory/Casts.hpp>

using namespace Markup;
using namespace Hyprutils::Memory;

static bool isSpace(char c) {
    return std::isspace(sc<unsigned char>(c));
}

std::optional<std::string> STag::attr(std::string_view key) const {
    for (const auto& [k, v] : attributes) {
        if (k == key)
            return v;
    }
    return std::nullopt;
}

CTagScanner::CTagScanner(std::string_view doc, size_t from) : m_doc(doc), m_pos(from) {
    ;
}

size_t CTagScanner::position() const {
    return m_pos;
}

std::optional<STag> CTagScanner::next() {
    while (m_pos < m_doc.size()) {
        const auto LT = m_doc.find('<', m_pos);
        if (LT == std::string_view::npos) {
            m_pos = m_doc.size();
            return std::nullopt;
        }

        const auto REST = m_doc.substr(LT);

        if (REST.starts_with("<!--")) {
            const auto CLOSE = m_doc.find("-->", LT + 4);
            m_pos            = CLOSE == std::string_view::npos ? m_doc.size() : CLOSE + 3;
            continue;
        }

        if (REST.starts_with("<![CDATA[")) {
            const auto CLOSE = m_doc.find("]]>", LT + 9);
            m_pos            = CLOSE == std::string_view::npos ? m_doc.size() : CLOSE + 3;
            continue;
        }

        if (REST.starts_with("<!") || REST.starts_with("<?")) {
            const auto CLOSE = m_doc.find('>', LT + 2);
            m_pos            = CLOSE == std::string_view::npos ? m_doc.size() : CLOSE + 1;
            continue;
        }

        STag   tag;
        size_t p  = LT + 1;
        tag.begin = LT;

        if (p < m_doc.size() && m_doc[p] == '/') {
            tag.closing = true;
            p++;
        }

        const auto NAME_START = p;
        while (p < m_doc.size() && !isSpace(m_doc[p]) && m_doc[p] != '>' && m_doc[p] != '/' && m_doc[p] != '<')
            p++;

        if (p == NAME_START || !std::isalpha(sc<unsigned char>(m_doc[NAME_START]))) {
            // a stray '<' in text
            m_pos = LT + 1;
            continue;
        }

        tag.name = toLower(m_doc.substr(NAME_START, p - NAME_START));

        // attributes
        while (true) {
            while (p < m_doc.size() && isSpace(m_doc[p]))
                p++;

            if (p >= m_doc.size()) {
                m_pos = m_doc.size();
                return std::nullopt;
            }

            if (m_doc[p] == '>') {
                p++;
                break;
            }

            if (m_doc[p] == '/') {
                p++;
                if (p < m_doc.size() && m_doc[p] == '>') {
                    tag.selfClosing = true;
                    p++;
                    break;
                }
                continue;
            }

            const auto KEY_START = p;
            while (p < m_doc.size() && !isSpace(m_doc[p]) && m_doc[p] != '=' && m_doc[p] != '>' && m_doc[p] != '/')
                p++;

            std::string key = toLower(m_doc.substr(KEY_START, p - KEY_START));
            std::string value;

            while (p < m_doc.size() && isSpace(m_doc[p]))
                p++;

            if (p < m_doc.size() && m_doc[p] == '=') {
                p++;
                while (p < m_doc.size() && isSpace(m_doc[p]))
                    p++;

                if (p < m_doc.size() && (m_doc[p] == '"' || m_doc[p] == '\'')) {
                    const auto QUOTE = m_doc[p];
                    const auto CLOSE = m_doc.find(QUOTE, p + 1);
                    if (CLOSE == std::string_view::npos) {
                        m_pos = m_doc.size();
                        return std::nullopt;
                    }
                    value = decodeHTMLEntities(m_doc.substr(p + 1, CLOSE - p - 1));
                    p     = CLOSE + 1;
                } else {
                    const auto VALUE_START = p;
                    while (p < m_doc.size() && !isSpace(m_doc[p]) && m_doc[p] != '>')
                        p++;
                    value = decodeHTMLEntities(m_doc.substr(VALUE_START, p - VALUE_START));
                }
            }

            if (!key.empty())
                tag.attributes.emplace_back(std::move(key), std::move(value));
        }

        tag.end = p;
        m_pos   = p;
        return tag;
    }

    return std::nullopt;
}

std::optional<STag> Markup::findTag(std::string_view doc, std::string_view name) {
    CTagScanner scanner(doc);
    while (auto tag = scanner.next()) {
        if (!tag->closing && tag->name == name)
            return tag;
    }
    return std::nullopt;
}

std::string Markup::unwrapCDATA(std::string_view text) {
    std::string result;
    size_t      pos = 0;

    while (pos < text.size()) {
        const auto START = text.find("<![CDATA[", pos);
        if (START == std::string_view::npos) {
            result.append(text.substr(pos));
            break;
        }

        result.append(text.substr(pos, START - pos));

        const auto END = text.find("]]>", START + 9);
        if (END == std::string_view::npos) {
            result.append(text.substr(START + 9));
            break;
        }

        result.append(text.substr(START + 9, END - START - 9));
        pos = END + 3;
    }

    return result;
}

std::optional<std::string> Markup::elementText(std::string_view doc, std::string_view name) {
    CTagScanner         scanner(doc);
    std::optional<STag> open;

    while (auto tag = scanner.next()) {
        if (!tag->closing && tag->name == name) {
            open = std::move(tag);
            break;
        }
    }

    if (!open)
        return std::nullopt;

    if (open->selfClosing)
        return std::string{};

    int depth = 1;
    while (auto tag = scanner.next()) {
        if (tag->name != name || tag->selfClosing)
            continue;

        depth += tag->closing ? -1 : 1;

        if (depth == 0)
            return unwrapCDATA(doc.substr(open->end, tag->begin - open->end));
    }

    // never closed, take the rest
    return unwrapCDATA(doc.substr(open->end));
}
