//===----------------------------------------------------------------------===//
//
// Part of the apicheck project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the element-tree XML reader.  The parser is a hand-written
// recursive descent over the raw text with a line counter; it accepts the
// subset of XML produced by layout editors and the catalog generator.
//
//===----------------------------------------------------------------------===//

#include "xml/XmlReader.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace apicheck::xml
{
namespace
{
constexpr unsigned kMaxDepth = 512;

void appendUtf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool isNameChar(char c)
{
    const auto uc = static_cast<unsigned char>(c);
    return !std::isspace(uc) && c != '/' && c != '>' && c != '=' && c != '<' && c != '"' &&
           c != '\'';
}

class Parser
{
  public:
    explicit Parser(std::string_view text) : text_(text) {}

    support::Expected<XmlElement> run()
    {
        if (!skipMisc())
            return fail(error_);
        if (atEnd() || peek() != '<')
            return fail("missing root element");

        XmlElement root;
        if (!parseElement(root, 0))
            return fail(error_);

        if (!skipMisc())
            return fail(error_);
        if (!atEnd())
            return fail("content after root element");
        return root;
    }

  private:
    bool atEnd() const
    {
        return pos_ >= text_.size();
    }

    char peek() const
    {
        return text_[pos_];
    }

    bool startsWith(std::string_view s) const
    {
        return text_.substr(pos_, s.size()) == s;
    }

    void advance(size_t n)
    {
        for (size_t i = 0; i < n && pos_ < text_.size(); ++i, ++pos_)
        {
            if (text_[pos_] == '\n')
                ++line_;
        }
    }

    void skipWhitespace()
    {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(peek())))
            advance(1);
    }

    bool setError(std::string msg)
    {
        std::ostringstream os;
        os << "line " << line_ << ": " << msg;
        error_ = os.str();
        return false;
    }

    support::Diag fail(const std::string &msg)
    {
        if (error_.empty())
            setError(msg);
        return support::makeError(support::SourceLoc{0, line_}, error_);
    }

    /// Skip past @p terminator, failing with @p what when it never appears.
    bool skipPast(std::string_view terminator, const char *what)
    {
        const size_t end = text_.find(terminator, pos_);
        if (end == std::string_view::npos)
            return setError(std::string("unterminated ") + what);
        advance(end + terminator.size() - pos_);
        return true;
    }

    /// Skip whitespace, comments, processing instructions and DOCTYPE outside
    /// the root element.
    bool skipMisc()
    {
        for (;;)
        {
            skipWhitespace();
            if (startsWith("<?"))
            {
                if (!skipPast("?>", "processing instruction"))
                    return false;
            }
            else if (startsWith("<!--"))
            {
                if (!skipPast("-->", "comment"))
                    return false;
            }
            else if (startsWith("<!"))
            {
                if (!skipDoctype())
                    return false;
            }
            else
            {
                return true;
            }
        }
    }

    /// DOCTYPE may carry an internal subset in brackets.
    bool skipDoctype()
    {
        int bracketDepth = 0;
        while (!atEnd())
        {
            const char c = peek();
            advance(1);
            if (c == '[')
                ++bracketDepth;
            else if (c == ']')
                --bracketDepth;
            else if (c == '>' && bracketDepth <= 0)
                return true;
        }
        return setError("unterminated declaration");
    }

    std::string readName()
    {
        const size_t start = pos_;
        while (!atEnd() && isNameChar(peek()))
            advance(1);
        return std::string(text_.substr(start, pos_ - start));
    }

    bool parseAttribute(XmlElement &el)
    {
        XmlAttribute attr;
        attr.name = readName();
        if (attr.name.empty())
            return setError("malformed attribute in <" + el.name + ">");
        skipWhitespace();
        if (atEnd() || peek() != '=')
            return setError("attribute '" + attr.name + "' has no value");
        advance(1);
        skipWhitespace();
        if (atEnd() || (peek() != '"' && peek() != '\''))
            return setError("attribute '" + attr.name + "' value is not quoted");
        const char quote = peek();
        advance(1);
        const size_t end = text_.find(quote, pos_);
        if (end == std::string_view::npos)
            return setError("unterminated value for attribute '" + attr.name + "'");
        attr.value = decodeEntities(text_.substr(pos_, end - pos_));
        advance(end + 1 - pos_);
        el.attributes.push_back(std::move(attr));
        return true;
    }

    bool parseElement(XmlElement &el, unsigned depth)
    {
        if (depth > kMaxDepth)
            return setError("elements nested too deeply");

        el.line = line_;
        advance(1); // '<'
        el.name = readName();
        if (el.name.empty())
            return setError("missing tag name");

        for (;;)
        {
            skipWhitespace();
            if (atEnd())
                return setError("unterminated start tag <" + el.name + ">");
            if (startsWith("/>"))
            {
                advance(2);
                return true;
            }
            if (peek() == '>')
            {
                advance(1);
                break;
            }
            if (!parseAttribute(el))
                return false;
        }

        return parseContent(el, depth);
    }

    bool parseContent(XmlElement &el, unsigned depth)
    {
        for (;;)
        {
            const size_t next = text_.find('<', pos_);
            if (next == std::string_view::npos)
            {
                advance(text_.size() - pos_);
                return setError("element <" + el.name + "> is never closed");
            }
            advance(next - pos_);

            if (startsWith("</"))
            {
                advance(2);
                const std::string closing = readName();
                skipWhitespace();
                if (atEnd() || peek() != '>')
                    return setError("malformed end tag </" + closing + ">");
                advance(1);
                if (closing != el.name)
                    return setError("end tag </" + closing + "> does not match <" + el.name +
                                    ">");
                return true;
            }
            if (startsWith("<!--"))
            {
                if (!skipPast("-->", "comment"))
                    return false;
                continue;
            }
            if (startsWith("<![CDATA["))
            {
                if (!skipPast("]]>", "CDATA section"))
                    return false;
                continue;
            }
            if (startsWith("<?"))
            {
                if (!skipPast("?>", "processing instruction"))
                    return false;
                continue;
            }
            if (startsWith("<!"))
            {
                if (!skipDoctype())
                    return false;
                continue;
            }

            el.children.emplace_back();
            if (!parseElement(el.children.back(), depth + 1))
                return false;
        }
    }

    std::string_view text_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    std::string error_;
};

} // namespace

const std::string *XmlElement::attribute(std::string_view attrName) const
{
    for (const auto &attr : attributes)
    {
        if (attr.name == attrName)
            return &attr.value;
    }
    return nullptr;
}

std::string decodeEntities(std::string_view raw)
{
    std::string out;
    out.reserve(raw.size());
    size_t i = 0;
    while (i < raw.size())
    {
        if (raw[i] != '&')
        {
            out.push_back(raw[i++]);
            continue;
        }
        const size_t semi = raw.find(';', i);
        if (semi == std::string_view::npos)
        {
            out.append(raw.substr(i));
            break;
        }
        const std::string_view entity = raw.substr(i + 1, semi - i - 1);
        if (entity == "lt")
            out.push_back('<');
        else if (entity == "gt")
            out.push_back('>');
        else if (entity == "amp")
            out.push_back('&');
        else if (entity == "quot")
            out.push_back('"');
        else if (entity == "apos")
            out.push_back('\'');
        else if (entity.size() > 1 && entity[0] == '#')
        {
            const bool hex = entity[1] == 'x' || entity[1] == 'X';
            const std::string_view digits = entity.substr(hex ? 2 : 1);
            uint32_t cp = 0;
            const auto res =
                std::from_chars(digits.data(), digits.data() + digits.size(), cp, hex ? 16 : 10);
            if (res.ec != std::errc() || res.ptr != digits.data() + digits.size() || digits.empty())
                out.append(raw.substr(i, semi - i + 1));
            else
                appendUtf8(out, cp);
        }
        else
        {
            out.append(raw.substr(i, semi - i + 1));
        }
        i = semi + 1;
    }
    return out;
}

support::Expected<XmlElement> parseXml(std::string_view text)
{
    Parser parser(text);
    return parser.run();
}

} // namespace apicheck::xml
