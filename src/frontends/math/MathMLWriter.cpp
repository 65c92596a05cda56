//===----------------------------------------------------------------------===//
//
// Part of the MathExpr project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file MathMLWriter.cpp
/// @brief MathML serialisation of the markup tree.
///
/// @details Compact output puts the whole tree on one line.  Pretty output
/// puts each element on its own line, indented two spaces per level; leaves
/// keep their text inline with their tags.
///
//===----------------------------------------------------------------------===//

#include "frontends/math/MathMLWriter.hpp"

#include <sstream>

namespace mathexpr::frontends::math
{

std::string escapeXml(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
    {
        switch (ch)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += ch;
                break;
        }
    }
    return out;
}

namespace
{

class Writer
{
  public:
    Writer(std::ostream &os, bool pretty) : os_(os), pretty_(pretty) {}

    void open(std::string_view tag, std::string_view attrs = {})
    {
        indent();
        os_ << '<' << tag;
        if (!attrs.empty())
            os_ << ' ' << attrs;
        os_ << '>';
        newline();
        ++depth_;
    }

    void close(std::string_view tag)
    {
        --depth_;
        indent();
        os_ << "</" << tag << '>';
        newline();
    }

    void element(const MarkupElement &e)
    {
        const std::string_view tag = markupTag(e.kind);
        if (e.isLeaf())
        {
            indent();
            os_ << '<' << tag << '>' << escapeXml(e.text) << "</" << tag << '>';
            newline();
            return;
        }
        open(tag);
        for (const auto &child : e.children)
            element(child);
        close(tag);
    }

  private:
    void indent()
    {
        if (!pretty_)
            return;
        for (int i = 0; i < depth_; ++i)
            os_ << "  ";
    }

    void newline()
    {
        if (pretty_)
            os_ << '\n';
    }

    std::ostream &os_;
    bool pretty_;
    int depth_ = 0;
};

} // namespace

void writeMathML(const MarkupElement &element, std::ostream &os,
                 const support::MathMLOptions &options)
{
    Writer writer(os, options.pretty);
    if (!options.wrapInMath)
    {
        writer.element(element);
        return;
    }
    const std::string attrs = "xmlns=\"" + std::string(kMathMLNamespace) + "\"";
    writer.open("math", attrs);
    writer.element(element);
    writer.close("math");
}

std::string writeMathML(const MarkupElement &element, const support::MathMLOptions &options)
{
    std::ostringstream os;
    writeMathML(element, os, options);
    return os.str();
}

} // namespace mathexpr::frontends::math
