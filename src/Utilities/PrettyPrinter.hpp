//----------------------------------------------------------------------------------------------------------------------
// File: PrettyPrinter.hpp
// Description: Writes JSON documents in the indented layout used by the hub's configuration and device files.
// Containers without members are written as {} and [], arrays of scalars are kept on a single line.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/json.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <algorithm>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace JSON {
//----------------------------------------------------------------------------------------------------------------------

class PrettyPrinter;

void WritePretty(boost::json::value const& json, std::ostream& os);

//----------------------------------------------------------------------------------------------------------------------
} // JSON namespace
//----------------------------------------------------------------------------------------------------------------------

class JSON::PrettyPrinter
{
public:
    static constexpr std::size_t DefaultIndent = 4;
    static constexpr std::size_t InlineArrayLimit = 8; // The number of scalars an array may hold and remain inline.

    explicit PrettyPrinter(std::ostream& os, std::size_t indent = DefaultIndent);

    void Write(boost::json::value const& json);

private:
    [[nodiscard]] static bool IsScalar(boost::json::value const& json);
    [[nodiscard]] static bool IsInlineArray(boost::json::array const& array);

    void WriteObject(boost::json::object const& object);
    void WriteArray(boost::json::array const& array);

    void Indent();
    void Outdent();

    std::ostream& m_os;
    std::size_t m_indent;
    std::string m_prefix;
};

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::WritePretty(boost::json::value const& json, std::ostream& os)
{
    PrettyPrinter{ os }.Write(json);
    os << '\n';
}

//----------------------------------------------------------------------------------------------------------------------

inline JSON::PrettyPrinter::PrettyPrinter(std::ostream& os, std::size_t indent)
    : m_os(os)
    , m_indent(indent)
    , m_prefix()
{
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::Write(boost::json::value const& json)
{
    switch (json.kind()) {
        case boost::json::kind::object: WriteObject(json.get_object()); break;
        case boost::json::kind::array: WriteArray(json.get_array()); break;
        default: m_os << boost::json::serialize(json); break;
    }
}

//----------------------------------------------------------------------------------------------------------------------

inline bool JSON::PrettyPrinter::IsScalar(boost::json::value const& json)
{
    return !json.is_object() && !json.is_array();
}

//----------------------------------------------------------------------------------------------------------------------

inline bool JSON::PrettyPrinter::IsInlineArray(boost::json::array const& array)
{
    return array.size() <= InlineArrayLimit && std::ranges::all_of(array, &PrettyPrinter::IsScalar);
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::WriteObject(boost::json::object const& object)
{
    if (object.empty()) { m_os << "{}"; return; }

    m_os << "{\n";
    Indent();
    bool first = true;
    for (auto const& [key, value] : object) {
        if (!first) { m_os << ",\n"; }
        first = false;
        m_os << m_prefix << boost::json::serialize(boost::json::string{ key }) << ": ";
        Write(value);
    }
    Outdent();
    m_os << '\n' << m_prefix << '}';
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::WriteArray(boost::json::array const& array)
{
    if (array.empty()) { m_os << "[]"; return; }

    if (IsInlineArray(array)) {
        m_os << '[';
        for (std::size_t index = 0; index < array.size(); ++index) {
            if (index != 0) { m_os << ", "; }
            Write(array[index]);
        }
        m_os << ']';
        return;
    }

    m_os << "[\n";
    Indent();
    for (std::size_t index = 0; index < array.size(); ++index) {
        if (index != 0) { m_os << ",\n"; }
        m_os << m_prefix;
        Write(array[index]);
    }
    Outdent();
    m_os << '\n' << m_prefix << ']';
}

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::Indent() { m_prefix.append(m_indent, ' '); }

//----------------------------------------------------------------------------------------------------------------------

inline void JSON::PrettyPrinter::Outdent() { m_prefix.resize(m_prefix.size() - std::min(m_indent, m_prefix.size())); }

//----------------------------------------------------------------------------------------------------------------------
