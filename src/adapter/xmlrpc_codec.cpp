#include "rigd/adapter/xmlrpc_codec.hpp"

#include "rigd/common/json_text.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rigd::adapter::xmlrpc {

namespace {

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '&':
                out += "&amp;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

void appendUtf8(std::string& out, unsigned long code) {
    if (code == 0 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        code = 0xFFFD;
    }
    if (code < 0x80) {
        out.push_back(static_cast<char>(code));
    } else if (code < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code >> 6)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

std::string unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '&') {
            out.push_back(text[i]);
            continue;
        }
        const auto end = text.find(';', i);
        if (end == std::string_view::npos) {
            out.push_back('&');
            continue;
        }
        const auto entity = text.substr(i + 1, end - i - 1);
        if (entity == "lt") {
            out.push_back('<');
        } else if (entity == "gt") {
            out.push_back('>');
        } else if (entity == "amp") {
            out.push_back('&');
        } else if (entity == "quot") {
            out.push_back('"');
        } else if (entity == "apos") {
            out.push_back('\'');
        } else if (!entity.empty() && entity[0] == '#') {
            const bool hex = entity.size() > 1 && (entity[1] == 'x' || entity[1] == 'X');
            const std::string digits{entity.substr(hex ? 2 : 1)};
            appendUtf8(out, std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10));
        } else {
            out.append(text.substr(i, end - i + 1));
        }
        i = end;
    }
    return out;
}

void encodeValue(std::ostringstream& out, const nlohmann::json& value) {
    out << "<value>";
    if (value.is_boolean()) {
        out << "<boolean>" << (value.get<bool>() ? 1 : 0) << "</boolean>";
    } else if (value.is_number_integer()) {
        out << "<i4>" << value.get<long long>() << "</i4>";
    } else if (value.is_number_float()) {
        out << "<double>" << std::fixed << std::setprecision(6) << value.get<double>() << "</double>";
        out << std::defaultfloat;
    } else if (value.is_string()) {
        out << "<string>" << escape(value.get<std::string>()) << "</string>";
    } else if (value.is_array()) {
        out << "<array><data>";
        for (const auto& item : value) {
            encodeValue(out, item);
        }
        out << "</data></array>";
    } else if (value.is_object()) {
        out << "<struct>";
        for (const auto& [name, member] : value.items()) {
            out << "<member><name>" << escape(name) << "</name>";
            encodeValue(out, member);
            out << "</member>";
        }
        out << "</struct>";
    } else {
        out << "<string></string>";
    }
    out << "</value>";
}

// Forward-only reader over the small XML subset XML-RPC uses.
class Reader {
public:
    explicit Reader(std::string_view text)
        : text_{text} {}

    void skipProlog() {
        skipSpace();
        while (text_.compare(pos_, 2, "<?") == 0 || text_.compare(pos_, 4, "<!--") == 0) {
            const bool comment = text_.compare(pos_, 4, "<!--") == 0;
            const auto end = text_.find(comment ? "-->" : "?>", pos_);
            if (end == std::string_view::npos) {
                fail("unterminated prolog");
            }
            pos_ = end + (comment ? 3 : 2);
            skipSpace();
        }
    }

    // Name of the next tag, empty if the next token is text or a closing tag.
    std::string_view peekOpenTag() {
        const auto saved = pos_;
        skipSpace();
        std::string_view name;
        if (pos_ < text_.size() && text_[pos_] == '<' && pos_ + 1 < text_.size() && text_[pos_ + 1] != '/') {
            auto end = pos_ + 1;
            while (end < text_.size() && text_[end] != '>' && text_[end] != '/' &&
                   !std::isspace(static_cast<unsigned char>(text_[end]))) {
                ++end;
            }
            name = text_.substr(pos_ + 1, end - pos_ - 1);
        }
        pos_ = saved;
        return name;
    }

    // Returns false for a self-closing tag (no body follows).
    bool open(std::string_view name) {
        skipSpace();
        if (text_.compare(pos_, 1 + name.size(), "<" + std::string{name}) != 0) {
            fail("expected <" + std::string{name} + ">");
        }
        const auto end = text_.find('>', pos_);
        if (end == std::string_view::npos) {
            fail("unterminated tag");
        }
        const bool selfClosing = text_[end - 1] == '/';
        pos_ = end + 1;
        return !selfClosing;
    }

    void close(std::string_view name) {
        skipSpace();
        const std::string tag = "</" + std::string{name} + ">";
        if (text_.compare(pos_, tag.size(), tag) != 0) {
            fail("expected " + tag);
        }
        pos_ += tag.size();
    }

    bool atClose(std::string_view name) {
        const auto saved = pos_;
        skipSpace();
        const std::string tag = "</" + std::string{name} + ">";
        const bool match = text_.compare(pos_, tag.size(), tag) == 0;
        pos_ = saved;
        return match;
    }

    std::string text() {
        const auto end = text_.find('<', pos_);
        if (end == std::string_view::npos) {
            fail("unterminated text");
        }
        auto raw = text_.substr(pos_, end - pos_);
        pos_ = end;
        return unescape(raw);
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("XML-RPC parse error: " + what);
    }

private:
    void skipSpace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    std::string_view text_;
    std::size_t pos_{0};
};

std::string trimmed(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

nlohmann::json decodeValue(Reader& reader);

nlohmann::json decodeScalar(Reader& reader, std::string_view type) {
    if (!reader.open(type)) {
        if (type == "string" || type == "base64") {
            return std::string{};
        }
        return nullptr;
    }
    const std::string body = reader.text();
    reader.close(type);

    try {
        if (type == "i4" || type == "int" || type == "i8") {
            return std::stoll(trimmed(body));
        }
        if (type == "double") {
            return std::stod(trimmed(body));
        }
        if (type == "boolean") {
            return trimmed(body) == "1";
        }
    } catch (const std::exception&) {
        reader.fail("bad <" + std::string{type} + "> value '" + body + "'");
    }
    return body;
}

nlohmann::json decodeArray(Reader& reader) {
    auto result = nlohmann::json::array();
    if (!reader.open("array")) {
        return result;
    }
    if (reader.open("data")) {
        while (!reader.atClose("data")) {
            result.push_back(decodeValue(reader));
        }
        reader.close("data");
    }
    reader.close("array");
    return result;
}

nlohmann::json decodeStruct(Reader& reader) {
    auto result = nlohmann::json::object();
    if (!reader.open("struct")) {
        return result;
    }
    while (!reader.atClose("struct")) {
        reader.open("member");
        reader.open("name");
        const auto name = reader.text();
        reader.close("name");
        result[name] = decodeValue(reader);
        reader.close("member");
    }
    reader.close("struct");
    return result;
}

nlohmann::json decodeValue(Reader& reader) {
    if (!reader.open("value")) {
        return std::string{};
    }

    nlohmann::json result;
    const auto type = reader.peekOpenTag();
    if (type.empty()) {
        // Untyped content is a string.
        result = reader.text();
    } else if (type == "array") {
        result = decodeArray(reader);
    } else if (type == "struct") {
        result = decodeStruct(reader);
    } else if (type == "nil") {
        if (reader.open("nil")) {
            reader.close("nil");
        }
        result = nullptr;
    } else {
        result = decodeScalar(reader, type);
    }

    reader.close("value");
    return result;
}

}  // namespace

std::string encodeMethodCall(std::string_view method, const nlohmann::json& params) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\"?>"
        << "<methodCall><methodName>" << escape(method) << "</methodName><params>";
    if (params.is_array()) {
        for (const auto& param : params) {
            out << "<param>";
            encodeValue(out, param);
            out << "</param>";
        }
    } else if (!params.is_null()) {
        out << "<param>";
        encodeValue(out, params);
        out << "</param>";
    }
    out << "</params></methodCall>";
    return out.str();
}

MethodResponse decodeMethodResponse(std::string_view document) {
    Reader reader{document};
    reader.skipProlog();
    reader.open("methodResponse");

    MethodResponse response;
    const auto next = reader.peekOpenTag();
    if (next == "fault") {
        reader.open("fault");
        const auto detail = decodeValue(reader);
        reader.close("fault");
        response.fault = true;
        if (detail.is_object()) {
            if (const auto it = detail.find("faultCode"); it != detail.end() && it->is_number_integer()) {
                response.faultCode = it->get<int>();
            }
            if (const auto it = detail.find("faultString"); it != detail.end() && it->is_string()) {
                response.faultString = it->get<std::string>();
            }
        }
        if (response.faultString.empty()) {
            response.faultString = "XML-RPC fault " + std::to_string(response.faultCode);
        }
    } else if (next == "params") {
        if (reader.open("params")) {
            if (!reader.atClose("params")) {
                reader.open("param");
                response.value = decodeValue(reader);
                reader.close("param");
            }
            reader.close("params");
        }
    } else {
        reader.fail("expected <params> or <fault>");
    }

    reader.close("methodResponse");
    return response;
}

std::string valueToText(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "1" : "0";
    }
    if (value.is_null()) {
        return {};
    }
    return common::dumpJson(value);
}

}  // namespace rigd::adapter::xmlrpc
