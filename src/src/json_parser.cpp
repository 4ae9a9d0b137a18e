#include <vc/json.h>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <sstream>
#include <vector>

namespace vc {

namespace {
    struct JsonParseError : public std::runtime_error {
        size_t line, col;
        JsonParseError(const std::string& msg, size_t l, size_t c) : std::runtime_error(msg), line(l), col(c) {}
    };

    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener {
            char ch;
            size_t line, col;
        };
        std::vector<Opener> opener_stack;

        explicit Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') {
                ++line;
                col = 1;
            } else
                ++col;
            return c;
        }

        void pop_opener() {
            if (opener_stack.empty()) return;
            opener_stack.pop_back();
        }

        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < err_line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_start = pos;
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(line_start, line_end - line_start);
            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();
            std::string caret(caret_pos, ' ');
            caret.push_back('^');

            std::ostringstream ss;
            ss << base << " (line " << err_line << ", column " << err_col << ")"
               << "\n";
            ss << line_text << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const { throw JsonParseError(format_error(base, line, col), line, col); }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) {
                    get();
                    continue;
                }

                // line comment //...
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '/') {
                    get();
                    get();
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }

                // block comment /* ... */
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '*') {
                    get();
                    get();
                    bool closed = false;
                    while (i < s.size()) {
                        char a = get();
                        if (a == '*' and peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (not closed) throw JsonParseError("unterminated block comment", line, col);
                    continue;
                }

                break;
            }
        }

        Input parse_value() {
            skip_ws();
            char c = peek();
            if (c == '\0') fail("unexpected end of input while parsing value");
            if (c == 'n') return parse_null();
            if (c == 't' or c == 'f') return parse_bool();
            if (c == '"') return Input(parse_string());
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            // Python-style True/False/None are a common mistake
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                std::string token = s.substr(i, j - i);
                if (token == "True" or token == "False" or token == "None") {
                    std::string sug = (token == "True") ? "true" : (token == "False") ? "false" : "null";
                    fail(std::string("unexpected token while parsing value, did you mean '") + sug + "'?");
                }
            }
            fail("unexpected token while parsing value");
        }

        Input parse_null() {
            if (s.compare(i, 4, "null") == 0) {
                i += 4;
                col += 4;
                return Input::null();
            }
            fail("invalid literal");
        }

        Input parse_bool() {
            if (s.compare(i, 4, "true") == 0) {
                i += 4;
                col += 4;
                return Input(true);
            }
            if (s.compare(i, 5, "false") == 0) {
                i += 5;
                col += 5;
                return Input(false);
            }
            fail("invalid literal");
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        // encode a Unicode code point as UTF-8 into out
        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F)
                out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t read_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                char h = get();
                if (h == '\0') throw JsonParseError("unterminated unicode escape", line, col);
                int hv = hex_val(h);
                if (hv < 0) throw JsonParseError("invalid unicode escape", line, col);
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            if (get() != '"') throw JsonParseError("expected '\"'", line, col);
            std::string out;
            while (true) {
                char c = get();
                if (c == '\0') throw JsonParseError("unexpected end in string", line, col);
                if (c == '"') break;
                if (c == '\\') {
                    char e = get();
                    if (e == '\0') throw JsonParseError("unexpected end in string escape", line, col);
                    switch (e) {
                        case '"':
                            out.push_back('"');
                            break;
                        case '\\':
                            out.push_back('\\');
                            break;
                        case '/':
                            out.push_back('/');
                            break;
                        case 'b':
                            out.push_back('\b');
                            break;
                        case 'f':
                            out.push_back('\f');
                            break;
                        case 'n':
                            out.push_back('\n');
                            break;
                        case 'r':
                            out.push_back('\r');
                            break;
                        case 't':
                            out.push_back('\t');
                            break;
                        case 'u': {
                            uint32_t cp = read_hex4();
                            // combine a UTF-16 surrogate pair
                            if (cp >= 0xD800 and cp <= 0xDBFF and peek() == '\\' and i + 1 < s.size() and
                                s[i + 1] == 'u') {
                                get();
                                get();
                                uint32_t lo = read_hex4();
                                if (lo < 0xDC00 or lo > 0xDFFF) throw JsonParseError("invalid surrogate pair", line, col);
                                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                            } else if (cp >= 0xD800 and cp <= 0xDFFF) {
                                // a lone surrogate has no UTF-8 encoding
                                throw JsonParseError("invalid surrogate pair", line, col);
                            }
                            encode_utf8(cp, out);
                            break;
                        }
                        default:
                            throw JsonParseError("unsupported escape sequence", line, col);
                    }
                } else {
                    out.push_back(c);
                }
            }
            return out;
        }

        Input parse_number() {
            size_t start = i;
            if (peek() == '-') {
                get();
            }
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true;
                get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true;
                get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            if (not is_float) {
                int64_t v = 0;
                auto res = std::from_chars(token.data(), token.data() + token.size(), v);
                if (res.ec == std::errc() and res.ptr == token.data() + token.size()) return Input(v);
                // too large for int64: keep it as a float
            }
            double d = 0.0;
            auto res = std::from_chars(token.data(), token.data() + token.size(), d);
            if (res.ec == std::errc::result_out_of_range) fail("number out of range");
            return Input(d);
        }

        Input parse_array() {
            if (get() != '[') throw JsonParseError("expected '['", line, col);
            opener_stack.push_back(Opener{'[', line, col});
            std::vector<Input> out_values;
            skip_ws();
            if (peek() == ']') {
                get();
                pop_opener();
                return Input::list(std::move(out_values));
            }
            while (true) {
                out_values.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ']') {
                    get();
                    pop_opener();
                    break;
                }
                if (c == ',') {
                    get();
                    skip_ws();
                    continue;
                }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']'");
            }
            return Input::list(std::move(out_values));
        }

        Input parse_object() {
            if (get() != '{') throw JsonParseError("expected '{'", line, col);
            opener_stack.push_back(Opener{'{', line, col});
            Input::Items items;
            skip_ws();
            if (peek() == '}') {
                get();
                pop_opener();
                return Input::mapping(std::move(items));
            }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    // read an identifier to suggest missing quotes
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string ident = s.substr(i, j - i);
                    std::string base = "expected string key";
                    if (not ident.empty()) base += std::string(", are you missing quotes around '") + ident + "'?";
                    fail(base);
                }
                std::string k = parse_string();
                skip_ws();
                if (get() != ':') fail("expected ':' after object key");
                skip_ws();
                Input v = parse_value();
                items.emplace_back(Input(std::move(k)), std::move(v));
                skip_ws();
                char c = peek();
                if (c == '}') {
                    get();
                    pop_opener();
                    break;
                }
                if (c == ',') {
                    get();
                    skip_ws();
                    continue;
                }
                fail("expected ',' or '}'");
            }
            return Input::mapping(std::move(items));
        }
    };
}  // namespace

Input parse_json(const std::string& text) {
    Parser p(text);
    Input val = p.parse_value();
    p.skip_ws();
    if (p.peek() != '\0') p.fail("extra data after JSON value");
    return val;
}

}  // namespace vc
