//
// C# type name parser
//
// Grammar:
//   type      := name [ '<' type { ',' type } '>' ] [ '?' ]
//   name      := ident { '.' ident }
//

#include <sqlmarshal/model_loader.hh>
#include <cctype>

namespace sqlmarshal::model {

namespace {

class type_name_parser {
public:
    explicit type_name_parser(const std::string& text)
        : text_(text), pos_(0) {}

    type_ref parse() {
        type_ref result = parse_type();
        skip_spaces();
        if (pos_ != text_.size()) {
            fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        }
        return result;
    }

private:
    const std::string& text_;
    size_t pos_;

    type_ref parse_type() {
        type_ref result;
        result.name = parse_name();

        skip_spaces();
        if (peek() == '<') {
            ++pos_;
            while (true) {
                result.type_args.push_back(parse_type());
                skip_spaces();
                if (peek() == ',') {
                    ++pos_;
                    continue;
                }
                if (peek() == '>') {
                    ++pos_;
                    break;
                }
                fail("expected ',' or '>'");
            }
        }

        skip_spaces();
        if (peek() == '?') {
            ++pos_;
            result.nullable_annotation = true;
        }
        return result;
    }

    std::string parse_name() {
        skip_spaces();
        if (text_.compare(pos_, 8, "global::") == 0) {
            pos_ += 8;
        }

        std::string name = parse_identifier();
        while (peek() == '.') {
            ++pos_;
            name += '.';
            name += parse_identifier();
        }
        return name;
    }

    std::string parse_identifier() {
        size_t start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '@') {
            ++pos_;
        }
        if (pos_ >= text_.size() || !is_ident_start(text_[pos_])) {
            fail("expected identifier");
        }
        while (pos_ < text_.size() && is_ident_char(text_[pos_])) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    char peek() const {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    void skip_spaces() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    static bool is_ident_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    static bool is_ident_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw model_error("type '" + text_ + "'",
                          what + " at position " + std::to_string(pos_));
    }
};

}  // namespace

type_ref parse_type_name(const std::string& text) {
    return type_name_parser(text).parse();
}

}  // namespace sqlmarshal::model
