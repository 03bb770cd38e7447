#include "template_parser.hpp"
#include "template.hpp"
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <fmt/core.h>

namespace mlprogress::core {

namespace {

struct ItemName {
    std::string_view name;
    ItemKind kind;
    NumberMode mode;
    bool takes_format; // допустима форма (name "fmt")
    bool takes_none;   // допустима форма (name "fmt" "none")
};

constexpr std::array<ItemName, 19> kItemNames{{
    {"bar_fill",     ItemKind::BarFill,     NumberMode::Plain,         false, false},
    {"message_fill", ItemKind::MessageFill, NumberMode::Plain,         false, false},
    {"eta",          ItemKind::Eta,         NumberMode::Plain,         true,  true},
    {"eta_hms",      ItemKind::EtaHms,      NumberMode::Plain,         false, false},
    {"percent",      ItemKind::Percent,     NumberMode::Float,         true,  true},
    {"pos",          ItemKind::Pos,         NumberMode::Plain,         true,  false},
    {"pos_group",    ItemKind::Pos,         NumberMode::Grouped,       false, false},
    {"pos_bin",      ItemKind::Pos,         NumberMode::BinaryPrefix,  true,  false},
    {"pos_dec",      ItemKind::Pos,         NumberMode::DecimalPrefix, true,  false},
    {"speed",        ItemKind::Speed,       NumberMode::Float,         true,  true},
    {"speed_int",    ItemKind::Speed,       NumberMode::Plain,         true,  true},
    {"speed_group",  ItemKind::Speed,       NumberMode::Grouped,       false, false},
    {"speed_bin",    ItemKind::Speed,       NumberMode::BinaryPrefix,  true,  true},
    {"speed_dec",    ItemKind::Speed,       NumberMode::DecimalPrefix, true,  true},
    {"total",        ItemKind::Total,       NumberMode::Plain,         true,  true},
    {"total_group",  ItemKind::Total,       NumberMode::Grouped,       false, false},
    {"total_bin",    ItemKind::Total,       NumberMode::BinaryPrefix,  true,  true},
    {"total_dec",    ItemKind::Total,       NumberMode::DecimalPrefix, true,  true},
    {"custom",       ItemKind::Custom,      NumberMode::Plain,         false, false},
}};

auto find_item(std::string_view name) -> const ItemName* {
    for (const auto& entry : kItemNames) {
        if (entry.name == name) return &entry;
    }
    return nullptr;
}

auto syntax_error(std::size_t offset, std::string_view what) -> infra::Error {
    return infra::make_error(infra::ErrorCode::TemplateSyntax,
                             fmt::format("template offset {}: {}", offset, what));
}

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    auto parse() -> infra::Result<std::vector<ItemSpec>> {
        std::vector<ItemSpec> items;
        while (true) {
            skip_spaces_();
            if (at_end_()) break;

            const char c = text_[pos_];
            infra::Result<ItemSpec> item = c == '"'  ? parse_literal_()
                                         : c == '('  ? parse_group_()
                                         : parse_bare_();
            if (!item) {
                return std::unexpected(std::move(item.error()));
            }
            items.push_back(std::move(*item));
        }
        return items;
    }

private:
    auto at_end_() const -> bool { return pos_ >= text_.size(); }

    void skip_spaces_() {
        while (!at_end_() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    auto read_name_() -> std::string_view {
        const auto start = pos_;
        while (!at_end_()) {
            const auto c = static_cast<unsigned char>(text_[pos_]);
            if (!std::isalnum(c) && c != '_') break;
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    auto read_string_() -> infra::Result<std::string> {
        const auto start = pos_;
        ++pos_; // открывающая кавычка
        std::string value;
        while (!at_end_()) {
            char c = text_[pos_++];
            if (c == '"') return value;
            if (c == '\\') {
                if (at_end_()) break;
                c = text_[pos_++];
                switch (c) {
                    case 'n':  value.push_back('\n'); break;
                    case 't':  value.push_back('\t'); break;
                    case '"':  value.push_back('"'); break;
                    case '\\': value.push_back('\\'); break;
                    default:
                        return std::unexpected(syntax_error(pos_ - 2,
                            fmt::format("unknown escape sequence \\{}", c)));
                }
                continue;
            }
            value.push_back(c);
        }
        return std::unexpected(syntax_error(start, "unterminated string"));
    }

    auto parse_literal_() -> infra::Result<ItemSpec> {
        auto text = read_string_();
        if (!text) return std::unexpected(std::move(text.error()));
        return items::literal(std::move(*text));
    }

    auto lookup_(std::size_t offset, std::string_view name) -> infra::Result<const ItemName*> {
        if (name.empty()) {
            if (offset >= text_.size()) {
                return std::unexpected(syntax_error(offset, "unexpected end of template"));
            }
            return std::unexpected(syntax_error(offset,
                fmt::format("unexpected character '{}'", text_[offset])));
        }
        const auto* entry = find_item(name);
        if (!entry) {
            return std::unexpected(syntax_error(offset, fmt::format("unknown item '{}'", name)));
        }
        if (entry->kind == ItemKind::Custom) {
            return std::unexpected(syntax_error(offset, "custom items cannot be given as text"));
        }
        return entry;
    }

    auto parse_bare_() -> infra::Result<ItemSpec> {
        const auto start = pos_;
        auto entry = lookup_(start, read_name_());
        if (!entry) return std::unexpected(std::move(entry.error()));

        const auto& e = **entry;
        return ItemSpec{
            .kind = e.kind,
            .mode = e.mode,
            .text = default_format(e.kind, e.mode),
            .none = {},
            .custom = {}
        };
    }

    auto parse_group_() -> infra::Result<ItemSpec> {
        const auto open = pos_++;
        skip_spaces_();
        const auto name_pos = pos_;
        auto entry = lookup_(name_pos, read_name_());
        if (!entry) return std::unexpected(std::move(entry.error()));
        const auto& e = **entry;

        std::vector<std::string> args;
        while (true) {
            skip_spaces_();
            if (at_end_()) {
                return std::unexpected(syntax_error(open, "unterminated '('"));
            }
            if (text_[pos_] == ')') {
                ++pos_;
                break;
            }
            if (text_[pos_] != '"') {
                return std::unexpected(syntax_error(pos_, "expected string argument or ')'"));
            }
            auto arg = read_string_();
            if (!arg) return std::unexpected(std::move(arg.error()));
            args.push_back(std::move(*arg));
        }

        const std::size_t max_args = e.takes_none ? 2 : (e.takes_format ? 1 : 0);
        if (args.empty() || args.size() > max_args) {
            return std::unexpected(syntax_error(name_pos,
                fmt::format("'{}' takes {} argument(s) in parentheses, got {}",
                            e.name, max_args, args.size())));
        }

        return ItemSpec{
            .kind = e.kind,
            .mode = e.mode,
            .text = std::move(args[0]),
            .none = args.size() > 1 ? std::move(args[1]) : std::string{},
            .custom = {}
        };
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // namespace

auto parse_template(std::string_view text) -> infra::Result<std::vector<ItemSpec>> {
    auto items = Parser{text}.parse();
    if (items && items->empty()) {
        return default_items();
    }
    return items;
}

} // namespace mlprogress::core
