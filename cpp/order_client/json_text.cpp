#include "json_text.hpp"

namespace order_client {

namespace {

bool is_json_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // namespace

std::string format_json_text(const std::string& text, int indent) {
    std::string out;
    out.reserve(text.size() * 2);

    int depth = 0;
    bool in_string = false;
    bool escaped = false;

    auto new_line = [&out, indent](int level) {
        if (indent <= 0) return;
        out += '\n';
        out.append(static_cast<size_t>(level * indent), ' ');
    };

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (in_string) {
            out += c;
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        if (is_json_space(c)) {
            continue;
        }

        switch (c) {
            case '"':
                in_string = true;
                out += c;
                break;

            case '{':
            case '[': {
                out += c;
                size_t next = i + 1;
                while (next < text.size() && is_json_space(text[next])) ++next;
                if (next < text.size() && (text[next] == '}' || text[next] == ']')) {
                    out += text[next];
                    i = next;
                    break;
                }
                ++depth;
                new_line(depth);
                break;
            }

            case '}':
            case ']':
                if (depth > 0) --depth;
                new_line(depth);
                out += c;
                break;

            case ',':
                out += c;
                new_line(depth);
                break;

            case ':':
                out += c;
                if (indent > 0) out += ' ';
                break;

            default:
                out += c;
                break;
        }
    }

    return out;
}

} // namespace order_client
